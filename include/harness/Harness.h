/***
 * Name: pyjudge::harness
 * Purpose: Generate the self-contained driver program run for one test case.
 * Inputs:
 *   - source: candidate source, embedded verbatim
 *   - testCase: target expression and literal arguments
 * Outputs:
 *   - Program text whose last non-empty stdout line is the result record
 * Theory of Operation:
 *   The target text is parsed and validated (ParseTarget) and re-rendered
 *   into a registry of zero-argument thunks; nothing submitted is ever fed to
 *   eval. Arguments are embedded with codec::EncodeLiteral. Target
 *   resolution, invocation, repr() and JSON serialization are each guarded
 *   and report a {"success": false, "error": ...} record. The driver writes
 *   through interpreter-private aliases of json and sys imported after the
 *   candidate source, and prefixes the record with a newline so unfinished
 *   candidate output cannot share its line.
 */
#pragma once

#include <string>
#include "harness/TestCase.h"

namespace pyjudge::harness {

inline constexpr const char* kSourceBeginMarker = "# ===== CANDIDATE SOURCE BEGIN =====";
inline constexpr const char* kSourceEndMarker = "# ===== CANDIDATE SOURCE END =====";

struct Target {
  std::string key;      // the target text as supplied
  std::string rendered; // canonical Python expression for the thunk body
};

/*** ParseTarget: Validate a call chain (name, .attr, calls with literal args). Throws exceptions::TargetError. */
Target ParseTarget(const std::string& text);

/*** Synthesize: Driver program for one test case. Throws exceptions::TargetError for an invalid target. */
std::string Synthesize(const std::string& source, const TestCase& testCase);

} // namespace pyjudge::harness
