/***
 * Name: pyjudge::analysis
 * Purpose: Static checks run on a submission before and after validation.
 * Inputs:
 *   - source text (and a display name for diagnostics)
 * Outputs:
 *   - SyntaxReport: parse diagnostics from the shared front end
 *   - StyleReport: PEP8-lite score in [0, 1] with feedback lines
 *   - PerformanceScore: naive score from the duration of a bare run
 * Theory of Operation:
 *   CheckSyntax lexes and parses the whole module; the first ParseError is
 *   reported as "Syntax Error on line N: msg". CheckStyle looks at physical
 *   lines only: each line over 79 characters costs 0.1 (at most 0.3),
 *   trailing whitespace anywhere costs 0.05.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>
#include "analysis/Diagnostic.h"

namespace pyjudge::analysis {

inline constexpr std::size_t kMaxLineLength = 79;

struct SyntaxReport {
  bool ok{true};
  std::vector<Diagnostic> diagnostics{};

  // "Syntax Error on line N: msg" per diagnostic.
  std::vector<std::string> feedback() const;
};

struct StyleReport {
  double score{1.0};
  std::vector<std::string> feedback{};
};

SyntaxReport CheckSyntax(const std::string& source, const std::string& name);

StyleReport CheckStyle(const std::string& source);

/*** PerformanceScore: max(0, 1 - min(seconds / 2, 1)). */
double PerformanceScore(std::chrono::duration<double> elapsed);

} // namespace pyjudge::analysis
