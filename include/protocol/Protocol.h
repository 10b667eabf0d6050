/***
 * Name: pyjudge::protocol::ParseOutcome
 * Purpose: Turn the captured streams of one run into an ExecutionOutcome.
 * Inputs:
 *   - stdoutText/stderrText: captured streams
 *   - timedOut, spawnError: runner flags
 *   - limitSeconds: the timeout that applied (reported by Timeout)
 * Outputs:
 *   - ExecutionOutcome; never throws for any input
 * Theory of Operation:
 *   timedOut wins, then spawnError. Otherwise the last non-empty stdout line
 *   must be a JSON object with a boolean "success":
 *     {"success": true,  "result": "<repr>"}  -> Success
 *     {"success": false, "error":  "<msg>"}   -> Failure
 *   Anything else falls back to Failure(trimmed stderr) or "no output".
 */
#pragma once

#include <optional>
#include <string>
#include "protocol/ExecutionOutcome.h"
#include "sandbox/RunResult.h"

namespace pyjudge::protocol {

ExecutionOutcome ParseOutcome(const std::string& stdoutText, const std::string& stderrText, bool timedOut,
                              const std::optional<std::string>& spawnError, double limitSeconds);

inline ExecutionOutcome ParseOutcome(const sandbox::RunResult& run, double limitSeconds) {
  return ParseOutcome(run.stdoutText, run.stderrText, run.timedOut, run.spawnError, limitSeconds);
}

/*** LastNonEmptyLine: Last line with non-whitespace content, trimmed; empty when none. */
std::string LastNonEmptyLine(const std::string& text);

} // namespace pyjudge::protocol
