/***
 * Name: pyjudge::sandbox::RunResult
 * Purpose: Everything observed about one interpreter process.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace pyjudge::sandbox {

struct RunResult {
  std::string stdoutText;
  std::string stderrText;
  bool timedOut{false};
  std::optional<std::string> spawnError; // interpreter could not be started
  int exitCode{-1};                       // -1 unless the child exited normally
  int termSignal{0};                      // signal that terminated the child, if any
  bool truncated{false};                  // a stream exceeded the capture cap
  std::chrono::milliseconds elapsed{0};
};

} // namespace pyjudge::sandbox
