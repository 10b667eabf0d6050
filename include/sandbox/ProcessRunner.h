/***
 * Name: pyjudge::sandbox::ProcessRunner
 * Purpose: Execute one generated program in a fresh interpreter process.
 * Inputs:
 *   - programText: complete Python program
 *   - timeoutSeconds: wall-clock limit for the child
 * Outputs:
 *   - RunResult (captured streams, timeout flag, spawn error, exit status)
 * Theory of Operation:
 *   1) Take a permit from the injected ConcurrencyBudget (blocks).
 *   2) Write the program to a TempFile.
 *   3) fork/exec the interpreter in its own process group: stdin from
 *      /dev/null, stdout/stderr on pipes, PYTHONPATH cleared, optional
 *      RLIMIT_AS, no core dumps. exec failures come back through a
 *      close-on-exec status pipe and are reported as spawnError.
 *   4) Poll the pipes until the child exits or the deadline passes; on
 *      expiry SIGKILL the whole group and keep the partial output.
 *   The permit and the temp file are scoped objects, released on every path.
 *   Host failures (temp file, pipes, fork) throw SandboxResourceError.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "sandbox/ConcurrencyBudget.h"
#include "sandbox/RunResult.h"

namespace pyjudge::sandbox {

struct RunnerOptions {
  std::string interpreter{"python3"};
  std::string tempDir{};           // empty: DefaultTempDir()
  std::size_t maxOutputBytes{1U << 20U};
  std::uint64_t memoryLimitMb{0};  // 0: no address-space cap
};

class ProcessRunner {
 public:
  ProcessRunner(ConcurrencyBudget& budget, RunnerOptions options);

  RunResult run(const std::string& programText, double timeoutSeconds) const;

  const RunnerOptions& options() const { return options_; }

 private:
  ConcurrencyBudget& budget_;
  RunnerOptions options_;
};

} // namespace pyjudge::sandbox
