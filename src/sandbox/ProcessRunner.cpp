/***
 * Name: pyjudge::sandbox::ProcessRunner (impl)
 * Purpose: Permit, temp file, spawn, supervise.
 */
#include "sandbox/ProcessRunner.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/TempFile.h"
#include "sandbox/detail/exec.h"

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace pyjudge::sandbox {

namespace {
constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;
}

ProcessRunner::ProcessRunner(ConcurrencyBudget& budget, RunnerOptions options)
    : budget_(budget), options_(std::move(options)) {}

RunResult ProcessRunner::run(const std::string& programText, double timeoutSeconds) const {
  using Clock = std::chrono::steady_clock;
  RunResult result;
  const ConcurrencyBudget::Permit permit = budget_.acquire();
  const TempFile program = TempFile::create(options_.tempDir, programText);

  std::string interpreterPath;
  std::string err;
  if (!detail::ResolveExecutable(options_.interpreter, interpreterPath, err)) {
    result.spawnError = err;
    return result;
  }
  std::vector<std::string> args{interpreterPath, program.path()};
  std::vector<char*> argv = detail::ToExecVector(args);
  std::vector<std::string> env = detail::BuildChildEnvironment(environ);
  std::vector<char*> envp = detail::ToExecVector(env);

  const auto started = Clock::now();
  detail::ChildProcess child;
  if (!detail::SpawnChild(argv, envp, options_.memoryLimitMb * kBytesPerMb, child, err)) {
    result.spawnError = err;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
    return result;
  }
  const auto limit = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(timeoutSeconds));
  detail::SuperviseChild(child, started + limit, options_.maxOutputBytes, result);
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
  return result;
}

} // namespace pyjudge::sandbox
