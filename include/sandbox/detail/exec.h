/***
 * Name: pyjudge::sandbox::detail (exec helpers)
 * Purpose: Internal helpers to build argv/envp, spawn the interpreter and
 *   supervise it until exit or deadline.
 * Inputs: argv/envp vectors, resource limits, deadline, capture cap
 * Outputs: ChildProcess handles; RunResult fields; error text
 * Theory of Operation: Keep ProcessRunner::run small; each helper is one file.
 *   Everything the child needs is prepared before fork() so the child only
 *   calls async-signal-safe functions.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

#include "sandbox/RunResult.h"

namespace pyjudge::sandbox::detail {

struct ChildProcess {
  pid_t pid{-1};
  int stdoutFd{-1};
  int stderrFd{-1};
};

// Keeps the most recent `limit` bytes so a trailing result record survives.
struct CaptureBuffer {
  explicit CaptureBuffer(std::size_t limit) : limit(limit) {}
  void append(const char* data, std::size_t size);

  std::string text{};
  std::size_t limit;
  bool truncated{false};
};

/*** ToExecVector: Null-terminated char* view of items for execve (argv, envp). */
std::vector<char*> ToExecVector(std::vector<std::string>& items);

/*** BuildChildEnvironment: Copy of env with PYTHONPATH cleared and interpreter hygiene variables set. */
std::vector<std::string> BuildChildEnvironment(const char* const* env);

/*** ResolveExecutable: Locate name on PATH (names with '/' are taken as is); false and err when missing. */
bool ResolveExecutable(const std::string& name, std::string& path, std::string& err);

/***
 * SpawnChild: fork/execve argv[0] with envp. Returns true and fills child on
 * success; false with err when exec failed in the child (reaped already).
 * Throws exceptions::SandboxResourceError when pipes or fork fail.
 */
bool SpawnChild(std::vector<char*>& argv, std::vector<char*>& envp, std::uint64_t memoryLimitBytes,
                ChildProcess& child, std::string& err);

/*** SuperviseChild: Drain pipes until exit or deadline, kill the group on expiry, reap, fill result. */
void SuperviseChild(ChildProcess& child, std::chrono::steady_clock::time_point deadline,
                    std::size_t maxOutputBytes, RunResult& result);

} // namespace pyjudge::sandbox::detail
