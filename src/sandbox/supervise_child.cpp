/***
 * Name: pyjudge::sandbox::detail::SuperviseChild
 * Purpose: Collect output from a running child and enforce its deadline.
 * Inputs: child (pid and pipe read ends), deadline, maxOutputBytes
 * Outputs: result.stdoutText/stderrText/timedOut/exitCode/termSignal/truncated
 * Theory of Operation:
 *   poll() both pipes in short slices. Exit is detected with
 *   waitid(WNOWAIT) so the leader stays a zombie and its process group id
 *   cannot be reused while the group is killed. On exit the group is
 *   SIGKILLed to remove leftovers; on deadline expiry it is SIGKILLed and the
 *   run is marked timed out. Pipes are drained for a short grace period
 *   afterwards, then the leader is reaped.
 */
#include "sandbox/detail/exec.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <utility>

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pyjudge::sandbox::detail {

namespace {
using Clock = std::chrono::steady_clock;
constexpr int kPollSliceMs = 50;
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
constexpr std::size_t kReadChunk = 4096;

void pump(std::array<pollfd, 2>& fds, std::array<CaptureBuffer*, 2> sinks, int timeoutMs) {
  const int ready = ::poll(fds.data(), fds.size(), timeoutMs);
  if (ready <= 0) { return; }
  for (std::size_t i = 0; i < fds.size(); ++i) {
    if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) { continue; }
    std::array<char, kReadChunk> buf{};
    const ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
    if (n > 0) {
      sinks[i]->append(buf.data(), static_cast<std::size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
      ::close(fds[i].fd);
      fds[i].fd = -1;
    }
  }
}

bool anyOpen(const std::array<pollfd, 2>& fds) {
  return std::any_of(fds.begin(), fds.end(), [](const pollfd& p) { return p.fd >= 0; });
}

bool leaderExited(pid_t pid) {
  siginfo_t info{};
  if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
    return errno != EINTR;
  }
  return info.si_pid == pid;
}
} // namespace

void SuperviseChild(ChildProcess& child, Clock::time_point deadline, std::size_t maxOutputBytes,
                    RunResult& result) {
  CaptureBuffer out(maxOutputBytes);
  CaptureBuffer err(maxOutputBytes);
  std::array<pollfd, 2> fds{{{child.stdoutFd, POLLIN, 0}, {child.stderrFd, POLLIN, 0}}};
  child.stdoutFd = -1;
  child.stderrFd = -1;

  bool finished = false;
  Clock::time_point drainUntil{};
  for (;;) {
    const auto now = Clock::now();
    if (!finished && now >= deadline) {
      result.timedOut = true;
      ::kill(-child.pid, SIGKILL);
      finished = true;
      drainUntil = now + kDrainGrace;
    }
    if (finished && (!anyOpen(fds) || now >= drainUntil)) { break; }

    int sliceMs = kPollSliceMs;
    if (!finished) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count() + 1;
      sliceMs = static_cast<int>(std::min<long long>(sliceMs, left));
    }
    if (anyOpen(fds)) {
      pump(fds, {&out, &err}, sliceMs);
    } else {
      ::usleep(static_cast<useconds_t>(sliceMs) * 1000U);
    }

    if (!finished && leaderExited(child.pid)) {
      ::kill(-child.pid, SIGKILL); // leftovers the program started
      finished = true;
      drainUntil = Clock::now() + kDrainGrace;
    }
  }
  for (auto& p : fds) {
    if (p.fd >= 0) { ::close(p.fd); }
  }

  int status = 0;
  pid_t reaped = -1;
  do {
    reaped = ::waitpid(child.pid, &status, 0);
  } while (reaped < 0 && errno == EINTR);
  if (reaped == child.pid) {
    if (WIFEXITED(status)) {
      result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      result.termSignal = WTERMSIG(status);
    }
  }
  child.pid = -1;

  result.stdoutText = std::move(out.text);
  result.stderrText = std::move(err.text);
  result.truncated = out.truncated || err.truncated;
}

} // namespace pyjudge::sandbox::detail
