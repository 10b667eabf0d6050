/***
 * Name: pyjudge::sandbox::detail::SpawnChild
 * Purpose: Start the interpreter in its own process group with piped output.
 * Inputs: argv (argv[0] is an absolute path), envp, memoryLimitBytes,
 *   child (out), err (out)
 * Outputs: true when exec succeeded; false with err when it did not
 * Theory of Operation: POSIX fork/execve. All pipes are close-on-exec; the
 *   status pipe stays silent when execve succeeds and carries errno when it
 *   fails, so the parent learns the outcome with one blocking read. Between
 *   fork and exec the child only calls async-signal-safe functions.
 */
#include "sandbox/detail/exec.h"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "pyjudge/exceptions/sandbox_resource_error.h"

namespace pyjudge::sandbox::detail {

namespace {
constexpr int kExecFailure = 127;

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

[[noreturn]] void runChild(std::vector<char*>& argv, std::vector<char*>& envp, std::uint64_t memoryLimitBytes,
                           int devNull, int outFd, int errFd, int statusFd) {
  ::setpgid(0, 0);
  ::dup2(devNull, STDIN_FILENO);
  ::dup2(outFd, STDOUT_FILENO);
  ::dup2(errFd, STDERR_FILENO);
  const struct rlimit noCore{0, 0};
  ::setrlimit(RLIMIT_CORE, &noCore);
  if (memoryLimitBytes != 0) {
    const struct rlimit addressSpace{static_cast<rlim_t>(memoryLimitBytes), static_cast<rlim_t>(memoryLimitBytes)};
    ::setrlimit(RLIMIT_AS, &addressSpace);
  }
  ::execve(argv[0], argv.data(), envp.data());
  const int code = errno;
  [[maybe_unused]] const ssize_t ignored = ::write(statusFd, &code, sizeof(code));
  _exit(kExecFailure);
}
} // namespace

bool SpawnChild(std::vector<char*>& argv, std::vector<char*>& envp, std::uint64_t memoryLimitBytes,  // NOLINT(readability-function-size)
                ChildProcess& child, std::string& err) {
  std::array<int, 2> outPipe{-1, -1};
  std::array<int, 2> errPipe{-1, -1};
  std::array<int, 2> statusPipe{-1, -1};
  int devNull = -1;
  auto closeAll = [&]() {
    for (auto* pipe : {&outPipe, &errPipe, &statusPipe}) {
      closeFd((*pipe)[0]);
      closeFd((*pipe)[1]);
    }
    closeFd(devNull);
  };

  if (::pipe2(outPipe.data(), O_CLOEXEC) != 0 || ::pipe2(errPipe.data(), O_CLOEXEC) != 0 ||
      ::pipe2(statusPipe.data(), O_CLOEXEC) != 0) {
    const int saved = errno;
    closeAll();
    throw exceptions::SandboxResourceError(std::string("cannot create pipe: ") + std::strerror(saved));
  }
  devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devNull < 0) {
    const int saved = errno;
    closeAll();
    throw exceptions::SandboxResourceError(std::string("cannot open /dev/null: ") + std::strerror(saved));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int saved = errno;
    closeAll();
    throw exceptions::SandboxResourceError(std::string("failed to fork() for interpreter: ") + std::strerror(saved));
  }
  if (pid == 0) {
    runChild(argv, envp, memoryLimitBytes, devNull, outPipe[1], errPipe[1], statusPipe[1]);
  }

  ::setpgid(pid, pid); // also done by the child; whichever runs first wins
  closeFd(devNull);
  closeFd(outPipe[1]);
  closeFd(errPipe[1]);
  closeFd(statusPipe[1]);

  int execErrno = 0;
  ssize_t got = 0;
  do {
    got = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
  } while (got < 0 && errno == EINTR);
  closeFd(statusPipe[0]);

  if (got == static_cast<ssize_t>(sizeof(execErrno))) {
    closeAll();
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    err = std::string("failed to execute '") + argv[0] + "': " + std::strerror(execErrno);
    return false;
  }

  child.pid = pid;
  child.stdoutFd = outPipe[0];
  child.stderrFd = errPipe[0];
  return true;
}

} // namespace pyjudge::sandbox::detail
