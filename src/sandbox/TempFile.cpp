/***
 * Name: pyjudge::sandbox::TempFile (impl)
 * Purpose: mkstemps-backed scratch file with unlink-on-destroy.
 */
#include "sandbox/TempFile.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "pyjudge/exceptions/sandbox_resource_error.h"

namespace pyjudge::sandbox {

namespace {
constexpr int kSuffixLength = 3; // ".py"

bool writeAll(int fd, const std::string& contents, std::string& err) {
  std::size_t written = 0;
  while (written < contents.size()) {
    const ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
    if (n < 0) {
      if (errno == EINTR) { continue; }
      err = std::strerror(errno);
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}
} // namespace

TempFile TempFile::create(const std::string& dir, const std::string& contents) {
  std::string pattern = dir.empty() ? DefaultTempDir() : dir;
  if (pattern.back() != '/') { pattern += '/'; }
  pattern += "pyjudge-XXXXXX.py";
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  const int fd = ::mkstemps(buf.data(), kSuffixLength);
  if (fd < 0) {
    throw exceptions::SandboxResourceError("cannot create temporary file '" + pattern + "': " + std::strerror(errno));
  }
  TempFile file(std::string(buf.data()));
  std::string err;
  const bool ok = writeAll(fd, contents, err);
  if (::close(fd) != 0 && ok) {
    err = std::strerror(errno);
    throw exceptions::SandboxResourceError("cannot write temporary file '" + file.path() + "': " + err);
  }
  if (!ok) {
    throw exceptions::SandboxResourceError("cannot write temporary file '" + file.path() + "': " + err);
  }
  return file;
}

TempFile::TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TempFile::~TempFile() {
  if (!path_.empty()) {
    (void)::unlink(path_.c_str()); // best effort
  }
}

std::string DefaultTempDir() {
  const char* env = std::getenv("TMPDIR");
  if (env != nullptr && *env != '\0') { return env; }
  return "/tmp";
}

} // namespace pyjudge::sandbox
