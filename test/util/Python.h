// Utility: interpreter availability and scratch directories for sandbox tests
#pragma once

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace testutil {

// True when python3 can be started from PATH; checked once per process.
inline bool HavePython() {
  static const bool have = std::system("python3 -c pass >/dev/null 2>&1") == 0;
  return have;
}

// Fresh, empty directory under the system temp dir, removed on destruction.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& tag) {
    namespace fs = std::filesystem;
    std::error_code ec;
    path_ = fs::temp_directory_path(ec) / ("pyjudge-test-" + tag + "-" + std::to_string(::getpid()));
    fs::remove_all(path_, ec);
    fs::create_directories(path_, ec);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  std::string str() const { return path_.string(); }

  // Number of entries currently in the directory.
  std::size_t entries() const {
    std::error_code ec;
    std::size_t count = 0;
    for (auto it = std::filesystem::directory_iterator(path_, ec); !ec && it != std::filesystem::directory_iterator();
         it.increment(ec)) {
      ++count;
    }
    return count;
  }

 private:
  std::filesystem::path path_;
};

} // namespace testutil

#define PYJUDGE_REQUIRE_PYTHON()                                   \
  do {                                                             \
    if (!testutil::HavePython()) { GTEST_SKIP() << "python3 not available"; } \
  } while (0)
