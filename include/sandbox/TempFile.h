/***
 * Name: pyjudge::sandbox::TempFile
 * Purpose: Own one uniquely named program file for the lifetime of a run.
 * Inputs:
 *   - dir: directory to create the file in
 *   - contents: bytes to write
 * Outputs:
 *   - path() of the created file
 * Theory of Operation:
 *   mkstemps() with the template <dir>/pyjudge-XXXXXX.py guarantees a name no
 *   concurrent run can collide with. Creation or write failure throws
 *   exceptions::SandboxResourceError. The destructor unlinks the file and
 *   ignores unlink errors.
 */
#pragma once

#include <string>
#include <utility>

namespace pyjudge::sandbox {

class TempFile {
 public:
  static TempFile create(const std::string& dir, const std::string& contents);

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&&) = delete;
  ~TempFile();

  const std::string& path() const { return path_; }

 private:
  explicit TempFile(std::string path) : path_(std::move(path)) {}
  std::string path_;
};

/*** DefaultTempDir: $TMPDIR when set and non-empty, else /tmp. */
std::string DefaultTempDir();

} // namespace pyjudge::sandbox
