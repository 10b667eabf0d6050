/***
 * Name: pyjudge::support::ReadFile
 * Purpose: Load a submission or catalog as raw bytes.
 * Inputs:
 *   - path: file to read
 * Outputs:
 *   - out: contents on success
 *   - err: "cannot read '<path>': <reason>" on failure
 * Theory of Operation: Directories are refused up front; ifstream would open
 *   them and then fail on the first read with no useful errno.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyjudge/support/fs.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <system_error>

namespace pyjudge {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "cannot read '" + path + "': is a directory";
    return false;
  }
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    err = "cannot read '" + path + "': " + (errno != 0 ? std::strerror(errno) : "open failed");
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    err = "cannot read '" + path + "': I/O error";
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pyjudge
