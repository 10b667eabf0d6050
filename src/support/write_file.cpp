/***
 * Name: pyjudge::support::WriteFile
 * Purpose: Replace a report file without leaving a half-written one behind.
 * Inputs:
 *   - path: destination
 *   - data: full contents
 * Outputs:
 *   - err: "cannot write '<path>': <reason>" on failure
 * Theory of Operation: Stream into a sibling "<path>.tmp", then rename(2) it
 *   into place. The temporary is removed when any step fails.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyjudge/support/fs.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <ios>
#include <string>

namespace pyjudge {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  const std::string staging = path + ".tmp";
  {
    errno = 0;
    std::ofstream outFile(staging, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
      err = "cannot write '" + path + "': " + (errno != 0 ? std::strerror(errno) : "open failed");
      return false;
    }
    outFile.write(data.data(), static_cast<std::streamsize>(data.size()));
    outFile.close();
    if (outFile.fail()) {
      err = "cannot write '" + path + "': I/O error";
      (void)std::remove(staging.c_str());
      return false;
    }
  }
  if (std::rename(staging.c_str(), path.c_str()) != 0) {
    err = "cannot write '" + path + "': " + std::strerror(errno);
    (void)std::remove(staging.c_str());
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pyjudge
