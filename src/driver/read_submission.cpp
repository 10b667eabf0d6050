/***
 * Name: pyjudge::driver::ReadSubmission
 * Purpose: Load the candidate source from a file or standard input.
 * Inputs: path ("-" for stdin), source (out), err (out)
 * Outputs: true on success
 */
#include "driver/app.h"
#include "pyjudge/support/fs.h"

#include <iostream>
#include <iterator>
#include <string>

namespace pyjudge::driver {

auto ReadSubmission(const std::string& path, std::string& source, std::string& err) -> bool {
  if (path != "-") { return support::ReadFile(path, source, err); }
  source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  if (std::cin.bad()) {
    err = "failed to read standard input";
    return false;
  }
  return true;
}

}  // namespace pyjudge::driver
