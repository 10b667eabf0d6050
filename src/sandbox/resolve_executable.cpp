/***
 * Name: pyjudge::sandbox::detail::ResolveExecutable
 * Purpose: Turn an interpreter name into an absolute path before fork().
 * Inputs: name, path (out), err (out)
 * Outputs: true when an executable file was found
 * Theory of Operation: Mirrors execvp's PATH search (empty entries mean the
 *   current directory); done in the parent so the child can use execve.
 */
#include "sandbox/detail/exec.h"

#include <cstdlib>
#include <string>

#include <unistd.h>

namespace pyjudge::sandbox::detail {

bool ResolveExecutable(const std::string& name, std::string& path, std::string& err) {
  if (name.empty()) {
    err = "no interpreter configured";
    return false;
  }
  if (name.find('/') != std::string::npos) {
    if (::access(name.c_str(), X_OK) != 0) {
      err = "interpreter not executable: " + name;
      return false;
    }
    path = name;
    return true;
  }
  const char* env = std::getenv("PATH");
  const std::string search = (env != nullptr) ? env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t begin = 0;
  while (begin <= search.size()) {
    std::size_t end = search.find(':', begin);
    if (end == std::string::npos) { end = search.size(); }
    std::string dir = search.substr(begin, end - begin);
    if (dir.empty()) { dir = "."; }
    const std::string candidate = dir + "/" + name;
    if (::access(candidate.c_str(), X_OK) == 0) {
      path = candidate;
      return true;
    }
    begin = end + 1;
  }
  err = "interpreter not found on PATH: " + name;
  return false;
}

} // namespace pyjudge::sandbox::detail
