/***
 * Name: pyjudge::sandbox::detail::ToExecVector
 * Purpose: View a vector<string> as the null-terminated char* array execve
 *   wants for argv and envp. The strings must outlive the result.
 */
#include "sandbox/detail/exec.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace pyjudge::sandbox::detail {

auto ToExecVector(std::vector<std::string>& items) -> std::vector<char*> {
  std::vector<char*> out;
  out.reserve(items.size() + 1U);
  std::transform(items.begin(), items.end(), std::back_inserter(out),
                 [](std::string& item) { return item.data(); });
  out.push_back(nullptr);
  return out;
}

} // namespace pyjudge::sandbox::detail
