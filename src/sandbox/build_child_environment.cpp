/***
 * Name: pyjudge::sandbox::detail::BuildChildEnvironment
 * Purpose: Environment for the interpreter child.
 * Inputs: env (null-terminated KEY=VALUE array, usually environ)
 * Outputs: KEY=VALUE strings
 * Theory of Operation: Drops inherited PYTHONPATH, PYTHONSTARTUP and the
 *   bytecode/encoding variables, then appends PYTHONPATH= (empty),
 *   PYTHONDONTWRITEBYTECODE=1 and PYTHONIOENCODING=utf-8.
 */
#include "sandbox/detail/exec.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace pyjudge::sandbox::detail {

namespace {
constexpr std::array<std::string_view, 4> kOverridden{
    "PYTHONPATH", "PYTHONSTARTUP", "PYTHONDONTWRITEBYTECODE", "PYTHONIOENCODING"};

bool isOverridden(std::string_view entry) {
  const auto eq = entry.find('=');
  const std::string_view key = entry.substr(0, eq);
  for (const auto name : kOverridden) {
    if (key == name) { return true; }
  }
  return false;
}
} // namespace

std::vector<std::string> BuildChildEnvironment(const char* const* env) {
  std::vector<std::string> out;
  if (env != nullptr) {
    for (const char* const* it = env; *it != nullptr; ++it) {
      if (!isOverridden(*it)) { out.emplace_back(*it); }
    }
  }
  out.emplace_back("PYTHONPATH=");
  out.emplace_back("PYTHONDONTWRITEBYTECODE=1");
  out.emplace_back("PYTHONIOENCODING=utf-8");
  return out;
}

} // namespace pyjudge::sandbox::detail
