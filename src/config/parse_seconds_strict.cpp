/***
 * Name: pyjudge::config::ParseSecondsStrict
 * Purpose: Parse a timeout such as "5" or "0.25" without throwing.
 * Theory of Operation: Trim, reject signs and exponents, then strtod over a
 *   NUL-terminated copy and require every character to be consumed.
 */
#include "config/EngineConfig.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <string_view>

#include "pyjudge/support/parse_util.h"

namespace pyjudge::config {

bool ParseSecondsStrict(std::string_view text, double& out, std::string& err) {
  support::TrimSpaces(text);
  if (text.empty()) {
    err = "empty value";
    return false;
  }
  bool sawDigit = false;
  for (const char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      sawDigit = true;
    } else if (ch != '.') {
      err = "invalid number '" + std::string(text) + "'";
      return false;
    }
  }
  if (!sawDigit) {
    err = "invalid number '" + std::string(text) + "'";
    return false;
  }
  const std::string copy(text);
  char* end = nullptr;
  const double value = std::strtod(copy.c_str(), &end);
  if (end != copy.c_str() + copy.size() || !std::isfinite(value)) {
    err = "invalid number '" + copy + "'";
    return false;
  }
  if (value <= 0.0) {
    err = "value must be greater than zero";
    return false;
  }
  if (value > kMaxTimeoutSeconds) {
    err = "value must be at most 86400 seconds";
    return false;
  }
  out = value;
  return true;
}

} // namespace pyjudge::config
