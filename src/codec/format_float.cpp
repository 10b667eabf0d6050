/***
 * Name: pyjudge::codec::detail::formatFloat
 * Purpose: Render a double like Python's float.__repr__.
 * Theory of Operation:
 *   Find the fewest significant digits that parse back to the same double,
 *   then lay them out in fixed notation for decimal exponents in [-4, 16)
 *   and in scientific notation (two-digit minimum exponent) otherwise.
 *   Fixed notation always carries a fractional part ("1.0").
 */
#include "codec/ReprInternals.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace pyjudge::codec::detail {

std::string formatFloat(double number) {
  if (std::isnan(number)) { return "nan"; }
  if (std::isinf(number)) { return number < 0 ? "-inf" : "inf"; }

  constexpr int kMaxDigits = 17;
  char buf[64];
  for (int digits = 1; digits <= kMaxDigits; ++digits) {
    std::snprintf(buf, sizeof(buf), "%.*e", digits - 1, number);
    if (std::strtod(buf, nullptr) == number) { break; }
  }
  // buf holds "[-]d[.ddd]e[+-]XX"
  std::string text(buf);
  std::string sign;
  if (!text.empty() && text[0] == '-') {
    sign = "-";
    text.erase(0, 1);
  }
  const auto ePos = text.find('e');
  const int exponent = std::atoi(text.c_str() + ePos + 1);
  std::string digits;
  for (size_t i = 0; i < ePos; ++i) {
    if (text[i] != '.') { digits.push_back(text[i]); }
  }
  while (digits.size() > 1 && digits.back() == '0') { digits.pop_back(); }

  std::string out = sign;
  if (exponent >= -4 && exponent < 16) {
    if (exponent < 0) {
      out += "0.";
      out.append(static_cast<size_t>(-exponent - 1), '0');
      out += digits;
    } else {
      const auto intLen = static_cast<size_t>(exponent) + 1;
      if (digits.size() <= intLen) {
        out += digits;
        out.append(intLen - digits.size(), '0');
        out += ".0";
      } else {
        out += digits.substr(0, intLen);
        out += ".";
        out += digits.substr(intLen);
      }
    }
    return out;
  }
  out += digits.substr(0, 1);
  if (digits.size() > 1) {
    out += ".";
    out += digits.substr(1);
  }
  out += exponent < 0 ? "e-" : "e+";
  const int magnitude = exponent < 0 ? -exponent : exponent;
  if (magnitude < 10) { out += "0"; }
  out += std::to_string(magnitude);
  return out;
}

} // namespace pyjudge::codec::detail
