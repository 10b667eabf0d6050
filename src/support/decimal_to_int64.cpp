/***
 * Name: pyjudge::support::DecimalToInt64
 * Purpose: Narrow a canonical magnitude to int64; the negative side reaches
 *   one further (INT64_MIN).
 */
#include "pyjudge/support/decimal.h"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>
#include <system_error>

namespace pyjudge::support {

auto DecimalToInt64(std::string_view digits, bool negative, std::int64_t& out) -> bool {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t magnitude = 0;
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
  if (ec != std::errc() || end != digits.data() + digits.size()) { return false; }
  if (!negative) {
    if (magnitude > kMax) { return false; }
    out = static_cast<std::int64_t>(magnitude);
    return true;
  }
  if (magnitude > kMax + 1U) { return false; }
  out = magnitude == kMax + 1U ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(magnitude);
  return true;
}

}  // namespace pyjudge::support
