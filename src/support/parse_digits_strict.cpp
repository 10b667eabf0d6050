/***
 * Name: pyjudge::support::ParseDigitsStrict
 * Purpose: Parse a view made only of base-10 digits into a count no larger
 *   than INT64_MAX, so the result also fits signed arithmetic downstream.
 */
#include "pyjudge/support/parse_util.h"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace pyjudge::support {

auto ParseDigitsStrict(std::string_view text, std::uint64_t& value, std::string* err) -> bool {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  const char* why = nullptr;
  std::uint64_t parsed = 0;
  if (text.empty()) {
    why = "missing digits";
  } else if (text.find_first_not_of("0123456789") != std::string_view::npos) {
    why = "invalid character in number";
  } else {
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec == std::errc::result_out_of_range || parsed > kMax) { why = "number out of range"; }
  }
  if (why != nullptr) {
    if (err != nullptr) { *err = why; }
    return false;
  }
  value = parsed;
  return true;
}

}  // namespace pyjudge::support
