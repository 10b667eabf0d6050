/***
 * Name: pyjudge::support::ParseCountStrict
 * Purpose: Parse a count such as a concurrency cap or byte limit.
 * Inputs:
 *   - text: env var value or flag argument
 * Outputs:
 *   - out_val: parsed value on success
 *   - err: optional error message on failure
 * Theory of Operation: Trim, reject any sign ("-1" gets its own message),
 *   then strict digit parsing.
 */
#include "pyjudge/support/parse.h"
#include "pyjudge/support/parse_util.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace pyjudge::support {

auto ParseCountStrict(std::string_view text, std::uint64_t& out_val, std::string* err) -> bool {
  TrimSpaces(text);
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    if (err != nullptr) {
      *err = text.front() == '-' ? "value must not be negative" : "unexpected sign";
    }
    return false;
  }
  std::uint64_t value = 0;
  if (!ParseDigitsStrict(text, value, err)) {
    return false;
  }
  out_val = value;
  return true;
}

}  // namespace pyjudge::support
