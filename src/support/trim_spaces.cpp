/***
 * Name: pyjudge::support::TrimSpaces
 * Purpose: Narrow a view to its text between leading and trailing ASCII
 *   whitespace (space, \t, \n, \v, \f, \r).
 */
#include "pyjudge/support/parse_util.h"

#include <string_view>

namespace pyjudge::support {

void TrimSpaces(std::string_view& text) {
  constexpr std::string_view kSpaces{" \t\n\v\f\r"};
  const auto first = text.find_first_not_of(kSpaces);
  if (first == std::string_view::npos) {
    text = text.substr(text.size());
    return;
  }
  text = text.substr(first, text.find_last_not_of(kSpaces) - first + 1);
}

}  // namespace pyjudge::support
