/***
 * Name: pyjudge::protocol::LastNonEmptyLine
 * Purpose: Locate the result record candidate in captured stdout.
 */
#include "protocol/Protocol.h"

#include <string>
#include <string_view>

#include "pyjudge/support/parse_util.h"

namespace pyjudge::protocol {

std::string LastNonEmptyLine(const std::string& text) {
  std::string_view rest(text);
  while (!rest.empty()) {
    const auto nl = rest.find_last_of('\n');
    std::string_view trimmed = (nl == std::string_view::npos) ? rest : rest.substr(nl + 1);
    support::TrimSpaces(trimmed);
    if (!trimmed.empty()) { return std::string(trimmed); }
    if (nl == std::string_view::npos) { break; }
    rest = rest.substr(0, nl);
  }
  return {};
}

} // namespace pyjudge::protocol
