/***
 * Name: pyjudge::support::NextCodePoint
 * Purpose: Decode one UTF-8 sequence starting at pos.
 * Theory of Operation: Malformed or truncated sequences yield the lead byte
 *   value and advance by one so callers can escape it instead of failing.
 */
#include "pyjudge/support/utf8.h"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pyjudge {
namespace support {

std::uint32_t NextCodePoint(std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t extra = 0;
  std::uint32_t codePoint = 0;
  if (lead < 0x80U) {
    ++pos;
    return lead;
  }
  if ((lead & 0xE0U) == 0xC0U) { extra = 1; codePoint = lead & 0x1FU; }
  else if ((lead & 0xF0U) == 0xE0U) { extra = 2; codePoint = lead & 0x0FU; }
  else if ((lead & 0xF8U) == 0xF0U) { extra = 3; codePoint = lead & 0x07U; }
  else {
    ++pos;
    return lead;
  }
  if (pos + extra >= text.size()) {
    ++pos;
    return lead;
  }
  for (std::size_t i = 1; i <= extra; ++i) {
    const auto cont = static_cast<unsigned char>(text[pos + i]);
    if ((cont & 0xC0U) != 0x80U) {
      ++pos;
      return lead;
    }
    codePoint = (codePoint << 6U) | (cont & 0x3FU);
  }
  pos += extra + 1;
  return codePoint;
}

}  // namespace support
}  // namespace pyjudge
