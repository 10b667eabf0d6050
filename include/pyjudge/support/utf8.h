/***
 * Name: pyjudge::support (utf8)
 * Purpose: UTF-8 helpers shared by the literal decoder and the value codec.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyjudge {
namespace support {

/*** AppendUtf8: Append the UTF-8 encoding of code point cp; false for surrogates or cp > U+10FFFF. */
bool AppendUtf8(std::string& out, std::uint32_t codePoint);

/*** NextCodePoint: Decode one code point at pos and advance; invalid bytes decode as themselves. */
std::uint32_t NextCodePoint(std::string_view text, std::size_t& pos);

}  // namespace support
}  // namespace pyjudge
