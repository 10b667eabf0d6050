/***
 * Name: pyjudge::codec::detail::quoteStr / quoteBytes
 * Purpose: Python-compatible quoting of str and bytes payloads.
 * Theory of Operation:
 *   Single quotes unless the text contains a single quote and no double
 *   quote (repr()'s rule). Backslash, the chosen quote, \n, \r and \t get
 *   short escapes; other control characters become \xNN. Printable
 *   non-ASCII text passes through as UTF-8 (str) or is \xNN-escaped (bytes).
 */
#include "codec/ReprInternals.h"
#include "pyjudge/support/utf8.h"

#include <cstdint>
#include <cstdio>
#include <string>

namespace pyjudge::codec::detail {

namespace {
char chooseQuote(const std::string& text) {
  const bool hasSingle = text.find('\'') != std::string::npos;
  const bool hasDouble = text.find('"') != std::string::npos;
  return (hasSingle && !hasDouble) ? '"' : '\'';
}

void appendHexEscape(std::string& out, std::uint32_t value, int width, char marker) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "\\%c%0*x", marker, width, static_cast<unsigned>(value));
  out += buf;
}

// Escapes shared by str and bytes; returns false when the character needs no short escape
bool appendShortEscape(std::string& out, std::uint32_t chr, char quote) {
  switch (chr) {
    case '\\': out += "\\\\"; return true;
    case '\n': out += "\\n"; return true;
    case '\r': out += "\\r"; return true;
    case '\t': out += "\\t"; return true;
    default: break;
  }
  if (chr == static_cast<unsigned char>(quote)) {
    out.push_back('\\');
    out.push_back(quote);
    return true;
  }
  return false;
}
} // namespace

std::string quoteStr(const std::string& text) {
  const char quote = chooseQuote(text);
  std::string out(1, quote);
  size_t pos = 0;
  while (pos < text.size()) {
    const size_t start = pos;
    const std::uint32_t codePoint = support::NextCodePoint(text, pos);
    if (appendShortEscape(out, codePoint, quote)) { continue; }
    if (codePoint < 0x20U || codePoint == 0x7FU) {
      appendHexEscape(out, codePoint, 2, 'x');
    } else if (codePoint >= 0x80U && codePoint < 0xA0U) {
      // C1 controls; also covers stray bytes from invalid UTF-8
      appendHexEscape(out, codePoint, 2, 'x');
    } else {
      out.append(text, start, pos - start);
    }
  }
  out.push_back(quote);
  return out;
}

std::string quoteBytes(const std::string& data) {
  const char quote = chooseQuote(data);
  std::string out = "b";
  out.push_back(quote);
  for (const char raw : data) {
    const auto byte = static_cast<unsigned char>(raw);
    if (appendShortEscape(out, byte, quote)) { continue; }
    if (byte < 0x20U || byte >= 0x7FU) {
      appendHexEscape(out, byte, 2, 'x');
    } else {
      out.push_back(raw);
    }
  }
  out.push_back(quote);
  return out;
}

} // namespace pyjudge::codec::detail
