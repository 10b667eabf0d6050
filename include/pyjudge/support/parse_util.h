/***
 * Name: pyjudge::support (parse_util)
 * Purpose: Building blocks shared by the strict number parsers behind
 *   environment variables, CLI values and result records.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyjudge::support {

/*** TrimSpaces: Drop leading and trailing ASCII whitespace from text in place. */
void TrimSpaces(std::string_view& text);

/*** ParseDigitsStrict: text must be all base-10 digits and fit uint64; otherwise false with *err set. */
bool ParseDigitsStrict(std::string_view text, std::uint64_t& value, std::string* err);

}  // namespace pyjudge::support
