/***
 * Name: pyjudge::support::ParseCountStrict
 * Purpose: Parse a non-negative base-10 count (env values, CLI flags) without throwing.
 * Inputs: Text containing optional surrounding whitespace, digits; optional error out
 * Outputs: Parsed value via out_val; returns true on success
 * Theory of Operation: Validates characters and range; rejects signs and trailing garbage.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyjudge {
namespace support {

bool ParseCountStrict(std::string_view text, std::uint64_t& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace pyjudge
