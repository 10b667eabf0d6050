#include "cli/ParseArgsInternals.h"

namespace pyjudge::cli::detail {

/***
 * Name: pyjudge::cli::detail::parseColorValue
 * Purpose: Parse --color value into ColorMode; unknown spellings are rejected.
 */
std::optional<ColorMode> parseColorValue(std::string_view value) {
    using enum pyjudge::cli::ColorMode;
    if (value == "always") { return Always; }
    if (value == "never") { return Never; }
    if (value == "auto") { return Auto; }
    return std::nullopt;
}

} // namespace pyjudge::cli::detail
