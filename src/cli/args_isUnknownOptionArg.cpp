#include "cli/ParseArgsInternals.h"

namespace pyjudge::cli::detail {
    /***
     * Name: pyjudge::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     *   A lone "-" names standard input and is positional.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        return arg.size() > 1 && arg[0] == '-';
    }
} // namespace pyjudge::cli::detail
