#include "cli/ParseArgsInternals.h"

namespace pyjudge::cli::detail {
    /***
     * Name: pyjudge::cli::detail::applyOption
     * Purpose: Apply one option argument: a bare flag, or --name=value.
     */
    OptResult applyOption(const std::string_view arg, Options &out, std::string &err) {
        for (const FlagSpec &flag : flagOptions()) {
            if (arg == flag.spelling) {
                out.*flag.field = true;
                return OptResult::Handled;
            }
        }
        const auto eq = arg.find('=');
        if (eq == std::string_view::npos) { return OptResult::NotMatched; }
        const std::string_view name = arg.substr(0, eq);
        for (const ValueSpec &option : valueOptions()) {
            if (name == option.name) {
                return option.apply(out, arg.substr(eq + 1), err) ? OptResult::Handled : OptResult::Error;
            }
        }
        return OptResult::NotMatched;
    }
} // namespace pyjudge::cli::detail
