#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>
#include <string>
#include <string_view>

namespace pyjudge::cli {
    /***
     * Name: pyjudge::cli::ParseArgs
     * Purpose: GNU-style argument parser for pyjudge. Options and solution
     *   paths may interleave; everything after "--" is a path.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        bool pathsOnly = false;
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (pathsOnly) {
                out.inputs.emplace_back(arg);
                continue;
            }
            if (arg == "--") {
                pathsOnly = true;
                continue;
            }
            std::string err;
            switch (detail::applyOption(arg, out, err)) {
                case detail::OptResult::Handled: continue;
                case detail::OptResult::Error:
                    std::cerr << "pyjudge: " << err << "\n";
                    return false;
                case detail::OptResult::NotMatched: break;
            }
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pyjudge: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(arg);
        }

        if (detail::hasConflictingModes(out)) {
            std::cerr << "pyjudge: --list, --show, --screen-only and --self-check are mutually exclusive\n";
            return false;
        }
        return true;
    }
} // namespace pyjudge::cli
