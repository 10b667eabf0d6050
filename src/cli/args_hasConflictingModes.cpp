#include "cli/ParseArgsInternals.h"

namespace pyjudge::cli::detail {
    /***
     * Name: pyjudge::cli::detail::hasConflictingModes
     * Purpose: Validate mutually exclusive run modes.
     */
    bool hasConflictingModes(const Options &opts) {
        const int modes = (opts.list ? 1 : 0) + (opts.showId.empty() ? 0 : 1) + (opts.screenOnly ? 1 : 0) +
                          (opts.selfCheck ? 1 : 0);
        return modes > 1;
    }
} // namespace pyjudge::cli::detail
