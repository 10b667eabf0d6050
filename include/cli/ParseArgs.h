#pragma once

#include "cli/Options.h"

namespace pyjudge::cli {

    // Fill out from argv. Errors are reported on stderr and yield false; the
    // caller prints usage.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pyjudge::cli
