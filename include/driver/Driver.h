#ifndef PYJUDGE_DRIVER_DRIVER_H
#define PYJUDGE_DRIVER_DRIVER_H

/***
 * Name: pyjudge::driver::Driver
 * Purpose: Orchestrate one pyjudge invocation end-to-end.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Report on stdout (text or JSON); diagnostics on stderr; exit code
 * Theory of Operation:
 *   Loads the engine config (environment, then CLI), reads the submission,
 *   checks syntax, pre-screens, validates against the selected challenge,
 *   scores style and performance and reports optional metrics. Host
 *   problems surface as exceptions for main() to map onto exit codes.
 */

#include <string>

// Forward declarations to reduce header coupling
namespace pyjudge { namespace cli { struct Options; } }
namespace pyjudge { namespace analysis { struct Diagnostic; } }

namespace pyjudge::driver {
    class Driver {
    public:
        static int run(const cli::Options &opts);

        static void print_error(const analysis::Diagnostic &diag, const std::string &source, bool color);
    };
} // namespace pyjudge::driver

#endif // PYJUDGE_DRIVER_DRIVER_H
