#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pyjudge::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(pyjudge [options] <solution.py>

Options:
  -h, --help              Print this help and exit
  --challenges=<file>     Challenge catalog (JSON); default: $PYJUDGE_CHALLENGES
                          or the bundled catalog
  --id=<challenge-id>     Challenge to validate against (default: first)
  --list                  List challenges in the catalog and exit
  --show=<challenge-id>   Print a challenge's description, template and hints
  --screen-only           Run the syntax check and safety pre-screen only
  --self-check            Validate every challenge's reference solution
  --timeout=<s>           Per-test-case wall-clock limit (default: 5)
  --max-concurrent=<n>    Interpreter processes alive at once (default: 5)
  --python=<path>         Interpreter to run submissions with (default: python3)
  --tmpdir=<dir>          Directory for generated programs
  --memory-mb=<n>         Address-space cap per process, 0 = off (default: 0)
  --report-json[=<file>]  Print the report as JSON (or write it to <file>)
  --metrics               Print stage timings and counters
  --metrics-json          Print stage timings and counters in JSON
  --color=<mode>          Color output: always|never|auto (default: auto)
  --verbose               Echo per-case status and timing on stderr
  --                      End of options

Exit status: 0 passed, 1 failed/rejected/syntax error, 2 usage or
configuration error, 3 host environment error.
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pyjudge::cli
