/***
 * Name: pyjudge::driver::EmitJsonReport
 * Purpose: Route a JSON report to stdout or to the --report-json=<file> target.
 * Inputs:
 *   - opts: reportFile (empty means stdout)
 *   - json: rendered report
 * Outputs:
 *   - bool: false when the file could not be written; the reason is printed
 *     with the usual 'pyjudge: error: ' prefix
 */
#include "driver/app.h"
#include "pyjudge/support/fs.h"

#include <iostream>
#include <string>

namespace pyjudge::driver {

auto EmitJsonReport(const cli::Options& opts, const std::string& json) -> bool {
  if (opts.reportFile.empty()) {
    std::cout << json;
    return true;
  }
  std::string err;
  if (!support::WriteFile(opts.reportFile, json, err)) {
    std::cerr << "pyjudge: error: " << err << '\n';
    return false;
  }
  return true;
}

}  // namespace pyjudge::driver
