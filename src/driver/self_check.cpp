/***
 * Name: pyjudge::driver::SelfCheck
 * Purpose: Catalog maintenance: every reference solution must pass its tests.
 * Inputs: catalog, validator, output stream, color
 * Outputs: kExitOk when all pass; kExitFailed otherwise (feedback printed)
 */
#include "driver/app.h"

#include <ostream>

namespace pyjudge::driver {

auto SelfCheck(std::ostream& out, const challenge::Catalog& catalog, const validate::Validator& validator,
               bool color) -> int {
  int status = kExitOk;
  for (const auto& ch : catalog.challenges()) {
    const auto report = validator.validate(ch.solution, ch.testCases, ch.expected);
    out << ch.id << ": " << (report.allPassed ? "ok" : "FAILED") << '\n';
    if (!report.allPassed) {
      status = kExitFailed;
      PrintFeedback(out, report.feedback, color);
    }
  }
  return status;
}

}  // namespace pyjudge::driver
