/***
 * Name: pyjudge::validate (report helpers)
 */
#include "validate/ValidationReport.h"

#include <algorithm>
#include <cstddef>

namespace pyjudge::validate {

const char* to_string(CaseStatus status) {
  switch (status) {
    case CaseStatus::Passed: return "passed";
    case CaseStatus::Mismatch: return "mismatch";
    case CaseStatus::Failed: return "failed";
    case CaseStatus::TimedOut: return "timeout";
  }
  return "unknown";
}

std::size_t ValidationReport::passCount() const {
  return static_cast<std::size_t>(
      std::count_if(cases.begin(), cases.end(), [](const CaseResult& c) { return c.status == CaseStatus::Passed; }));
}

} // namespace pyjudge::validate
