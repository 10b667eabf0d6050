/***
 * Name: pyjudge::driver::ReportToJson
 * Purpose: Serialize a SubmissionResult for a persistence collaborator.
 * Outputs: Pretty-printed JSON object:
 *   challenge_id, passed, syntax_valid, pass_count, total, feedback[],
 *   cases[{index, status, message, elapsed_ms}], pep8_score, style_feedback[],
 *   performance_score, execution_time
 */
#include "driver/app.h"

#include <string>

#include <nlohmann/json.hpp>

namespace pyjudge::driver {

auto ReportToJson(const SubmissionResult& result) -> std::string {
  nlohmann::ordered_json doc;
  doc["challenge_id"] = result.challengeId;
  doc["passed"] = result.report.allPassed;
  doc["syntax_valid"] = result.syntaxValid;
  doc["pass_count"] = result.report.passCount();
  doc["total"] = result.report.cases.size();
  doc["feedback"] = result.report.feedback;
  nlohmann::ordered_json cases = nlohmann::ordered_json::array();
  for (const auto& c : result.report.cases) {
    cases.push_back({{"index", c.index},
                     {"status", validate::to_string(c.status)},
                     {"message", c.message},
                     {"elapsed_ms", c.elapsed.count()}});
  }
  doc["cases"] = std::move(cases);
  doc["pep8_score"] = result.style.score;
  doc["style_feedback"] = result.style.feedback;
  doc["performance_score"] = result.performanceScore;
  doc["execution_time"] = result.executionSeconds;
  // Submissions may carry invalid UTF-8 into messages; replace rather than throw.
  return doc.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

}  // namespace pyjudge::driver
