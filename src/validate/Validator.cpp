/***
 * Name: pyjudge::validate::Validator (impl)
 * Purpose: Screen, run per case, compare, summarize.
 */
#include "validate/Validator.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "codec/Codec.h"
#include "harness/Harness.h"
#include "protocol/Protocol.h"
#include "pyjudge/exceptions/config_error.h"
#include "pyjudge/exceptions/target_error.h"

namespace pyjudge::validate {

Validator::Validator(const sandbox::ProcessRunner& runner, double timeoutSeconds, obs::Metrics* metrics)
    : Validator(runner, timeoutSeconds, screen::Screener(), metrics) {}

Validator::Validator(const sandbox::ProcessRunner& runner, double timeoutSeconds, screen::Screener screener,
                     obs::Metrics* metrics)
    : runner_(runner), timeoutSeconds_(timeoutSeconds), screener_(std::move(screener)), metrics_(metrics) {}

void Validator::count(const char* key) const {
  if (metrics_ != nullptr) { metrics_->incCounter(key); }
}

CaseResult Validator::runCase(std::size_t index, const std::string& source, const harness::TestCase& testCase,
                              const codec::Value& expected) const {
  using Clock = std::chrono::steady_clock;
  CaseResult result;
  result.index = index;
  const auto started = Clock::now();

  std::string program;
  try {
    program = harness::Synthesize(source, testCase);
  } catch (const exceptions::TargetError& ex) {
    result.status = CaseStatus::Failed;
    result.message = ex.what();
    count("cases.failed");
    return result;
  }

  sandbox::RunResult run;
  {
    const obs::StageTimer timer(metrics_, "Run");
    run = runner_.run(program, timeoutSeconds_);
  }
  count("runs.total");
  if (run.truncated) { count("runs.truncated"); }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

  const protocol::ExecutionOutcome outcome = protocol::ParseOutcome(run, timeoutSeconds_);
  switch (outcome.kind()) {
    case protocol::OutcomeKind::Timeout:
      count("runs.timeout");
      count("cases.failed");
      result.status = CaseStatus::TimedOut;
      result.message = "Execution timeout (" + FormatSeconds(outcome.limitSeconds()) + "s exceeded)";
      return result;
    case protocol::OutcomeKind::Failure:
      count("runs.failure");
      count("cases.failed");
      result.status = CaseStatus::Failed;
      result.message = outcome.text();
      return result;
    case protocol::OutcomeKind::Success:
      break;
  }

  codec::Value actual;
  std::string decodeErr;
  if (!codec::DecodeLiteral(outcome.text(), actual, decodeErr)) {
    actual = codec::Value::str(outcome.text());
  }
  if (codec::Equal(actual, expected)) {
    count("cases.passed");
    result.status = CaseStatus::Passed;
    result.message = "Passed";
  } else {
    count("cases.failed");
    result.status = CaseStatus::Mismatch;
    result.message = "Expected " + codec::Str(expected) + ", got " + codec::Str(actual);
  }
  return result;
}

ValidationReport Validator::validate(const std::string& source, const std::vector<harness::TestCase>& testCases,
                                     const std::vector<codec::Value>& expected) const {
  const obs::StageTimer total(metrics_, "Validate");
  ValidationReport report;
  if (testCases.empty()) {
    report.allPassed = true;
    report.feedback.emplace_back("No test cases defined");
    return report;
  }
  if (testCases.size() != expected.size()) {
    throw exceptions::ConfigError("test case count (" + std::to_string(testCases.size()) +
                                  ") does not match expected outcome count (" + std::to_string(expected.size()) + ")");
  }

  screen::SafetyVerdict verdict;
  {
    const obs::StageTimer timer(metrics_, "Screen");
    verdict = screener_.screen(source);
  }
  if (!verdict.allowed) {
    count("screen.rejected");
    report.allPassed = false;
    report.feedback.emplace_back("Code contains unsafe operations: " + verdict.reason.value_or("denied"));
    return report;
  }

  std::vector<std::string> lines;
  for (std::size_t i = 0; i < testCases.size(); ++i) {
    CaseResult result = runCase(i + 1, source, testCases[i], expected[i]);
    lines.push_back("Test " + std::to_string(i + 1) + ": " + result.message);
    report.cases.push_back(std::move(result));
  }

  const std::size_t passed = report.passCount();
  report.allPassed = passed == testCases.size();
  report.feedback.push_back(report.allPassed
                                ? "All " + std::to_string(testCases.size()) + " test cases passed!"
                                : std::to_string(passed) + "/" + std::to_string(testCases.size()) + " test cases passed");
  for (auto& line : lines) { report.feedback.push_back(std::move(line)); }
  return report;
}

} // namespace pyjudge::validate
