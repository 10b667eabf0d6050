/***
 * Name: pyjudge::validate::Validator
 * Purpose: Run a submission against ordered test cases and expected values.
 * Inputs:
 *   - source: candidate Python source
 *   - testCases / expected: paired by index
 * Outputs:
 *   - ValidationReport
 * Theory of Operation:
 *   Screens the source once; a rejection short-circuits with a single
 *   "Code contains unsafe operations: <reason>" line and nothing runs.
 *   Otherwise every case is synthesized, run in its own process and parsed.
 *   Success text is decoded with the codec (undecodable text is compared as
 *   a plain string) and compared with Python equality. Failures and timeouts
 *   are recorded and the next case still runs. A summary line is prepended.
 *   Only exceptions::SandboxResourceError (host trouble) and ConfigError
 *   (mismatched inputs) escape; everything caused by the submission becomes
 *   feedback. Safe to call concurrently; the shared ConcurrencyBudget inside
 *   the runner is the only contended resource.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "codec/Value.h"
#include "harness/TestCase.h"
#include "observability/Metrics.h"
#include "sandbox/ProcessRunner.h"
#include "screen/Screener.h"
#include "validate/ValidationReport.h"

namespace pyjudge::validate {

class Validator {
 public:
  Validator(const sandbox::ProcessRunner& runner, double timeoutSeconds, obs::Metrics* metrics = nullptr);
  Validator(const sandbox::ProcessRunner& runner, double timeoutSeconds, screen::Screener screener,
            obs::Metrics* metrics = nullptr);

  ValidationReport validate(const std::string& source, const std::vector<harness::TestCase>& testCases,
                            const std::vector<codec::Value>& expected) const;

  // One case without screening; index is 1-based and only used for reporting.
  CaseResult runCase(std::size_t index, const std::string& source, const harness::TestCase& testCase,
                     const codec::Value& expected) const;

  double timeoutSeconds() const { return timeoutSeconds_; }

 private:
  const sandbox::ProcessRunner& runner_;
  double timeoutSeconds_;
  screen::Screener screener_;
  obs::Metrics* metrics_;

  void count(const char* key) const;
};

/*** FormatSeconds: Timeout limit as shown in feedback ("5", "0.5"). */
std::string FormatSeconds(double seconds);

} // namespace pyjudge::validate
