/***
 * Name: pyjudge::driver::Driver::run
 * Purpose: Execute one pyjudge invocation end-to-end.
 */
#include "driver/Driver.h"
#include "analysis/Analysis.h"
#include "challenge/Challenge.h"
#include "cli/Options.h"
#include "config/EngineConfig.h"
#include "driver/app.h"
#include "observability/Metrics.h"
#include "pyjudge/exceptions/config_error.h"
#include "pyjudge/exceptions/file_read_error.h"
#include "sandbox/ConcurrencyBudget.h"
#include "sandbox/ProcessRunner.h"
#include "screen/Screener.h"
#include "validate/Validator.h"

#include <chrono>
#include <iostream>
#include <string>

namespace pyjudge::driver {

namespace {
const challenge::Challenge& selectChallenge(const challenge::Catalog& catalog, const std::string& id,
                                            const std::string& path) {
  if (catalog.challenges().empty()) { throw exceptions::ConfigError(path + ": catalog has no challenges"); }
  if (id.empty()) { return catalog.challenges().front(); }
  const auto* found = catalog.find(id);
  if (found == nullptr) { throw exceptions::ConfigError("unknown challenge id '" + id + "' in " + path); }
  return *found;
}

void echoCases(const validate::ValidationReport& report) {
  for (const auto& c : report.cases) {
    std::cerr << "pyjudge: case " << c.index << ": " << validate::to_string(c.status) << " ("
              << c.elapsed.count() << " ms)\n";
  }
}
} // namespace

int Driver::run(const cli::Options& opts) { // NOLINT(readability-function-size,readability-function-cognitive-complexity)
  const config::EnvLookup env = config::ProcessEnv();
  const config::EngineConfig cfg = BuildEngineConfig(opts, env);
  const bool color = ColorEnabled(opts);
  const std::string catalogPath = ResolveCatalogPath(opts, env);

  if (opts.list) {
    ListChallenges(std::cout, challenge::Catalog::load(catalogPath));
    return kExitOk;
  }
  if (!opts.showId.empty()) {
    const challenge::Catalog catalog = challenge::Catalog::load(catalogPath);
    ShowChallenge(std::cout, selectChallenge(catalog, opts.showId, catalogPath));
    return kExitOk;
  }

  obs::Metrics metrics;
  sandbox::ConcurrencyBudget budget(cfg.maxConcurrent);
  const sandbox::ProcessRunner runner(budget, cfg.runnerOptions());
  const validate::Validator validator(runner, cfg.timeoutSeconds, &metrics);

  if (opts.selfCheck) {
    const int status = SelfCheck(std::cout, challenge::Catalog::load(catalogPath), validator, color);
    ReportMetricsIfRequested(opts, metrics);
    return status;
  }

  if (opts.inputs.size() != 1) {
    std::cerr << "pyjudge: error: exactly one solution file is required" << '\n';
    return kExitUsage;
  }
  const std::string& input = opts.inputs.front();
  const std::string displayName = input == "-" ? std::string("<stdin>") : input;
  std::string source;
  std::string err;
  if (!ReadSubmission(input, source, err)) { throw exceptions::FileReadError(err); }

  metrics.start("Syntax");
  const analysis::SyntaxReport syntax = analysis::CheckSyntax(source, displayName);
  metrics.stop("Syntax");
  if (!syntax.ok) {
    metrics.incCounter("syntax.errors", syntax.diagnostics.size());
    for (const auto& diag : syntax.diagnostics) { print_error(diag, source, color); }
    if (opts.reportJson) {
      SubmissionResult rejected;
      rejected.challengeId = opts.challengeId;
      rejected.syntaxValid = false;
      rejected.report.feedback = syntax.feedback();
      rejected.style.score = 0.0;
      if (!EmitJsonReport(opts, ReportToJson(rejected))) { return kExitHost; }
    }
    ReportMetricsIfRequested(opts, metrics);
    return kExitFailed;
  }

  if (opts.screenOnly) {
    metrics.start("Screen");
    const screen::SafetyVerdict verdict = screen::Screener().screen(source);
    metrics.stop("Screen");
    if (verdict.allowed) {
      std::cout << displayName << ": screen ok\n";
    } else {
      metrics.incCounter("screen.rejected");
      std::cout << displayName << ": rejected: " << verdict.reason.value_or("denied") << '\n';
    }
    ReportMetricsIfRequested(opts, metrics);
    return verdict.allowed ? kExitOk : kExitFailed;
  }

  const challenge::Catalog catalog = challenge::Catalog::load(catalogPath);
  const challenge::Challenge& chosen = selectChallenge(catalog, opts.challengeId, catalogPath);

  SubmissionResult result;
  result.challengeId = chosen.id;
  result.report = validator.validate(source, chosen.testCases, chosen.expected);
  if (opts.verbose) { echoCases(result.report); }

  metrics.start("Style");
  result.style = analysis::CheckStyle(source);
  metrics.stop("Style");

  // A rejected submission never runs, not even for timing.
  if (metrics.counter("screen.rejected") == 0) {
    metrics.start("Perf");
    result.executionSeconds = MeasureBareRun(runner, source, cfg.timeoutSeconds);
    metrics.stop("Perf");
    result.performanceScore = analysis::PerformanceScore(std::chrono::duration<double>(result.executionSeconds));
  }
  metrics.setGauge("report.passed", result.report.allPassed ? 1U : 0U);

  if (opts.reportJson && !EmitJsonReport(opts, ReportToJson(result))) { return kExitHost; }
  if (!opts.reportJson || !opts.reportFile.empty()) {
    std::cout << "Challenge " << chosen.id << ": " << chosen.title << '\n';
    PrintFeedback(std::cout, result.report.feedback, color);
    for (const auto& line : result.style.feedback) { std::cout << line << '\n'; }
    std::cout << "Style score: " << result.style.score << ", performance score: " << result.performanceScore
              << ", execution time: " << result.executionSeconds << "s\n";
  }

  ReportMetricsIfRequested(opts, metrics);
  return result.report.allPassed ? kExitOk : kExitFailed;
}

} // namespace pyjudge::driver
