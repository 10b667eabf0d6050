/***
 * Name: pyjudge::driver (app API)
 * Purpose: Declarations for the helpers Driver::run is assembled from.
 * Inputs: CLI options, environment, catalog, reports
 * Outputs: Config, text/JSON renderings, status codes
 * Theory of Operation: Keep Driver::run readable by factoring helpers into
 *   separate translation units, one function per .cpp file.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "analysis/Analysis.h"
#include "challenge/Challenge.h"
#include "cli/Options.h"
#include "config/EngineConfig.h"
#include "observability/Metrics.h"
#include "sandbox/ProcessRunner.h"
#include "validate/Validator.h"

namespace pyjudge::driver {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitHost = 3;

/***
 * Name: pyjudge::driver::SubmissionResult
 * Purpose: Everything reported about one validated submission.
 */
struct SubmissionResult {
  std::string challengeId;
  bool syntaxValid{true};
  validate::ValidationReport report;
  analysis::StyleReport style;
  double performanceScore{0.0};
  double executionSeconds{0.0};
};

/***
 * Name: pyjudge::driver::BuildEngineConfig
 * Purpose: Defaults, then environment, then CLI values.
 * Theory of Operation: Throws exceptions::ConfigError on any bad value.
 */
config::EngineConfig BuildEngineConfig(const cli::Options& opts, const config::EnvLookup& env);

/***
 * Name: pyjudge::driver::ResolveCatalogPath
 * Purpose: --challenges, else $PYJUDGE_CHALLENGES, else the bundled catalog.
 */
std::string ResolveCatalogPath(const cli::Options& opts, const config::EnvLookup& env);

/***
 * Name: pyjudge::driver::ReadSubmission
 * Purpose: Read the solution file ("-" reads standard input).
 */
bool ReadSubmission(const std::string& path, std::string& source, std::string& err);

/*** ColorEnabled: --color, else a TTY on stderr or PYJUDGE_COLOR. */
bool ColorEnabled(const cli::Options& opts);

/*** PrintFeedback: One line per entry, green/red/bold by status when color is on. */
void PrintFeedback(std::ostream& out, const std::vector<std::string>& lines, bool color);

/*** ListChallenges: "<id>  [<difficulty>] <title> (<module>/<topic>)" per challenge. */
void ListChallenges(std::ostream& out, const challenge::Catalog& catalog);

/***
 * Name: pyjudge::driver::ShowChallenge
 * Purpose: What a learner sees before writing a solution: header line,
 *   description, starter template and hints.
 */
void ShowChallenge(std::ostream& out, const challenge::Challenge& ch);

/***
 * Name: pyjudge::driver::SelfCheck
 * Purpose: Validate every challenge against its own reference solution.
 * Outputs: kExitOk when all pass, kExitFailed otherwise
 */
int SelfCheck(std::ostream& out, const challenge::Catalog& catalog, const validate::Validator& validator,
              bool color);

/***
 * Name: pyjudge::driver::MeasureBareRun
 * Purpose: Time one run of the source with no target (performance score input).
 * Outputs: wall-clock seconds of the run
 */
double MeasureBareRun(const sandbox::ProcessRunner& runner, const std::string& source, double timeoutSeconds);

/*** ReportToJson: Persistence-collaborator view of a SubmissionResult. */
std::string ReportToJson(const SubmissionResult& result);

/***
 * Name: pyjudge::driver::EmitJsonReport
 * Purpose: Send a JSON report where --report-json asked for it.
 * Outputs: false (message already on stderr) when the report file cannot be written
 */
bool EmitJsonReport(const cli::Options& opts, const std::string& json);

/*** ReportMetricsIfRequested: Text or JSON metrics summary on stdout. */
void ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics);

}  // namespace pyjudge::driver
