/***
 * Name: pyjudge::driver::ReportMetricsIfRequested
 * Purpose: Print metrics to stdout if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - metrics: sink filled during the run
 * Outputs: None
 * Theory of Operation: JSON wins when both flags are given.
 */
#include "driver/app.h"

#include <iostream>

namespace pyjudge::driver {

auto ReportMetricsIfRequested(const cli::Options& opts, const obs::Metrics& metrics) -> void {
  if (opts.metricsJson) {
    std::cout << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cout << metrics.summaryText();
  }
}

}  // namespace pyjudge::driver
