/***
 * Name: pyjudge::driver::MeasureBareRun
 * Purpose: Time the submission executed on its own, with no target called.
 * Theory of Operation: Uses the harness with an empty target, so the run
 *   goes through the same permit, temp file and timeout as a test case.
 */
#include "driver/app.h"
#include "harness/Harness.h"

#include <chrono>
#include <string>

namespace pyjudge::driver {

auto MeasureBareRun(const sandbox::ProcessRunner& runner, const std::string& source, double timeoutSeconds)
    -> double {
  const std::string program = harness::Synthesize(source, harness::TestCase{});
  const auto started = std::chrono::steady_clock::now();
  const sandbox::RunResult run = runner.run(program, timeoutSeconds);
  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  if (run.timedOut) { return timeoutSeconds; }
  return elapsed.count();
}

}  // namespace pyjudge::driver
