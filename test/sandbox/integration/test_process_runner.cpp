/***
 * Name: test_process_runner
 * Purpose: Real interpreter runs: capture, exit status, deadline, cleanup,
 *   environment hygiene and the concurrency bound.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <future>
#include <string>
#include <vector>
#include "sandbox/ConcurrencyBudget.h"
#include "sandbox/ProcessRunner.h"
#include "util/Python.h"

using namespace pyjudge::sandbox;

namespace {
RunnerOptions optionsIn(const testutil::ScratchDir& dir) {
  RunnerOptions opts;
  opts.tempDir = dir.str();
  return opts;
}
} // namespace

TEST(ProcessRunner, CapturesStdoutAndStderr) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-capture");
  ConcurrencyBudget budget(1);
  const ProcessRunner runner(budget, optionsIn(dir));
  const auto res = runner.run("import sys\nprint('out')\nprint('err', file=sys.stderr)\n", 10.0);
  EXPECT_FALSE(res.timedOut);
  EXPECT_FALSE(res.spawnError.has_value());
  EXPECT_EQ(res.exitCode, 0);
  EXPECT_EQ(res.stdoutText, "out\n");
  EXPECT_EQ(res.stderrText, "err\n");
  EXPECT_FALSE(res.truncated);
}

TEST(ProcessRunner, ReportsNonZeroExit) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-exit");
  ConcurrencyBudget budget(1);
  const ProcessRunner runner(budget, optionsIn(dir));
  const auto res = runner.run("raise SystemExit(7)\n", 10.0);
  EXPECT_FALSE(res.timedOut);
  EXPECT_EQ(res.exitCode, 7);
}

TEST(ProcessRunner, TempProgramIsRemovedAfterRun) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-cleanup");
  ConcurrencyBudget budget(1);
  const ProcessRunner runner(budget, optionsIn(dir));
  (void)runner.run("print(1)\n", 10.0);
  (void)runner.run("while True:\n    pass\n", 0.5);
  EXPECT_EQ(dir.entries(), 0U);
}

TEST(ProcessRunner, DeadlineKillsTheChild) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-timeout");
  ConcurrencyBudget budget(1);
  const ProcessRunner runner(budget, optionsIn(dir));
  const auto started = std::chrono::steady_clock::now();
  const auto res = runner.run("import time\nprint('started', flush=True)\ntime.sleep(30)\n", 1.0);
  const auto took = std::chrono::steady_clock::now() - started;
  EXPECT_TRUE(res.timedOut);
  EXPECT_EQ(res.exitCode, -1);
  EXPECT_NE(res.termSignal, 0);
  EXPECT_EQ(res.stdoutText, "started\n");
  EXPECT_LT(took, std::chrono::seconds(5));
}

TEST(ProcessRunner, MissingInterpreterIsASpawnError) {
  testutil::ScratchDir dir("runner-spawn");
  ConcurrencyBudget budget(1);
  RunnerOptions opts = optionsIn(dir);
  opts.interpreter = "/nonexistent/bin/python3";
  const ProcessRunner runner(budget, opts);
  const auto res = runner.run("print(1)\n", 5.0);
  ASSERT_TRUE(res.spawnError.has_value());
  EXPECT_FALSE(res.timedOut);
  EXPECT_TRUE(res.stdoutText.empty());
  EXPECT_EQ(dir.entries(), 0U);
}

TEST(ProcessRunner, InheritedPythonPathIsCleared) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-env");
  ConcurrencyBudget budget(1);
  const ProcessRunner runner(budget, optionsIn(dir));
  ::setenv("PYTHONPATH", "/definitely/not/here", 1);
  const auto res = runner.run("import os\nprint(repr(os.environ.get('PYTHONPATH')))\n", 10.0);
  ::unsetenv("PYTHONPATH");
  EXPECT_EQ(res.stdoutText, "''\n");
}

TEST(ProcessRunner, OutputBeyondTheCapKeepsTheTail) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-trunc");
  ConcurrencyBudget budget(1);
  RunnerOptions opts = optionsIn(dir);
  opts.maxOutputBytes = 1024;
  const ProcessRunner runner(budget, opts);
  const auto res = runner.run("print('x' * 100000)\nprint('LAST')\n", 10.0);
  EXPECT_TRUE(res.truncated);
  EXPECT_EQ(res.stdoutText.size(), 1024U);
  EXPECT_EQ(res.stdoutText.substr(res.stdoutText.size() - 5), "LAST\n");
}

TEST(ProcessRunner, BudgetBoundsConcurrentRuns) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("runner-waves");
  ConcurrencyBudget budget(2);
  const ProcessRunner runner(budget, optionsIn(dir));
  const auto started = std::chrono::steady_clock::now();
  std::vector<std::future<RunResult>> runs;
  for (int i = 0; i < 5; ++i) {
    runs.push_back(std::async(std::launch::async, [&runner]() {
      return runner.run("import time\ntime.sleep(1)\nprint('done')\n", 20.0);
    }));
  }
  for (auto& f : runs) {
    const auto res = f.get();
    EXPECT_EQ(res.stdoutText, "done\n");
    EXPECT_FALSE(res.timedOut);
  }
  const auto took = std::chrono::steady_clock::now() - started;
  // Three waves of one second each.
  EXPECT_GE(took, std::chrono::milliseconds(2900));
  EXPECT_LE(budget.peakInUse(), 2U);
  EXPECT_EQ(budget.inUse(), 0U);
  EXPECT_EQ(dir.entries(), 0U);
}
