/***
 * Name: test_cli_end_to_end
 * Purpose: Exercise CLI/Driver end-to-end: help, list, show, validation exit codes,
 *   screen-only, JSON report, self-check and configuration errors.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include "util/Python.h"

namespace {
const std::string kBin = PYJUDGE_BIN_PATH;
const std::string kCatalog = std::string(PYJUDGE_TEST_DATA_DIR) + "/challenges.json";

void write_file(const std::string& path, const std::string& s) {
  std::ofstream out(path); out << s;
}

std::string read_all(const std::string& path) {
  std::ifstream in(path); std::string s, line; while (std::getline(in, line)) { s += line; s += '\n'; } return s;
}

// Runs pyjudge with args; stdout and stderr land in dir/out.txt and dir/err.txt.
int run(const testutil::ScratchDir& dir, const std::string& args) {
  const std::string cmd = "NO_COLOR=1 " + kBin + " --color=never --challenges=" + kCatalog + " " + args + " > " +
                          dir.str() + "/out.txt 2> " + dir.str() + "/err.txt";
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
} // namespace

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  testutil::ScratchDir dir("e2e-help");
  ASSERT_EQ(run(dir, "--help"), 0);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("pyjudge [options] <solution.py>"), std::string::npos);
}

TEST(CLI_EndToEnd, MissingSolutionIsAUsageError) {
  testutil::ScratchDir dir("e2e-nofile");
  EXPECT_EQ(run(dir, ""), 2);
  EXPECT_NE(read_all(dir.str() + "/err.txt").find("exactly one solution file is required"), std::string::npos);
  EXPECT_EQ(run(dir, dir.str() + "/absent.py"), 2);
  EXPECT_EQ(run(dir, "--bogus"), 2);
}

TEST(CLI_EndToEnd, ListShowsBundledChallenges) {
  testutil::ScratchDir dir("e2e-list");
  ASSERT_EQ(run(dir, "--list"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("core_001  [1] Basic Function Implementation (core_python/functions)  2 tests"),
            std::string::npos);
  EXPECT_NE(out.find("ds_002"), std::string::npos);
}

TEST(CLI_EndToEnd, ShowPrintsDescriptionTemplateAndHints) {
  testutil::ScratchDir dir("e2e-show");
  ASSERT_EQ(run(dir, "--show=core_001"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_EQ(out.rfind("core_001: Basic Function Implementation\n", 0), 0U);
  EXPECT_NE(out.find("Implement a function that adds two numbers"), std::string::npos);
  EXPECT_NE(out.find("Template:\n# Basic Function Implementation\n"), std::string::npos);
  EXPECT_NE(out.find("  - Use the + operator\n"), std::string::npos);
  EXPECT_EQ(run(dir, "--show=no_such_challenge"), 2);
}

TEST(CLI_EndToEnd, PassingSolutionExitsZero) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("e2e-pass");
  write_file(dir.str() + "/sol.py", "def solution(a, b):\n    return a + b\n");
  ASSERT_EQ(run(dir, "--id=core_001 " + dir.str() + "/sol.py"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("Challenge core_001: Basic Function Implementation"), std::string::npos);
  EXPECT_NE(out.find("All 2 test cases passed!"), std::string::npos);
  EXPECT_NE(out.find("PEP8 check OK"), std::string::npos);
  EXPECT_NE(out.find("Style score: 1"), std::string::npos);
}

TEST(CLI_EndToEnd, FailingSolutionExitsOne) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("e2e-fail");
  write_file(dir.str() + "/sol.py", "def solution(a, b):\n    return a + b if a > 0 else 7\n");
  ASSERT_EQ(run(dir, "--id=core_001 " + dir.str() + "/sol.py"), 1);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("1/2 test cases passed"), std::string::npos);
  EXPECT_NE(out.find("Test 2: Expected 0, got 7"), std::string::npos);
}

TEST(CLI_EndToEnd, UnsafeSolutionIsRejected) {
  testutil::ScratchDir dir("e2e-unsafe");
  write_file(dir.str() + "/sol.py", "import os\n\ndef solution(a, b):\n    return a + b\n");
  ASSERT_EQ(run(dir, "--id=core_001 " + dir.str() + "/sol.py"), 1);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("Code contains unsafe operations: import of 'os' is not allowed"),
            std::string::npos);
}

TEST(CLI_EndToEnd, SyntaxErrorIsReportedCompilerStyle) {
  testutil::ScratchDir dir("e2e-syntax");
  write_file(dir.str() + "/sol.py", "x = 1\ny = $\n");
  ASSERT_EQ(run(dir, dir.str() + "/sol.py"), 1);
  const auto err = read_all(dir.str() + "/err.txt");
  EXPECT_NE(err.find("sol.py:2:5: error: invalid character '$'"), std::string::npos);

  ASSERT_EQ(run(dir, "--report-json " + dir.str() + "/sol.py"), 1);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("\"syntax_valid\": false"), std::string::npos);
  EXPECT_NE(out.find("Syntax Error on line 2: invalid character '$'"), std::string::npos);
}

TEST(CLI_EndToEnd, ScreenOnlyMode) {
  testutil::ScratchDir dir("e2e-screen");
  write_file(dir.str() + "/ok.py", "import math\n");
  write_file(dir.str() + "/bad.py", "from subprocess import run\n");
  ASSERT_EQ(run(dir, "--screen-only " + dir.str() + "/ok.py"), 0);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("ok.py: screen ok"), std::string::npos);
  ASSERT_EQ(run(dir, "--screen-only " + dir.str() + "/bad.py"), 1);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("bad.py: rejected: import of 'subprocess' is not allowed"),
            std::string::npos);
}

TEST(CLI_EndToEnd, StdinSubmission) {
  testutil::ScratchDir dir("e2e-stdin");
  const std::string cmd = "printf 'import socket\\n' | " + kBin + " --color=never --screen-only - > " + dir.str() +
                          "/out.txt 2>/dev/null";
  const int rc = std::system(cmd.c_str());
  ASSERT_TRUE(WIFEXITED(rc));
  EXPECT_EQ(WEXITSTATUS(rc), 1);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("<stdin>: rejected: import of 'socket' is not allowed"),
            std::string::npos);
}

TEST(CLI_EndToEnd, ReportJsonToStdoutAndFile) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("e2e-json");
  write_file(dir.str() + "/sol.py", "def solution(a, b):\n    return a + b\n");
  ASSERT_EQ(run(dir, "--id=core_001 --report-json " + dir.str() + "/sol.py"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_EQ(out.rfind("{", 0), 0U);
  EXPECT_NE(out.find("\"challenge_id\": \"core_001\""), std::string::npos);
  EXPECT_NE(out.find("\"passed\": true"), std::string::npos);
  EXPECT_EQ(out.find("Challenge core_001"), std::string::npos);

  ASSERT_EQ(run(dir, "--id=core_001 --report-json=" + dir.str() + "/report.json " + dir.str() + "/sol.py"), 0);
  EXPECT_NE(read_all(dir.str() + "/report.json").find("\"pass_count\": 2"), std::string::npos);
  EXPECT_NE(read_all(dir.str() + "/out.txt").find("Challenge core_001"), std::string::npos);
}

TEST(CLI_EndToEnd, MetricsJson) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("e2e-metrics");
  write_file(dir.str() + "/sol.py", "def solution(a, b):\n    return a + b\n");
  ASSERT_EQ(run(dir, "--id=core_001 --metrics-json " + dir.str() + "/sol.py"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(out.find("\"run\""), std::string::npos);
  EXPECT_NE(out.find("\"runs.total\": 2"), std::string::npos);
}

TEST(CLI_EndToEnd, SelfCheckPassesForBundledCatalog) {
  PYJUDGE_REQUIRE_PYTHON();
  testutil::ScratchDir dir("e2e-selfcheck");
  ASSERT_EQ(run(dir, "--self-check"), 0);
  const auto out = read_all(dir.str() + "/out.txt");
  EXPECT_NE(out.find("core_001: ok"), std::string::npos);
  EXPECT_NE(out.find("ds_002: ok"), std::string::npos);
}

TEST(CLI_EndToEnd, ConfigurationErrorsExitTwo) {
  testutil::ScratchDir dir("e2e-config");
  write_file(dir.str() + "/sol.py", "def solution(a, b):\n    return a + b\n");
  EXPECT_EQ(run(dir, "--timeout=0 " + dir.str() + "/sol.py"), 2);
  EXPECT_NE(read_all(dir.str() + "/err.txt").find("invalid value for --timeout"), std::string::npos);
  EXPECT_EQ(run(dir, "--id=nope " + dir.str() + "/sol.py"), 2);
  EXPECT_NE(read_all(dir.str() + "/err.txt").find("unknown challenge id 'nope'"), std::string::npos);
  EXPECT_EQ(run(dir, "--list --self-check"), 2);
}
