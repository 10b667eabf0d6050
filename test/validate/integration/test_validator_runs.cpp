/***
 * Name: test_validator_runs
 * Purpose: End-to-end validation through a real interpreter: pass, mismatch,
 *   runtime errors, timeouts, lenient comparison and the bundled catalog.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "challenge/Challenge.h"
#include "codec/Codec.h"
#include "codec/Value.h"
#include "harness/Harness.h"
#include "protocol/Protocol.h"
#include "harness/TestCase.h"
#include "observability/Metrics.h"
#include "sandbox/ConcurrencyBudget.h"
#include "sandbox/ProcessRunner.h"
#include "util/Python.h"
#include "validate/Validator.h"

using namespace pyjudge;
using codec::Value;
using harness::TestCase;
using validate::CaseStatus;
using validate::Validator;

namespace {
class ValidatorRuns : public ::testing::Test {
 protected:
  void SetUp() override {
    PYJUDGE_REQUIRE_PYTHON();
    opts_.tempDir = scratch_.str();
  }

  validate::ValidationReport check(const std::string& source, const std::vector<TestCase>& cases,
                                   const std::vector<Value>& expected, double timeout = 10.0) {
    const sandbox::ProcessRunner runner(budget_, opts_);
    const Validator validator(runner, timeout, &metrics_);
    return validator.validate(source, cases, expected);
  }

  testutil::ScratchDir scratch_{"validator"};
  sandbox::ConcurrencyBudget budget_{2};
  sandbox::RunnerOptions opts_{};
  obs::Metrics metrics_{};
};

const char* const kAdd = "def solution(a, b):\n    return a + b\n";
} // namespace

TEST_F(ValidatorRuns, AllCasesPass) {
  const auto report = check(kAdd,
                            {{"solution", {Value::integer(2), Value::integer(3)}, {}},
                             {"solution", {Value::integer(-1), Value::integer(1)}, {}},
                             {"solution", {Value::integer(0), Value::integer(0)}, {}}},
                            {Value::integer(5), Value::integer(0), Value::integer(0)});
  EXPECT_TRUE(report.allPassed);
  ASSERT_EQ(report.feedback.size(), 4U);
  EXPECT_EQ(report.feedback[0], "All 3 test cases passed!");
  EXPECT_EQ(report.feedback[1], "Test 1: Passed");
  EXPECT_EQ(report.feedback[3], "Test 3: Passed");
  EXPECT_EQ(metrics_.counter("runs.total"), 3U);
  EXPECT_EQ(metrics_.counter("cases.passed"), 3U);
  EXPECT_EQ(scratch_.entries(), 0U);
}

TEST_F(ValidatorRuns, MismatchShowsExpectedAndActual) {
  const auto report = check("def solution(a, b):\n    return a - b\n",
                            {{"solution", {Value::integer(2), Value::integer(3)}, {}}}, {Value::integer(5)});
  EXPECT_FALSE(report.allPassed);
  ASSERT_EQ(report.feedback.size(), 2U);
  EXPECT_EQ(report.feedback[0], "0/1 test cases passed");
  EXPECT_EQ(report.feedback[1], "Test 1: Expected 5, got -1");
  ASSERT_EQ(report.cases.size(), 1U);
  EXPECT_EQ(report.cases[0].status, CaseStatus::Mismatch);
}

TEST_F(ValidatorRuns, StringsAreShownBareInMismatches) {
  const auto report = check("def solution(s):\n    return s.upper()\n",
                            {{"solution", {Value::str("abc")}, {}}}, {Value::str("abc")});
  ASSERT_EQ(report.feedback.size(), 2U);
  EXPECT_EQ(report.feedback[1], "Test 1: Expected abc, got ABC");
}

TEST_F(ValidatorRuns, RuntimeErrorIsReportedAndLaterCasesRun) {
  const auto report = check("def solution(a, b):\n    return a // b\n",
                            {{"solution", {Value::integer(1), Value::integer(0)}, {}},
                             {"solution", {Value::integer(6), Value::integer(3)}, {}}},
                            {Value::integer(0), Value::integer(2)});
  ASSERT_EQ(report.feedback.size(), 3U);
  EXPECT_EQ(report.feedback[0], "1/2 test cases passed");
  EXPECT_EQ(report.feedback[1].rfind("Test 1: Execution error: ZeroDivisionError: ", 0), 0U);
  EXPECT_EQ(report.feedback[2], "Test 2: Passed");
  EXPECT_EQ(report.cases[0].status, CaseStatus::Failed);
}

TEST_F(ValidatorRuns, TimeoutDoesNotStopTheSuite) {
  const std::string source =
      "def solution(n):\n"
      "    while n == 0:\n"
      "        pass\n"
      "    return n\n";
  const auto report = check(source,
                            {{"solution", {Value::integer(0)}, {}}, {"solution", {Value::integer(4)}, {}}},
                            {Value::integer(0), Value::integer(4)}, 1.0);
  ASSERT_EQ(report.feedback.size(), 3U);
  EXPECT_EQ(report.feedback[0], "1/2 test cases passed");
  EXPECT_EQ(report.feedback[1], "Test 1: Execution timeout (1s exceeded)");
  EXPECT_EQ(report.feedback[2], "Test 2: Passed");
  EXPECT_EQ(report.cases[0].status, CaseStatus::TimedOut);
  EXPECT_EQ(metrics_.counter("runs.timeout"), 1U);
}

TEST_F(ValidatorRuns, MissingTargetIsACaseFailure) {
  const auto report = check(kAdd, {{"missing", {}, {}}}, {Value::none()});
  ASSERT_EQ(report.feedback.size(), 2U);
  EXPECT_EQ(report.feedback[1], "Test 1: Cannot resolve target 'missing': name 'missing' is not defined");
}

TEST_F(ValidatorRuns, ModuleLevelCrashReportsTraceback) {
  const auto report = check("raise RuntimeError('boom')\n", {{"solution", {}, {}}}, {Value::none()});
  ASSERT_EQ(report.feedback.size(), 2U);
  EXPECT_NE(report.feedback[1].find("RuntimeError: boom"), std::string::npos);
}

TEST_F(ValidatorRuns, NumericAndContainerEqualityIsLenient) {
  const std::string source =
      "def half(x):\n"
      "    return x / 2\n"
      "def counts(xs):\n"
      "    out = {}\n"
      "    for x in reversed(xs):\n"
      "        out[x] = out.get(x, 0) + 1\n"
      "    return out\n"
      "def pair():\n"
      "    return (1, 'a')\n";
  const auto report = check(source,
                            {{"half", {Value::integer(4)}, {}},
                             {"counts", {Value::list({Value::str("a"), Value::str("b"), Value::str("a")})}, {}},
                             {"pair", {}, {}}},
                            {Value::integer(2),
                             Value::dict({{Value::str("a"), Value::integer(2)}, {Value::str("b"), Value::integer(1)}}),
                             Value::tuple({Value::integer(1), Value::str("a")})});
  EXPECT_TRUE(report.allPassed) << report.feedback[0];
}

TEST_F(ValidatorRuns, UndecodableResultIsComparedAsText) {
  const std::string source =
      "class Thing:\n"
      "    def __repr__(self):\n"
      "        return '<Thing>'\n"
      "def solution():\n"
      "    return Thing()\n";
  const auto report = check(source, {{"solution", {}, {}}}, {Value::str("<Thing>")});
  EXPECT_TRUE(report.allPassed) << report.feedback[0];
}

TEST_F(ValidatorRuns, MethodOnConstructedInstance) {
  const std::string source =
      "class Scaler:\n"
      "    def __init__(self, factor):\n"
      "        self.factor = factor\n"
      "    def apply(self, x, offset=0):\n"
      "        return x * self.factor + offset\n";
  const auto report = check(source,
                            {{"Scaler(3).apply", {Value::integer(2)}, {{"offset", Value::integer(1)}}}},
                            {Value::integer(7)});
  EXPECT_TRUE(report.allPassed) << report.feedback[0];
}

TEST_F(ValidatorRuns, SystemExitInAnyStageStillReportsTheCase) {
  const std::string source =
      "class S:\n"
      "    def __init__(self):\n"
      "        raise SystemExit(0)\n"
      "    def f(self):\n"
      "        return 1\n"
      "class Stubborn:\n"
      "    def __repr__(self):\n"
      "        raise SystemExit(3)\n"
      "def g():\n"
      "    return Stubborn()\n"
      "def h():\n"
      "    exit(0)\n";
  const auto report = check(source, {{"S().f", {}, {}}, {"g", {}, {}}, {"h", {}, {}}},
                            {Value::integer(1), Value::none(), Value::none()});
  ASSERT_EQ(report.feedback.size(), 4U);
  EXPECT_EQ(report.feedback[1], "Test 1: Cannot resolve target 'S().f': 0");
  EXPECT_EQ(report.feedback[2], "Test 2: Repr error: SystemExit: 3");
  EXPECT_EQ(report.feedback[3], "Test 3: Execution error: SystemExit: 0");
}

TEST_F(ValidatorRuns, IntegersBeyondInt64CompareExactly) {
  const std::string source =
      "def factorial(n):\n"
      "    out = 1\n"
      "    for k in range(2, n + 1):\n"
      "        out *= k\n"
      "    return out\n"
      "def wrapped(n):\n"
      "    return [factorial(n), -factorial(n)]\n";
  const Value big = Value::integer("15511210043330985984000000", false);
  const auto report = check(source,
                            {{"factorial", {Value::integer(25)}, {}},
                             {"wrapped", {Value::integer(25)}, {}},
                             {"factorial", {Value::integer(25)}, {}}},
                            {big, Value::list({big, Value::integer("15511210043330985984000000", true)}),
                             Value::integer("15511210043330985984000001", false)});
  ASSERT_EQ(report.feedback.size(), 4U);
  EXPECT_EQ(report.feedback[1], "Test 1: Passed");
  EXPECT_EQ(report.feedback[2], "Test 2: Passed");
  EXPECT_EQ(report.feedback[3], "Test 3: Expected 15511210043330985984000001, got 15511210043330985984000000");
}

TEST_F(ValidatorRuns, RepeatedRunsOfTheSameCaseAgree) {
  const sandbox::ProcessRunner runner(budget_, opts_);
  const TestCase testCase{"solution", {Value::integer(20), Value::integer(22)}, {}};
  const std::string program = harness::Synthesize(kAdd, testCase);
  std::vector<Value> results;
  for (int round = 0; round < 2; ++round) {
    const auto outcome = protocol::ParseOutcome(runner.run(program, 10.0), 10.0);
    ASSERT_TRUE(outcome.isSuccess()) << outcome.text();
    Value decoded;
    std::string err;
    ASSERT_TRUE(codec::DecodeLiteral(outcome.text(), decoded, err)) << err;
    results.push_back(decoded);
  }
  EXPECT_EQ(results[0], results[1]);
  EXPECT_EQ(results[0], Value::integer(42));
}

TEST_F(ValidatorRuns, EmptyTargetRunsTheSourceOnly) {
  const auto report = check("x = sum(range(10))\n", {{"", {}, {}}}, {Value::str("OK")});
  EXPECT_TRUE(report.allPassed) << report.feedback[0];
}

TEST_F(ValidatorRuns, ArgumentsCannotInjectCode) {
  const auto report = check("def solution(s):\n    return s\n",
                            {{"solution", {Value::str("__import__('os').getcwd()")}, {}}},
                            {Value::str("__import__('os').getcwd()")});
  EXPECT_TRUE(report.allPassed) << report.feedback[0];
}

TEST_F(ValidatorRuns, BundledCatalogSolutionsPassTheirOwnTests) {
  const auto catalog = challenge::Catalog::load(std::string(PYJUDGE_TEST_DATA_DIR) + "/challenges.json");
  ASSERT_FALSE(catalog.challenges().empty());
  for (const auto& ch : catalog.challenges()) {
    const auto report = check(ch.solution, ch.testCases, ch.expected);
    EXPECT_TRUE(report.allPassed) << ch.id << ": " << (report.feedback.size() > 1 ? report.feedback[1] : report.feedback[0]);
  }
}
