/***
 * Name: test_analysis
 * Purpose: Syntax diagnostics, PEP8-lite scoring and the performance score.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "analysis/Analysis.h"

using namespace pyjudge::analysis;

TEST(CheckSyntax, ValidModule) {
  const auto report = CheckSyntax("def f(x):\n    return x + 1\n", "ok.py");
  EXPECT_TRUE(report.ok);
  EXPECT_TRUE(report.diagnostics.empty());
  EXPECT_TRUE(report.feedback().empty());
}

TEST(CheckSyntax, RadixLiteralsWithLeadingUnderscore) {
  const auto report = CheckSyntax("MASK = 0x_ff\nMODE = 0o_7\nBIT = 0b_1\nBIG = 0x_ffff_ffff_ffff_ffff_ffff\n", "ok.py");
  EXPECT_TRUE(report.ok) << (report.diagnostics.empty() ? "" : report.diagnostics[0].message);
}

TEST(CheckSyntax, ReportsLineOfFirstError) {
  const auto report = CheckSyntax("x = 1\ny = $\n", "bad.py");
  EXPECT_FALSE(report.ok);
  ASSERT_EQ(report.diagnostics.size(), 1U);
  EXPECT_EQ(report.diagnostics[0].line, 2);
  EXPECT_EQ(report.diagnostics[0].file, "bad.py");
  ASSERT_EQ(report.feedback().size(), 1U);
  EXPECT_EQ(report.feedback()[0], "Syntax Error on line 2: invalid character '$'");
}

TEST(CheckSyntax, UnclosedBracketAtEndOfInput) {
  const auto report = CheckSyntax("print(1,\n", "bad.py");
  EXPECT_FALSE(report.ok);
  ASSERT_FALSE(report.feedback().empty());
  EXPECT_EQ(report.feedback()[0], "Syntax Error on line 1: '(' was never closed");
}

TEST(CheckStyle, CleanSourceScoresOne) {
  const auto report = CheckStyle("def f():\n    return 1\n");
  EXPECT_DOUBLE_EQ(report.score, 1.0);
  ASSERT_EQ(report.feedback.size(), 1U);
  EXPECT_EQ(report.feedback[0], "PEP8 check OK");
}

TEST(CheckStyle, LongLinesCostATenthEachUpToThree) {
  const std::string longLine(80, 'x');
  const std::string exact(79, 'y');
  const auto one = CheckStyle(exact + "\n" + longLine + "\n");
  EXPECT_NEAR(one.score, 0.9, 1e-9);
  ASSERT_EQ(one.feedback.size(), 1U);
  EXPECT_EQ(one.feedback[0], "Lines [2] exceed 79 characters");

  std::string many;
  for (int i = 0; i < 5; ++i) { many += longLine + "\n"; }
  const auto five = CheckStyle(many);
  EXPECT_NEAR(five.score, 0.7, 1e-9);
  EXPECT_EQ(five.feedback[0], "Lines [1, 2, 3] exceed 79 characters and more...");
}

TEST(CheckStyle, LengthCountsCodePoints) {
  std::string line = "s = '";
  for (int i = 0; i < 73; ++i) { line += "\xc3\xa9"; } // 73 x e-acute
  line += "'";
  const auto report = CheckStyle(line + "\n");
  EXPECT_DOUBLE_EQ(report.score, 1.0);
}

TEST(CheckStyle, TrailingWhitespaceCostsOnce) {
  const auto report = CheckStyle("x = 1 \r\ny = 2\t\r\nz = 3\n");
  EXPECT_NEAR(report.score, 0.95, 1e-9);
  ASSERT_EQ(report.feedback.size(), 1U);
  EXPECT_EQ(report.feedback[0], "Trailing whitespace on lines [1, 2]");
}

TEST(CheckStyle, PenaltiesCombine) {
  const std::string longLine(100, 'x');
  const auto report = CheckStyle(longLine + " \n");
  EXPECT_NEAR(report.score, 0.85, 1e-9);
  ASSERT_EQ(report.feedback.size(), 2U);
  EXPECT_EQ(report.feedback[0], "Lines [1] exceed 79 characters");
  EXPECT_EQ(report.feedback[1], "Trailing whitespace on lines [1]");
}

TEST(PerformanceScore, LinearOverTwoSeconds) {
  using Seconds = std::chrono::duration<double>;
  EXPECT_DOUBLE_EQ(PerformanceScore(Seconds(0.0)), 1.0);
  EXPECT_DOUBLE_EQ(PerformanceScore(Seconds(1.0)), 0.5);
  EXPECT_DOUBLE_EQ(PerformanceScore(Seconds(2.0)), 0.0);
  EXPECT_DOUBLE_EQ(PerformanceScore(Seconds(10.0)), 0.0);
  EXPECT_DOUBLE_EQ(PerformanceScore(std::chrono::milliseconds(500)), 0.75);
}
