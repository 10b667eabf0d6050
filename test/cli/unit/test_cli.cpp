/***
 * Name: test_cli
 * Purpose: Basic CLI option parsing and negative cases.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"

using namespace pyjudge::cli;

TEST(CLI, HelpAndInput) {
  const char* argv[] = {"pyjudge", "-h", "--id=core_001", "solution.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.showHelp);
  EXPECT_EQ(o.challengeId, "core_001");
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "solution.py");
}

TEST(CLI, ConflictingModes) {
  const char* argv[] = {"pyjudge", "--list", "--self-check"};
  Options o;
  testing::internal::CaptureStderr();
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_NE(testing::internal::GetCapturedStderr().find("mutually exclusive"), std::string::npos);
}

TEST(CLI, ShowTakesAChallengeAndExcludesOtherModes) {
  const char* ok[] = {"pyjudge", "--show=core_001"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(ok), o));
  EXPECT_EQ(o.showId, "core_001");

  const char* empty[] = {"pyjudge", "--show="};
  Options e;
  testing::internal::CaptureStderr();
  EXPECT_FALSE(ParseArgs(2, const_cast<char**>(empty), e));
  EXPECT_NE(testing::internal::GetCapturedStderr().find("--show needs a challenge id"), std::string::npos);

  const char* both[] = {"pyjudge", "--show=core_001", "--list"};
  Options b;
  testing::internal::CaptureStderr();
  EXPECT_FALSE(ParseArgs(3, const_cast<char**>(both), b));
  EXPECT_NE(testing::internal::GetCapturedStderr().find("mutually exclusive"), std::string::npos);
}

TEST(CLI, UnknownOption) {
  const char* argv[] = {"pyjudge", "--unknown"};
  Options o;
  testing::internal::CaptureStderr();
  EXPECT_FALSE(ParseArgs(2, const_cast<char**>(argv), o));
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "pyjudge: unknown option '--unknown'\n");
}

TEST(CLI, MetricsJsonFlag) {
  const char* argv[] = {"pyjudge", "--metrics-json", "file.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.metricsJson);
  EXPECT_FALSE(o.metrics);
  ASSERT_EQ(o.inputs.size(), 1u);
}

TEST(CLI, EngineSettingsStayRaw) {
  const char* argv[] = {"pyjudge", "--timeout=0.5", "--max-concurrent=2", "--python=/usr/bin/python3",
                        "--tmpdir=/var/tmp", "--memory-mb=128", "a.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(7, const_cast<char**>(argv), o));
  EXPECT_EQ(o.timeout.value_or(""), "0.5");
  EXPECT_EQ(o.maxConcurrent.value_or(""), "2");
  EXPECT_EQ(o.python.value_or(""), "/usr/bin/python3");
  EXPECT_EQ(o.tmpDir.value_or(""), "/var/tmp");
  EXPECT_EQ(o.memoryMb.value_or(""), "128");
}

TEST(CLI, ReportJsonWithAndWithoutFile) {
  const char* bare[] = {"pyjudge", "--report-json", "a.py"};
  Options o1;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(bare), o1));
  EXPECT_TRUE(o1.reportJson);
  EXPECT_TRUE(o1.reportFile.empty());

  const char* withFile[] = {"pyjudge", "--report-json=out.json", "a.py"};
  Options o2;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(withFile), o2));
  EXPECT_TRUE(o2.reportJson);
  EXPECT_EQ(o2.reportFile, "out.json");
}

TEST(CLI, ColorValues) {
  const char* always[] = {"pyjudge", "--color=always"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(always), o));
  EXPECT_EQ(o.color, ColorMode::Always);

  const char* bad[] = {"pyjudge", "--color=sometimes"};
  Options o2;
  testing::internal::CaptureStderr();
  EXPECT_FALSE(ParseArgs(2, const_cast<char**>(bad), o2));
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "pyjudge: invalid --color value 'sometimes'\n");
}
