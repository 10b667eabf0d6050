/***
 * Name: test_usage
 * Purpose: Validate Usage() content exposes documented flags.
 */
#include <gtest/gtest.h>
#include "cli/Usage.h"

using namespace pyjudge::cli;

TEST(CLI_Usage, ContainsExpectedFlags) {
  auto u = Usage();
  EXPECT_NE(u.find("pyjudge [options] <solution.py>"), std::string::npos);
  EXPECT_NE(u.find("--challenges=<file>"), std::string::npos);
  EXPECT_NE(u.find("--id=<challenge-id>"), std::string::npos);
  EXPECT_NE(u.find("--list"), std::string::npos);
  EXPECT_NE(u.find("--screen-only"), std::string::npos);
  EXPECT_NE(u.find("--self-check"), std::string::npos);
  EXPECT_NE(u.find("--timeout=<s>"), std::string::npos);
  EXPECT_NE(u.find("--report-json[=<file>]"), std::string::npos);
  EXPECT_NE(u.find("--metrics-json"), std::string::npos);
  EXPECT_NE(u.find("--color=<mode>"), std::string::npos);
  EXPECT_NE(u.find("--                      End of options"), std::string::npos);
}
