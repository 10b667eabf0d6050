/***
 * Name: test_parseargs_edges
 * Purpose: Edge cases for ParseArgs: stdin, end of options, repeated inputs.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"
#include "cli/ParseArgsInternals.h"

using namespace pyjudge::cli;

TEST(ParseArgsEdges, LoneDashIsStdin) {
  const char* argv[] = {"pyjudge", "-"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "-");
}

TEST(ParseArgsEdges, DoubleDashEndsOptions) {
  const char* argv[] = {"pyjudge", "--verbose", "--", "--list", "-x.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.verbose);
  EXPECT_FALSE(o.list);
  ASSERT_EQ(o.inputs.size(), 2u);
  EXPECT_EQ(o.inputs[0], "--list");
  EXPECT_EQ(o.inputs[1], "-x.py");
}

TEST(ParseArgsEdges, InputsAreCollectedInOrder) {
  const char* argv[] = {"pyjudge", "a.py", "--screen-only", "b.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.screenOnly);
  ASSERT_EQ(o.inputs.size(), 2u);
  EXPECT_EQ(o.inputs[1], "b.py");
}

TEST(ParseArgsEdges, EmptyChallengesValueIsKept) {
  const char* argv[] = {"pyjudge", "--challenges=", "a.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.challengesPath.empty());
}

TEST(ParseArgsHelpers, UnknownOptionDetection) {
  EXPECT_FALSE(detail::isUnknownOptionArg("-"));
  EXPECT_FALSE(detail::isUnknownOptionArg("file.py"));
  EXPECT_TRUE(detail::isUnknownOptionArg("-x"));
  EXPECT_TRUE(detail::isUnknownOptionArg("--nope"));
}

TEST(ParseArgsHelpers, ModeConflicts) {
  Options o;
  EXPECT_FALSE(detail::hasConflictingModes(o));
  o.screenOnly = true;
  EXPECT_FALSE(detail::hasConflictingModes(o));
  o.list = true;
  EXPECT_TRUE(detail::hasConflictingModes(o));
}

TEST(ParseArgsHelpers, ColorSpellings) {
  EXPECT_EQ(detail::parseColorValue("never"), ColorMode::Never);
  EXPECT_EQ(detail::parseColorValue("auto"), ColorMode::Auto);
  EXPECT_FALSE(detail::parseColorValue("ALWAYS").has_value());
}
