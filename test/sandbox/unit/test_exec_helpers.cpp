/***
 * Name: test_exec_helpers
 * Purpose: Capture bounding, child environment and interpreter lookup.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "sandbox/detail/exec.h"

using namespace pyjudge::sandbox::detail;

TEST(CaptureBuffer, KeepsNewestBytes) {
  CaptureBuffer buf(5);
  buf.append("abc", 3);
  EXPECT_FALSE(buf.truncated);
  buf.append("defgh", 5);
  EXPECT_TRUE(buf.truncated);
  EXPECT_EQ(buf.text, "defgh");
}

TEST(CaptureBuffer, ZeroLimitIsUnbounded) {
  CaptureBuffer buf(0);
  const std::string big(4096, 'x');
  buf.append(big.data(), big.size());
  EXPECT_FALSE(buf.truncated);
  EXPECT_EQ(buf.text.size(), big.size());
}

TEST(ChildEnvironment, ClearsPythonPathAndAddsHygiene) {
  const char* env[] = {"HOME=/home/u", "PYTHONPATH=/evil", "PYTHONSTARTUP=/x.py", "PATH=/usr/bin", nullptr};
  const auto out = BuildChildEnvironment(env);
  auto has = [&](const std::string& entry) { return std::find(out.begin(), out.end(), entry) != out.end(); };
  EXPECT_TRUE(has("HOME=/home/u"));
  EXPECT_TRUE(has("PATH=/usr/bin"));
  EXPECT_TRUE(has("PYTHONPATH="));
  EXPECT_TRUE(has("PYTHONDONTWRITEBYTECODE=1"));
  EXPECT_TRUE(has("PYTHONIOENCODING=utf-8"));
  EXPECT_FALSE(has("PYTHONPATH=/evil"));
  EXPECT_FALSE(has("PYTHONSTARTUP=/x.py"));
}

TEST(ToExecVector, PointsIntoStringsAndEndsWithNull) {
  std::vector<std::string> args{"python3", "prog.py"};
  auto argv = ToExecVector(args);
  ASSERT_EQ(argv.size(), 3U);
  EXPECT_EQ(argv[0], args[0].data());
  EXPECT_STREQ(argv[1], "prog.py");
  EXPECT_EQ(argv[2], nullptr);

  std::vector<std::string> none;
  const auto empty = ToExecVector(none);
  ASSERT_EQ(empty.size(), 1U);
  EXPECT_EQ(empty[0], nullptr);
}

TEST(ResolveExecutable, FindsShellOnPath) {
  std::string path;
  std::string err;
  ASSERT_TRUE(ResolveExecutable("sh", path, err)) << err;
  EXPECT_EQ(path.back(), 'h');
  EXPECT_NE(path.find('/'), std::string::npos);
}

TEST(ResolveExecutable, ReportsMissingInterpreters) {
  std::string path;
  std::string err;
  EXPECT_FALSE(ResolveExecutable("pyjudge-no-such-interpreter", path, err));
  EXPECT_NE(err.find("not found on PATH"), std::string::npos);
  EXPECT_FALSE(ResolveExecutable("/nonexistent/python3", path, err));
  EXPECT_NE(err.find("not executable"), std::string::npos);
  EXPECT_FALSE(ResolveExecutable("", path, err));
}
