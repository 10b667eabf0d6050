/***
 * Name: test_harness
 * Purpose: Target validation and the shape of the generated driver program.
 */
#include <gtest/gtest.h>
#include <string>
#include "codec/Value.h"
#include "harness/Harness.h"
#include "pyjudge/exceptions/target_error.h"

using namespace pyjudge;
using codec::Value;

static std::string targetError(const std::string& text) {
  try {
    (void)harness::ParseTarget(text);
  } catch (const exceptions::TargetError& ex) {
    return ex.what();
  }
  ADD_FAILURE() << "expected TargetError for " << text;
  return {};
}

TEST(HarnessTarget, ChainsRenderCanonically) {
  EXPECT_EQ(harness::ParseTarget("solution").rendered, "solution");
  EXPECT_EQ(harness::ParseTarget("Solution().process").rendered, "Solution().process");
  EXPECT_EQ(harness::ParseTarget("Solution(3,  mode=\"x\").process").rendered, "Solution(3, mode='x').process");
  EXPECT_EQ(harness::ParseTarget("pkg.helper").key, "pkg.helper");
  EXPECT_EQ(harness::ParseTarget("f(15511210043330985984000000, -9223372036854775808)").rendered,
            "f(15511210043330985984000000, -9223372036854775808)");
}

TEST(HarnessTarget, InvalidTargetsName) {
  EXPECT_EQ(targetError("items[0]"), "Cannot resolve target 'items[0]': subscripts are not supported");
  EXPECT_EQ(targetError("(1, 2)"), "Cannot resolve target '(1, 2)': expected a name, attribute access or call");
  EXPECT_EQ(targetError("f(g())"), "Cannot resolve target 'f(g())': call arguments must be literals");
  EXPECT_EQ(targetError("f(--9223372036854775808)"),
            "Cannot resolve target 'f(--9223372036854775808)': call arguments must be literals");
  EXPECT_NE(targetError("x + 1").find("Cannot resolve target 'x + 1'"), std::string::npos);
}

TEST(HarnessSynthesize, EmbedsSourceBetweenMarkers) {
  harness::TestCase tc;
  tc.target = "solution";
  tc.args = {Value::integer(2), Value::integer(3)};
  const std::string program = harness::Synthesize("def solution(a, b):\n    return a + b", tc);
  const auto begin = program.find(harness::kSourceBeginMarker);
  const auto body = program.find("def solution(a, b):\n    return a + b\n");
  const auto end = program.find(harness::kSourceEndMarker);
  ASSERT_NE(begin, std::string::npos);
  ASSERT_NE(body, std::string::npos);
  ASSERT_NE(end, std::string::npos);
  EXPECT_LT(begin, body);
  EXPECT_LT(body, end);
  EXPECT_NE(program.find("_PYJUDGE_TARGET = 'solution'\n"), std::string::npos);
  EXPECT_NE(program.find("'solution': lambda: solution,"), std::string::npos);
  EXPECT_NE(program.find("_PYJUDGE_ARGS = (2, 3, )\n"), std::string::npos);
  EXPECT_NE(program.find("_PYJUDGE_KWARGS = {}\n"), std::string::npos);
}

TEST(HarnessSynthesize, ArgumentsAreLiteralsNotCode) {
  harness::TestCase tc;
  tc.target = "solution";
  tc.args = {Value::str("__import__('os').system('x')"), Value::list({Value::floating(0.5), Value::none()})};
  tc.kwargs = {{"scale", Value::integer(10)}, {"label", Value::str("it's")}};
  const std::string program = harness::Synthesize("", tc);
  EXPECT_NE(program.find("_PYJUDGE_ARGS = (\"__import__('os').system('x')\", [0.5, None], )\n"), std::string::npos);
  EXPECT_NE(program.find("_PYJUDGE_KWARGS = {'scale': 10, 'label': \"it's\"}\n"), std::string::npos);
}

TEST(HarnessSynthesize, EmptyTargetRunsSourceOnly) {
  const std::string program = harness::Synthesize("x = 1\n", harness::TestCase{});
  EXPECT_NE(program.find("_PYJUDGE_TARGET = None\n"), std::string::npos);
  EXPECT_NE(program.find("_PYJUDGE_TARGETS = {\n}\n"), std::string::npos);
}

TEST(HarnessSynthesize, InvalidTargetThrowsBeforeAnythingRuns) {
  harness::TestCase tc;
  tc.target = "a[1]";
  EXPECT_THROW((void)harness::Synthesize("a = [1, 2]\n", tc), exceptions::TargetError);
}
