/***
 * Name: test_codec_equal
 * Purpose: Equal follows Python == semantics across kinds.
 */
#include <gtest/gtest.h>
#include <cmath>
#include "codec/Codec.h"

using namespace pyjudge::codec;

TEST(CodecEqual, NumericTower) {
  EXPECT_EQ(Value::integer(1), Value::floating(1.0));
  EXPECT_EQ(Value::boolean(true), Value::integer(1));
  EXPECT_EQ(Value::boolean(false), Value::floating(0.0));
  EXPECT_NE(Value::integer(1), Value::floating(1.5));
  EXPECT_NE(Value::floating(std::nan("")), Value::floating(std::nan("")));
  EXPECT_NE(Value::integer(9007199254740993), Value::floating(9007199254740992.0));
}

TEST(CodecEqual, BigIntsCompareByExactValue) {
  const Value twoTo64 = Value::integer("18446744073709551616", false);
  EXPECT_EQ(twoTo64, Value::integer("18446744073709551616", false));
  EXPECT_EQ(twoTo64, Value::floating(18446744073709551616.0));
  EXPECT_NE(twoTo64, Value::integer("18446744073709551616", true));
  EXPECT_NE(twoTo64, Value::floating(18446744073709551616.0 + 4096.0));
  EXPECT_NE(Value::integer("1000000000000000000000000000000", false), Value::floating(1e30));
  EXPECT_EQ(Value::integer("1000000000000000019884624838656", false), Value::floating(1e30));
  EXPECT_NE(twoTo64, Value::floating(INFINITY));
  EXPECT_NE(twoTo64, Value::boolean(true));
  EXPECT_EQ(Value::integer("42", true), Value::integer(-42));
}

TEST(CodecEqual, KindsDoNotCrossOver) {
  EXPECT_NE(Value::list({Value::integer(1)}), Value::tuple({Value::integer(1)}));
  EXPECT_NE(Value::str("1"), Value::integer(1));
  EXPECT_NE(Value::str("a"), Value::bytes("a"));
  EXPECT_NE(Value::none(), Value::integer(0));
  EXPECT_EQ(Value::none(), Value::none());
}

TEST(CodecEqual, DictsAndSetsIgnoreOrder) {
  const Value lhs = Value::dict({{Value::str("a"), Value::integer(1)}, {Value::str("b"), Value::integer(2)}});
  const Value rhs = Value::dict({{Value::str("b"), Value::floating(2.0)}, {Value::str("a"), Value::integer(1)}});
  EXPECT_EQ(lhs, rhs);
  EXPECT_EQ(Value::set({Value::integer(1), Value::integer(2)}), Value::set({Value::integer(2), Value::integer(1)}));
  EXPECT_NE(Value::set({Value::integer(1)}), Value::set({Value::integer(1), Value::integer(2)}));
}

TEST(CodecEqual, NestedSequences) {
  const Value lhs = Value::list({Value::tuple({Value::integer(1), Value::str("x")}), Value::list({})});
  const Value rhs = Value::list({Value::tuple({Value::floating(1.0), Value::str("x")}), Value::list({})});
  EXPECT_EQ(lhs, rhs);
  EXPECT_NE(lhs, Value::list({Value::tuple({Value::integer(1), Value::str("x")})}));
}
