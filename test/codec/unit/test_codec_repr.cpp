/***
 * Name: test_codec_repr
 * Purpose: Repr/Str/EncodeLiteral produce the text Python itself would.
 */
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include "codec/Codec.h"

using namespace pyjudge::codec;

TEST(CodecRepr, Scalars) {
  EXPECT_EQ(Repr(Value::none()), "None");
  EXPECT_EQ(Repr(Value::boolean(true)), "True");
  EXPECT_EQ(Repr(Value::integer(-42)), "-42");
  EXPECT_EQ(Repr(Value::str("hi")), "'hi'");
  EXPECT_EQ(Repr(Value::bytes("a\x01")), "b'a\\x01'");
}

TEST(CodecRepr, FloatsMatchPythonRepr) {
  EXPECT_EQ(Repr(Value::floating(1.0)), "1.0");
  EXPECT_EQ(Repr(Value::floating(0.1)), "0.1");
  EXPECT_EQ(Repr(Value::floating(-2.5)), "-2.5");
  EXPECT_EQ(Repr(Value::floating(1e16)), "1e+16");
  EXPECT_EQ(Repr(Value::floating(1e-5)), "1e-05");
  EXPECT_EQ(Repr(Value::floating(0.0001)), "0.0001");
  EXPECT_EQ(Repr(Value::floating(123456789.125)), "123456789.125");
  EXPECT_EQ(Repr(Value::floating(std::numeric_limits<double>::infinity())), "inf");
  EXPECT_EQ(Repr(Value::floating(std::nan(""))), "nan");
}

TEST(CodecRepr, StringQuotingFollowsRepr) {
  EXPECT_EQ(Repr(Value::str("it's")), "\"it's\"");
  EXPECT_EQ(Repr(Value::str("say \"x\"")), "'say \"x\"'");
  EXPECT_EQ(Repr(Value::str("both ' and \"")), "'both \\' and \"'");
  EXPECT_EQ(Repr(Value::str("line\nbreak\t\\")), "'line\\nbreak\\t\\\\'");
  EXPECT_EQ(Repr(Value::str("caf\xc3\xa9")), "'caf\xc3\xa9'");
  EXPECT_EQ(Repr(Value::str(std::string("\x00", 1))), "'\\x00'");
}

TEST(CodecRepr, Containers) {
  EXPECT_EQ(Repr(Value::list({Value::integer(1), Value::str("a")})), "[1, 'a']");
  EXPECT_EQ(Repr(Value::tuple({Value::integer(1)})), "(1,)");
  EXPECT_EQ(Repr(Value::tuple({})), "()");
  EXPECT_EQ(Repr(Value::set({})), "set()");
  EXPECT_EQ(Repr(Value::set({Value::integer(3)})), "{3}");
  EXPECT_EQ(Repr(Value::dict({{Value::str("k"), Value::list({})}})), "{'k': []}");
}

TEST(CodecRepr, StrShowsTopLevelStringsBare) {
  EXPECT_EQ(Str(Value::str("Processed: test")), "Processed: test");
  EXPECT_EQ(Str(Value::list({Value::str("x")})), "['x']");
  EXPECT_EQ(Str(Value::integer(5)), "5");
}

TEST(CodecRepr, EncodeSpellsNonFiniteFloatsAsCalls) {
  EXPECT_EQ(EncodeLiteral(Value::floating(-std::numeric_limits<double>::infinity())), "float('-inf')");
  EXPECT_EQ(EncodeLiteral(Value::list({Value::floating(std::nan(""))})), "[float('nan')]");
  EXPECT_EQ(EncodeLiteral(Value::floating(2.0)), "2.0");
}
