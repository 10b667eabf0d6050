/***
 * Name: test_parser_expressions
 * Purpose: Literal displays and call chains parsed by parseExpressionText.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "pyjudge/exceptions/parse_error.h"

using namespace pyjudge;

static std::unique_ptr<ast::Expr> expr(const std::string& text) {
  return parse::Parser::parseExpressionText(text, "<expr>");
}

TEST(ParserExpressions, Scalars) {
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(*expr("0x10")).value, "16");
  EXPECT_DOUBLE_EQ(static_cast<const ast::FloatLiteral&>(*expr("2.5e1")).value, 25.0);
  EXPECT_TRUE(static_cast<const ast::BoolLiteral&>(*expr("True")).value);
  EXPECT_EQ(expr("None")->kind, ast::NodeKind::NoneLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*expr("'a' \"b\"")).value, "ab");
  EXPECT_EQ(static_cast<const ast::BytesLiteral&>(*expr("b'\\x00\\xff'")).value, std::string("\x00\xff", 2));
}

TEST(ParserExpressions, StringEscapes) {
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*expr("'tab\\there'")).value, "tab\there");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*expr("'\\u00e9'")).value, "\xc3\xa9");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*expr("r'\\n'")).value, "\\n");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*expr("'\\q'")).value, "\\q");
}

TEST(ParserExpressions, IntLiteralsKeepEveryDigit) {
  auto digits = [](const std::string& text) { return static_cast<const ast::IntLiteral&>(*expr(text)).value; };
  EXPECT_EQ(digits("9223372036854775808"), "9223372036854775808");
  EXPECT_EQ(digits("1_000_000_000_000_000_000_000"), "1000000000000000000000000");
  EXPECT_EQ(digits("0x_ff"), "255");
  EXPECT_EQ(digits("0o_7"), "7");
  EXPECT_EQ(digits("0b_1"), "1");
  EXPECT_EQ(digits("0xFFFFFFFFFFFFFFFFFF"), "4722366482869645213695");
  EXPECT_EQ(digits("000"), "0");
  EXPECT_THROW((void)expr("0123"), exceptions::ParseError);

  // The sign stays a separate node, even on the most negative int64.
  const auto node = expr("-9223372036854775808");
  ASSERT_EQ(node->kind, ast::NodeKind::Signed);
  const auto& operand = *static_cast<const ast::Signed&>(*node).operand;
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(operand).value, "9223372036854775808");
}

TEST(ParserExpressions, Containers) {
  const auto tuple = expr("(1, 'a', [2, 3], {4: 5})");
  ASSERT_EQ(tuple->kind, ast::NodeKind::TupleLiteral);
  const auto& items = static_cast<const ast::TupleLiteral&>(*tuple).elements;
  ASSERT_EQ(items.size(), 4u);
  EXPECT_EQ(items[2]->kind, ast::NodeKind::ListLiteral);
  EXPECT_EQ(items[3]->kind, ast::NodeKind::DictLiteral);

  EXPECT_EQ(expr("(1,)")->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(expr("(1)")->kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(expr("{1, 2}")->kind, ast::NodeKind::SetLiteral);
  EXPECT_EQ(expr("{}")->kind, ast::NodeKind::DictLiteral);
  EXPECT_EQ(expr("1, 2")->kind, ast::NodeKind::TupleLiteral);
}

TEST(ParserExpressions, CallChains) {
  const auto node = expr("Solution(3, mode='x').process");
  ASSERT_EQ(node->kind, ast::NodeKind::Attribute);
  const auto& attr = static_cast<const ast::Attribute&>(*node);
  EXPECT_EQ(attr.attr, "process");
  ASSERT_EQ(attr.value->kind, ast::NodeKind::Call);
  const auto& call = static_cast<const ast::Call&>(*attr.value);
  ASSERT_EQ(call.args.size(), 1u);
  ASSERT_EQ(call.keywords.size(), 1u);
  EXPECT_EQ(call.keywords[0].name, "mode");
  EXPECT_EQ(static_cast<const ast::Name&>(*call.callee).id, "Solution");
}

TEST(ParserExpressions, Rejections) {
  EXPECT_THROW((void)expr(""), exceptions::ParseError);
  EXPECT_THROW((void)expr("a[0]"), exceptions::ParseError);
  EXPECT_THROW((void)expr("f(*args)"), exceptions::ParseError);
  EXPECT_THROW((void)expr("f(a=1, 2)"), exceptions::ParseError);
  EXPECT_THROW((void)expr("1 2"), exceptions::ParseError);
  EXPECT_THROW((void)expr("3j"), exceptions::ParseError);
  EXPECT_THROW((void)expr("f'{x}'"), exceptions::ParseError);
  EXPECT_THROW((void)expr("'a' b'b'"), exceptions::ParseError);
}
