/***
 * Name: pyjudge::ast expressions
 * Purpose: The expression subset used for target chains and repr() output:
 *   names, attributes, calls, signed numbers and literal displays.
 */
#pragma once

#include "ast/Node.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyjudge::ast {

using ExprList = std::vector<std::unique_ptr<Expr>>;

struct Name final : Expr {
  std::string id;
  explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
};

struct Attribute final : Expr {
  std::unique_ptr<Expr> value;
  std::string attr;
  Attribute(std::unique_ptr<Expr> v, std::string a)
      : Expr(NodeKind::Attribute), value(std::move(v)), attr(std::move(a)) {}
};

struct KeywordArg {
  std::string name;
  std::unique_ptr<Expr> value;
};

struct Call final : Expr {
  std::unique_ptr<Expr> callee;
  ExprList args;
  std::vector<KeywordArg> keywords; // source order
  explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
};

enum class Sign { Minus, Plus };

// -x / +x; repr() only ever produces these in front of numbers.
struct Signed final : Expr {
  Sign sign;
  std::unique_ptr<Expr> operand;
  Signed(const Sign s, std::unique_ptr<Expr> v) : Expr(NodeKind::Signed), sign(s), operand(std::move(v)) {}
};

template <typename T, NodeKind K>
struct Scalar final : Expr {
  T value;
  explicit Scalar(T v) : Expr(K), value(std::move(v)) {}
};

using IntLiteral = Scalar<std::string, NodeKind::IntLiteral>; // canonical base-10 digits, any size
using FloatLiteral = Scalar<double, NodeKind::FloatLiteral>;
using BoolLiteral = Scalar<bool, NodeKind::BoolLiteral>;
using StringLiteral = Scalar<std::string, NodeKind::StringLiteral>; // decoded UTF-8
using BytesLiteral = Scalar<std::string, NodeKind::BytesLiteral>;   // raw octets

struct NoneLiteral final : Expr {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

template <NodeKind K>
struct Display final : Expr {
  ExprList elements;
  Display() : Expr(K) {}
};

using TupleLiteral = Display<NodeKind::TupleLiteral>;
using ListLiteral = Display<NodeKind::ListLiteral>;
using SetLiteral = Display<NodeKind::SetLiteral>;

struct DictLiteral final : Expr {
  std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Expr>>> items; // source order
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};

} // namespace pyjudge::ast
