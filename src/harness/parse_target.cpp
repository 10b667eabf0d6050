/***
 * Name: pyjudge::harness::ParseTarget
 * Purpose: Turn a target such as "solution" or "Solution(3).process" into a
 *   validated, canonically rendered expression.
 * Theory of Operation:
 *   The chain must start at a bare name; each link is an attribute access or
 *   a call whose arguments are literals (rendered through the codec, so the
 *   generated text never contains submitted expression syntax).
 */
#include "harness/Harness.h"

#include <memory>
#include <string>

#include "ast/Nodes.h"
#include "codec/Codec.h"
#include "parser/Parser.h"
#include "pyjudge/exceptions/parse_error.h"
#include "pyjudge/exceptions/target_error.h"

namespace pyjudge::harness {

namespace {
[[noreturn]] void invalid(const std::string& text, const std::string& why) {
  throw exceptions::TargetError("Cannot resolve target '" + text + "': " + why);
}

std::string renderLiteral(const std::string& text, const ast::Expr& expr) {
  codec::Value value;
  std::string err;
  if (!codec::ExprToValue(expr, value, err)) { invalid(text, "call arguments must be literals"); }
  return codec::EncodeLiteral(value);
}

std::string renderChain(const std::string& text, const ast::Expr& expr) {
  switch (expr.kind) {
    case ast::NodeKind::Name:
      return static_cast<const ast::Name&>(expr).id;
    case ast::NodeKind::Attribute: {
      const auto& attr = static_cast<const ast::Attribute&>(expr);
      return renderChain(text, *attr.value) + "." + attr.attr;
    }
    case ast::NodeKind::Call: {
      const auto& call = static_cast<const ast::Call&>(expr);
      std::string out = renderChain(text, *call.callee) + "(";
      bool first = true;
      for (const auto& arg : call.args) {
        if (!first) { out += ", "; }
        first = false;
        out += renderLiteral(text, *arg);
      }
      for (const auto& keyword : call.keywords) {
        if (!first) { out += ", "; }
        first = false;
        out += keyword.name + "=" + renderLiteral(text, *keyword.value);
      }
      return out + ")";
    }
    default:
      invalid(text, "expected a name, attribute access or call");
  }
}
} // namespace

Target ParseTarget(const std::string& text) {
  std::unique_ptr<ast::Expr> expr;
  try {
    expr = parse::Parser::parseExpressionText(text, "<target>");
  } catch (const exceptions::ParseError& ex) {
    invalid(text, ex.detail());
  }
  return Target{text, renderChain(text, *expr)};
}

} // namespace pyjudge::harness
