/***
 * Name: pyjudge::codec::DecodeLiteral / ExprToValue
 * Purpose: Decode repr()-style result text into a Value.
 * Inputs:
 *   - text: last result string reported by the harness
 * Outputs:
 *   - out: decoded value on success
 *   - err: reason on failure (caller falls back to comparing raw text)
 * Theory of Operation:
 *   The text is parsed as a single expression by the shared front end and
 *   converted node by node. Accepted: None/bool/int/float/str/bytes
 *   constants, unary +/- on numbers, list/tuple/set/dict displays and
 *   set(). Names, attributes and other calls are rejected like
 *   ast.literal_eval rejects them; unhashable dict keys and set members too.
 */
#include "codec/Codec.h"
#include "ast/Nodes.h"
#include "parser/Parser.h"
#include "pyjudge/exceptions/parse_error.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pyjudge::codec {

namespace {
class DecodeFailure {
 public:
  explicit DecodeFailure(std::string msg) : msg_(std::move(msg)) {}
  const std::string& message() const { return msg_; }

 private:
  std::string msg_;
};

bool hashable(const Value& value) {
  switch (value.kind()) {
    case ValueKind::List:
    case ValueKind::Dict:
    case ValueKind::Set:
      return false;
    case ValueKind::Tuple:
      for (const auto& item : value.items()) {
        if (!hashable(item)) { return false; }
      }
      return true;
    default:
      return true;
  }
}

void requireHashable(const Value& value) {
  if (!hashable(value)) {
    throw DecodeFailure(std::string("unhashable type: '") + to_string(value.kind()) + "'");
  }
}

Value convert(const ast::Expr& expr);

std::vector<Value> convertAll(const std::vector<std::unique_ptr<ast::Expr>>& elements) {
  std::vector<Value> items;
  items.reserve(elements.size());
  for (const auto& element : elements) { items.push_back(convert(*element)); }
  return items;
}

Value convertSigned(const ast::Signed& unary) {
  const bool negate = unary.sign == ast::Sign::Minus;
  switch (unary.operand->kind) {
    case ast::NodeKind::IntLiteral:
      return Value::integer(static_cast<const ast::IntLiteral&>(*unary.operand).value, negate);
    case ast::NodeKind::FloatLiteral: {
      const auto number = static_cast<const ast::FloatLiteral&>(*unary.operand).value;
      return Value::floating(negate ? -number : number);
    }
    default:
      throw DecodeFailure("malformed node or string: unary operator on a non-number");
  }
}

Value convert(const ast::Expr& expr) {
  switch (expr.kind) {
    case ast::NodeKind::NoneLiteral: return Value::none();
    case ast::NodeKind::BoolLiteral: return Value::boolean(static_cast<const ast::BoolLiteral&>(expr).value);
    case ast::NodeKind::IntLiteral: return Value::integer(static_cast<const ast::IntLiteral&>(expr).value, false);
    case ast::NodeKind::FloatLiteral: return Value::floating(static_cast<const ast::FloatLiteral&>(expr).value);
    case ast::NodeKind::StringLiteral: return Value::str(static_cast<const ast::StringLiteral&>(expr).value);
    case ast::NodeKind::BytesLiteral: return Value::bytes(static_cast<const ast::BytesLiteral&>(expr).value);
    case ast::NodeKind::Signed: return convertSigned(static_cast<const ast::Signed&>(expr));
    case ast::NodeKind::ListLiteral: return Value::list(convertAll(static_cast<const ast::ListLiteral&>(expr).elements));
    case ast::NodeKind::TupleLiteral: return Value::tuple(convertAll(static_cast<const ast::TupleLiteral&>(expr).elements));
    case ast::NodeKind::SetLiteral: {
      auto members = convertAll(static_cast<const ast::SetLiteral&>(expr).elements);
      std::vector<Value> unique;
      for (auto& member : members) {
        requireHashable(member);
        bool seen = false;
        for (const auto& kept : unique) {
          if (Equal(kept, member)) { seen = true; break; }
        }
        if (!seen) { unique.push_back(std::move(member)); }
      }
      return Value::set(std::move(unique));
    }
    case ast::NodeKind::DictLiteral: {
      std::vector<std::pair<Value, Value>> entries;
      for (const auto& [keyExpr, valueExpr] : static_cast<const ast::DictLiteral&>(expr).items) {
        Value key = convert(*keyExpr);
        requireHashable(key);
        Value item = convert(*valueExpr);
        bool replaced = false;
        // Later duplicates overwrite, keeping the first key's position
        for (auto& entry : entries) {
          if (Equal(entry.first, key)) {
            entry.second = std::move(item);
            replaced = true;
            break;
          }
        }
        if (!replaced) { entries.emplace_back(std::move(key), std::move(item)); }
      }
      return Value::dict(std::move(entries));
    }
    case ast::NodeKind::Call: {
      const auto& call = static_cast<const ast::Call&>(expr);
      if (call.callee->kind == ast::NodeKind::Name &&
          static_cast<const ast::Name&>(*call.callee).id == "set" && call.args.empty() && call.keywords.empty()) {
        return Value::set({});
      }
      throw DecodeFailure("malformed node or string: call");
    }
    default:
      throw DecodeFailure(std::string("malformed node or string: ") + ast::to_string(expr.kind));
  }
}
} // namespace

bool ExprToValue(const ast::Expr& expr, Value& out, std::string& err) {
  try {
    out = convert(expr);
    return true;
  } catch (const DecodeFailure& failure) {
    err = failure.message();
  }
  return false;
}

bool DecodeLiteral(const std::string& text, Value& out, std::string& err) {
  std::unique_ptr<ast::Expr> expr;
  try {
    expr = parse::Parser::parseExpressionText(text, "<result>");
  } catch (const exceptions::ParseError& ex) {
    err = ex.detail();
    return false;
  }
  return ExprToValue(*expr, out, err);
}

} // namespace pyjudge::codec
