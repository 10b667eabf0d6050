/***
 * Name: pyjudge::codec::Value (factories)
 * Purpose: Construct tagged values.
 */
#include "codec/Value.h"
#include "pyjudge/support/decimal.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyjudge::codec {

const char* to_string(ValueKind kind) {
  switch (kind) {
    case ValueKind::None: return "NoneType";
    case ValueKind::Bool: return "bool";
    case ValueKind::Int: return "int";
    case ValueKind::Float: return "float";
    case ValueKind::Str: return "str";
    case ValueKind::Bytes: return "bytes";
    case ValueKind::List: return "list";
    case ValueKind::Tuple: return "tuple";
    case ValueKind::Dict: return "dict";
    case ValueKind::Set: return "set";
  }
  return "unknown";
}

Value Value::boolean(bool flag) {
  Value value(ValueKind::Bool);
  value.flag_ = flag;
  value.int_ = flag ? 1 : 0;
  return value;
}

Value Value::integer(std::int64_t number) {
  Value value(ValueKind::Int);
  value.int_ = number;
  return value;
}

Value Value::integer(std::string_view digits, bool negative) {
  std::int64_t number = 0;
  if (support::DecimalToInt64(digits, negative, number)) { return integer(number); }
  Value value(ValueKind::Int);
  value.big_ = true;
  value.text_ = negative ? "-" : "";
  value.text_.append(digits);
  return value;
}

std::string Value::decimal() const { return big_ ? text_ : std::to_string(int_); }

Value Value::floating(double number) {
  Value value(ValueKind::Float);
  value.float_ = number;
  return value;
}

Value Value::str(std::string text) {
  Value value(ValueKind::Str);
  value.text_ = std::move(text);
  return value;
}

Value Value::bytes(std::string data) {
  Value value(ValueKind::Bytes);
  value.text_ = std::move(data);
  return value;
}

Value Value::list(std::vector<Value> items) {
  Value value(ValueKind::List);
  value.items_ = std::move(items);
  return value;
}

Value Value::tuple(std::vector<Value> items) {
  Value value(ValueKind::Tuple);
  value.items_ = std::move(items);
  return value;
}

Value Value::set(std::vector<Value> items) {
  Value value(ValueKind::Set);
  value.items_ = std::move(items);
  return value;
}

Value Value::dict(std::vector<std::pair<Value, Value>> entries) {
  Value value(ValueKind::Dict);
  value.entries_ = std::move(entries);
  return value;
}

} // namespace pyjudge::codec
