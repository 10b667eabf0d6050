/***
 * Name: pyjudge::codec::Equal
 * Purpose: Python == over decoded values.
 * Theory of Operation:
 *   bool, int and float compare by numeric value (int/float exactly, no
 *   rounding through double); big ints compare by exact decimal text. Sequences compare element-wise and only
 *   against the same kind. Dicts and sets compare as unordered collections
 *   whose keys/members are matched with this same equality.
 */
#include "codec/Codec.h"
#include "pyjudge/support/decimal.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace pyjudge::codec {

namespace {
bool intEqualsFloat(std::int64_t whole, double number) {
  if (!std::isfinite(number) || std::trunc(number) != number) { return false; }
  constexpr double kTwo63 = 9223372036854775808.0;
  if (number >= kTwo63 || number < -kTwo63) { return false; }
  return static_cast<std::int64_t>(number) == whole;
}

// Beyond int64 only exact text can decide; a float matches when it spells the same integer.
std::string exactDecimal(const Value& value) {
  if (value.kind() != ValueKind::Float) { return value.decimal(); }
  const double number = value.asFloat();
  if (!std::isfinite(number) || std::trunc(number) != number) { return {}; }
  return support::DecimalOfIntegralDouble(number);
}

bool numericEqual(const Value& lhs, const Value& rhs) {
  if (lhs.isBig() || rhs.isBig()) { return exactDecimal(lhs) == exactDecimal(rhs); }
  const bool lhsFloat = lhs.kind() == ValueKind::Float;
  const bool rhsFloat = rhs.kind() == ValueKind::Float;
  if (lhsFloat && rhsFloat) { return lhs.asFloat() == rhs.asFloat(); }
  if (lhsFloat) { return intEqualsFloat(rhs.asInt(), lhs.asFloat()); }
  if (rhsFloat) { return intEqualsFloat(lhs.asInt(), rhs.asFloat()); }
  return lhs.asInt() == rhs.asInt();
}

bool sequenceEqual(const std::vector<Value>& lhs, const std::vector<Value>& rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (!Equal(lhs[i], rhs[i])) { return false; }
  }
  return true;
}

bool setEqual(const std::vector<Value>& lhs, const std::vector<Value>& rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (const auto& member : lhs) {
    bool found = false;
    for (const auto& other : rhs) {
      if (Equal(member, other)) {
        found = true;
        break;
      }
    }
    if (!found) { return false; }
  }
  return true;
}

bool dictEqual(const Value& lhs, const Value& rhs) {
  if (lhs.entries().size() != rhs.entries().size()) { return false; }
  for (const auto& [key, item] : lhs.entries()) {
    bool found = false;
    for (const auto& [otherKey, otherItem] : rhs.entries()) {
      if (Equal(key, otherKey)) {
        if (!Equal(item, otherItem)) { return false; }
        found = true;
        break;
      }
    }
    if (!found) { return false; }
  }
  return true;
}
} // namespace

bool Equal(const Value& lhs, const Value& rhs) {
  if (lhs.isNumeric() && rhs.isNumeric()) { return numericEqual(lhs, rhs); }
  if (lhs.kind() != rhs.kind()) { return false; }
  switch (lhs.kind()) {
    case ValueKind::None: return true;
    case ValueKind::Str:
    case ValueKind::Bytes: return lhs.text() == rhs.text();
    case ValueKind::List:
    case ValueKind::Tuple: return sequenceEqual(lhs.items(), rhs.items());
    case ValueKind::Set: return setEqual(lhs.items(), rhs.items());
    case ValueKind::Dict: return dictEqual(lhs, rhs);
    default: return false;
  }
}

} // namespace pyjudge::codec
