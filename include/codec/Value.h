/***
 * Name: pyjudge::codec::Value
 * Purpose: Structured model of the Python values exchanged with a submission
 *   (arguments in, repr() results out, expected outcomes from a catalog).
 * Inputs: Factory functions per kind
 * Outputs: Immutable value trees
 * Theory of Operation:
 *   A tagged node: scalar payloads live in dedicated members, containers keep
 *   ordered children. Dict entries and set members keep insertion order; the
 *   equality in codec/Codec.h treats them order-independently. Ints outside
 *   the int64 range keep their exact signed decimal text instead.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyjudge::codec {

enum class ValueKind { None, Bool, Int, Float, Str, Bytes, List, Tuple, Dict, Set };

const char* to_string(ValueKind kind);

class Value {
 public:
  Value() = default; // None

  static Value none() { return Value{}; }
  static Value boolean(bool flag);
  static Value integer(std::int64_t number);
  // Canonical base-10 magnitude; narrows to integer() whenever it fits.
  static Value integer(std::string_view digits, bool negative);
  static Value floating(double number);
  static Value str(std::string text);
  static Value bytes(std::string data);
  static Value list(std::vector<Value> items);
  static Value tuple(std::vector<Value> items);
  static Value set(std::vector<Value> items);
  static Value dict(std::vector<std::pair<Value, Value>> entries);

  ValueKind kind() const { return kind_; }
  bool isNumeric() const { return kind_ == ValueKind::Bool || kind_ == ValueKind::Int || kind_ == ValueKind::Float; }

  bool asBool() const { return flag_; }
  // Meaningless for big ints; use decimal().
  std::int64_t asInt() const { return int_; }
  bool isBig() const { return big_; }
  std::string decimal() const;
  double asFloat() const { return float_; }
  // Str and Bytes payload
  const std::string& text() const { return text_; }
  // List, Tuple and Set members
  const std::vector<Value>& items() const { return items_; }
  const std::vector<std::pair<Value, Value>>& entries() const { return entries_; }

 private:
  explicit Value(ValueKind kind) : kind_(kind) {}

  ValueKind kind_{ValueKind::None};
  bool flag_{false};
  bool big_{false};
  std::int64_t int_{0};
  double float_{0.0};
  std::string text_{};
  std::vector<Value> items_{};
  std::vector<std::pair<Value, Value>> entries_{};
};

} // namespace pyjudge::codec
