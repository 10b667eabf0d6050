/***
 * Name: pyjudge::challenge::JsonToValue
 * Purpose: Map catalog JSON onto the codec value model.
 * Theory of Operation: Recursive over the node type. Unsigned integers above
 *   INT64_MAX become exact big ints; JSON itself cannot carry larger ones
 *   without rounding, so those go through "$literal". An object whose only
 *   key is "$literal" holds a Python literal decoded by codec::DecodeLiteral.
 */
#include "challenge/JsonValue.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "codec/Codec.h"

namespace pyjudge::challenge {

bool JsonToValue(const nlohmann::ordered_json& node, codec::Value& out, std::string& err) { // NOLINT(misc-no-recursion)
  switch (node.type()) {
    case nlohmann::ordered_json::value_t::null:
      out = codec::Value::none();
      return true;
    case nlohmann::ordered_json::value_t::boolean:
      out = codec::Value::boolean(node.get<bool>());
      return true;
    case nlohmann::ordered_json::value_t::number_integer:
      out = codec::Value::integer(node.get<std::int64_t>());
      return true;
    case nlohmann::ordered_json::value_t::number_unsigned:
      out = codec::Value::integer(std::to_string(node.get<std::uint64_t>()), false);
      return true;
    case nlohmann::ordered_json::value_t::number_float:
      out = codec::Value::floating(node.get<double>());
      return true;
    case nlohmann::ordered_json::value_t::string:
      out = codec::Value::str(node.get<std::string>());
      return true;
    case nlohmann::ordered_json::value_t::array: {
      std::vector<codec::Value> items;
      items.reserve(node.size());
      for (const auto& element : node) {
        codec::Value item;
        if (!JsonToValue(element, item, err)) { return false; }
        items.push_back(std::move(item));
      }
      out = codec::Value::list(std::move(items));
      return true;
    }
    case nlohmann::ordered_json::value_t::object: {
      if (node.size() == 1 && node.contains(kLiteralKey)) {
        const auto& literal = node.at(kLiteralKey);
        if (!literal.is_string()) {
          err = std::string(kLiteralKey) + " must be a string";
          return false;
        }
        std::string decodeErr;
        if (!codec::DecodeLiteral(literal.get<std::string>(), out, decodeErr)) {
          err = "bad literal " + literal.dump() + ": " + decodeErr;
          return false;
        }
        return true;
      }
      std::vector<std::pair<codec::Value, codec::Value>> entries;
      entries.reserve(node.size());
      for (const auto& [key, element] : node.items()) {
        codec::Value value;
        if (!JsonToValue(element, value, err)) { return false; }
        entries.emplace_back(codec::Value::str(key), std::move(value));
      }
      out = codec::Value::dict(std::move(entries));
      return true;
    }
    case nlohmann::ordered_json::value_t::binary:
    case nlohmann::ordered_json::value_t::discarded:
      break;
  }
  err = "unsupported JSON value";
  return false;
}

} // namespace pyjudge::challenge
