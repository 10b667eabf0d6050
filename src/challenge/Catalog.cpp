/***
 * Name: pyjudge::challenge::Catalog (impl)
 * Purpose: Parse and validate the JSON challenge catalog.
 */
#include "challenge/Challenge.h"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "challenge/JsonValue.h"
#include "pyjudge/exceptions/config_error.h"
#include "pyjudge/exceptions/file_read_error.h"
#include "pyjudge/support/fs.h"

namespace pyjudge::challenge {

namespace {
using Json = nlohmann::ordered_json;

[[noreturn]] void bad(const std::string& where, const std::string& why) {
  throw exceptions::ConfigError(where + ": " + why);
}

std::string requireString(const Json& obj, const char* key, const std::string& where) {
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) { bad(where, std::string("'") + key + "' must be a string"); }
  return it->get<std::string>();
}

std::string optionalString(const Json& obj, const char* key, const std::string& where) {
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) { return {}; }
  if (!it->is_string()) { bad(where, std::string("'") + key + "' must be a string"); }
  return it->get<std::string>();
}

codec::Value toValue(const Json& node, const std::string& where) {
  codec::Value value;
  std::string err;
  if (!JsonToValue(node, value, err)) { bad(where, err); }
  return value;
}

void readTest(const Json& test, const std::string& where, Challenge& out) {
  if (!test.is_object()) { bad(where, "test must be an object"); }
  harness::TestCase tc;
  tc.target = optionalString(test, "function", where);
  if (const auto args = test.find("args"); args != test.end()) {
    if (!args->is_array()) { bad(where, "'args' must be an array"); }
    for (std::size_t i = 0; i < args->size(); ++i) {
      tc.args.push_back(toValue((*args)[i], where + ".args[" + std::to_string(i) + "]"));
    }
  }
  if (const auto kwargs = test.find("kwargs"); kwargs != test.end()) {
    if (!kwargs->is_object()) { bad(where, "'kwargs' must be an object"); }
    for (const auto& [name, value] : kwargs->items()) {
      tc.kwargs.emplace_back(name, toValue(value, where + ".kwargs." + name));
    }
  }
  const auto expected = test.find("expected");
  if (expected == test.end()) { bad(where, "'expected' is required"); }
  out.testCases.push_back(std::move(tc));
  out.expected.push_back(toValue(*expected, where + ".expected"));
}

Challenge readChallenge(const Json& node, const std::string& where) {
  if (!node.is_object()) { bad(where, "challenge must be an object"); }
  Challenge ch;
  ch.id = requireString(node, "id", where);
  if (ch.id.empty()) { bad(where, "'id' must not be empty"); }
  ch.title = optionalString(node, "title", where);
  ch.description = optionalString(node, "description", where);
  ch.module = optionalString(node, "module", where);
  ch.topic = optionalString(node, "concept", where);
  ch.templateSource = optionalString(node, "template", where);
  ch.solution = optionalString(node, "solution", where);
  if (const auto diff = node.find("difficulty"); diff != node.end()) {
    if (!diff->is_number_integer()) { bad(where, "'difficulty' must be an integer"); }
    ch.difficulty = diff->get<int>();
  }
  if (const auto hints = node.find("hints"); hints != node.end()) {
    if (!hints->is_array()) { bad(where, "'hints' must be an array"); }
    for (const auto& hint : *hints) {
      if (!hint.is_string()) { bad(where, "hints must be strings"); }
      ch.hints.push_back(hint.get<std::string>());
    }
  }
  if (const auto tests = node.find("tests"); tests != node.end()) {
    if (!tests->is_array()) { bad(where, "'tests' must be an array"); }
    for (std::size_t i = 0; i < tests->size(); ++i) {
      readTest((*tests)[i], where + ".tests[" + std::to_string(i) + "]", ch);
    }
  }
  return ch;
}
} // namespace

Catalog Catalog::fromJsonText(const std::string& text, const std::string& origin) {
  const Json root = Json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (root.is_discarded()) { bad(origin, "not valid JSON"); }
  if (!root.is_object()) { bad(origin, "top level must be an object"); }
  const auto list = root.find("challenges");
  if (list == root.end() || !list->is_array()) { bad(origin, "'challenges' must be an array"); }

  Catalog catalog;
  for (std::size_t i = 0; i < list->size(); ++i) {
    Challenge ch = readChallenge((*list)[i], origin + ": challenges[" + std::to_string(i) + "]");
    if (catalog.find(ch.id) != nullptr) { bad(origin, "duplicate challenge id '" + ch.id + "'"); }
    catalog.challenges_.push_back(std::move(ch));
  }
  return catalog;
}

Catalog Catalog::load(const std::string& path) {
  std::string text;
  std::string err;
  if (!support::ReadFile(path, text, err)) {
    throw exceptions::FileReadError(err);
  }
  return fromJsonText(text, path);
}

const Challenge* Catalog::find(const std::string& id) const {
  for (const auto& ch : challenges_) {
    if (ch.id == id) { return &ch; }
  }
  return nullptr;
}

} // namespace pyjudge::challenge
