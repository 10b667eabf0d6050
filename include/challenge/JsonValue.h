/***
 * Name: pyjudge::challenge::JsonToValue
 * Purpose: Convert a catalog JSON value into a codec::Value.
 * Inputs: json node; out; err
 * Outputs: true on success; false with err naming the problem
 */
#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "codec/Value.h"

namespace pyjudge::challenge {

inline constexpr const char* kLiteralKey = "$literal";

bool JsonToValue(const nlohmann::ordered_json& node, codec::Value& out, std::string& err);

} // namespace pyjudge::challenge
