/**
 * @file
 * @brief Declarations for the codec's literal formatting helpers.
 */
#pragma once

#include <string>

#include "codec/Value.h"

namespace pyjudge::codec::detail {

/** Shortest round-tripping float text, formatted the way Python's repr() does. */
std::string formatFloat(double number);

/** Quote a UTF-8 string as a Python str literal, choosing quotes like repr(). */
std::string quoteStr(const std::string& text);

/** Quote raw bytes as a Python bytes literal (b'...'). */
std::string quoteBytes(const std::string& data);

/** Append the literal for value; forSource spells non-finite floats as float('...'). */
void appendLiteral(std::string& out, const Value& value, bool forSource);

} // namespace pyjudge::codec::detail
