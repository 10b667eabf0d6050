/***
 * Name: pyjudge::codec (literal value codec)
 * Purpose: Move values across the harness boundary as Python literal text.
 * Inputs:
 *   - Values to embed into generated programs
 *   - repr() text produced by the interpreter
 * Outputs:
 *   - Python source literals, decoded Values, equality verdicts, display text
 * Theory of Operation:
 *   EncodeLiteral emits text the interpreter evaluates back to an equal value
 *   (strings fully escaped, non-finite floats spelled as float('inf')).
 *   DecodeLiteral accepts what ast.literal_eval accepts for builtin
 *   containers and scalars, using the shared Python front end. Equal follows
 *   Python ==: 1 == 1.0 == True, list != tuple, dict and set order-free.
 */
#pragma once

#include <ostream>
#include <string>
#include "codec/Value.h"

namespace pyjudge::ast {
struct Expr;
}

namespace pyjudge::codec {

/*** EncodeLiteral: Python source text evaluating to an equal value. */
std::string EncodeLiteral(const Value& value);

/*** DecodeLiteral: Parse repr()-style text into out. Return false with err on failure. */
bool DecodeLiteral(const std::string& text, Value& out, std::string& err);

/*** ExprToValue: Convert a parsed literal expression. Return false with err when it is not a literal. */
bool ExprToValue(const ast::Expr& expr, Value& out, std::string& err);

/*** Equal: Python structural equality. */
bool Equal(const Value& lhs, const Value& rhs);

/*** Repr: Python repr() of the value. */
std::string Repr(const Value& value);

/*** Str: Python str() of the value (a top-level string is shown bare). */
std::string Str(const Value& value);

inline bool operator==(const Value& lhs, const Value& rhs) { return Equal(lhs, rhs); }
inline bool operator!=(const Value& lhs, const Value& rhs) { return !Equal(lhs, rhs); }

inline std::ostream& operator<<(std::ostream& out, const Value& value) { return out << Repr(value); }

} // namespace pyjudge::codec
