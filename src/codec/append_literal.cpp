/***
 * Name: pyjudge::codec::detail::appendLiteral
 * Purpose: Recursive literal writer behind Repr and EncodeLiteral.
 */
#include "codec/ReprInternals.h"

#include <cmath>
#include <string>

namespace pyjudge::codec::detail {

namespace {
void appendItems(std::string& out, const Value& value, bool forSource) {
  bool first = true;
  for (const auto& item : value.items()) {
    if (!first) { out += ", "; }
    first = false;
    appendLiteral(out, item, forSource);
  }
}

void appendFloat(std::string& out, double number, bool forSource) {
  if (forSource && !std::isfinite(number)) {
    // inf/nan are names, not literals
    out += "float('";
    out += formatFloat(number);
    out += "')";
    return;
  }
  out += formatFloat(number);
}
} // namespace

void appendLiteral(std::string& out, const Value& value, bool forSource) {
  switch (value.kind()) {
    case ValueKind::None: out += "None"; return;
    case ValueKind::Bool: out += value.asBool() ? "True" : "False"; return;
    case ValueKind::Int: out += value.decimal(); return;
    case ValueKind::Float: appendFloat(out, value.asFloat(), forSource); return;
    case ValueKind::Str: out += quoteStr(value.text()); return;
    case ValueKind::Bytes: out += quoteBytes(value.text()); return;
    case ValueKind::List:
      out += "[";
      appendItems(out, value, forSource);
      out += "]";
      return;
    case ValueKind::Tuple:
      out += "(";
      appendItems(out, value, forSource);
      if (value.items().size() == 1) { out += ","; }
      out += ")";
      return;
    case ValueKind::Set:
      if (value.items().empty()) {
        out += "set()";
        return;
      }
      out += "{";
      appendItems(out, value, forSource);
      out += "}";
      return;
    case ValueKind::Dict: {
      out += "{";
      bool first = true;
      for (const auto& [key, item] : value.entries()) {
        if (!first) { out += ", "; }
        first = false;
        appendLiteral(out, key, forSource);
        out += ": ";
        appendLiteral(out, item, forSource);
      }
      out += "}";
      return;
    }
  }
}

} // namespace pyjudge::codec::detail
