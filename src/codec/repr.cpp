/***
 * Name: pyjudge::codec::Repr / Str
 * Purpose: Python repr()/str() display text for feedback lines.
 */
#include "codec/Codec.h"
#include "codec/ReprInternals.h"

#include <string>

namespace pyjudge::codec {

std::string Repr(const Value& value) {
  std::string out;
  detail::appendLiteral(out, value, /*forSource=*/false);
  return out;
}

std::string Str(const Value& value) {
  if (value.kind() == ValueKind::Str) { return value.text(); }
  return Repr(value);
}

} // namespace pyjudge::codec
