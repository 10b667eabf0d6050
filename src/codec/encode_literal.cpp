/***
 * Name: pyjudge::codec::EncodeLiteral
 * Purpose: Serialize a value as Python source for embedding in a harness.
 */
#include "codec/Codec.h"
#include "codec/ReprInternals.h"

#include <string>

namespace pyjudge::codec {

std::string EncodeLiteral(const Value& value) {
  std::string out;
  detail::appendLiteral(out, value, /*forSource=*/true);
  return out;
}

} // namespace pyjudge::codec
