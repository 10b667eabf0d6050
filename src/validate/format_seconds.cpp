/***
 * Name: pyjudge::validate::FormatSeconds
 * Purpose: Render a limit the way a person typed it: 5 -> "5", 0.5 -> "0.5".
 */
#include "validate/Validator.h"

#include <sstream>
#include <string>

namespace pyjudge::validate {

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << seconds;
  return oss.str();
}

} // namespace pyjudge::validate
