/***
 * Name: pyjudge::support::MultiplyAddDecimal
 * Purpose: Schoolbook multiply-accumulate over a base-10 digit string.
 */
#include "pyjudge/support/decimal.h"

#include <string>

namespace pyjudge::support {

auto MultiplyAddDecimal(std::string& digits, unsigned factor, unsigned addend) -> void {
  unsigned carry = addend;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    const unsigned cell = static_cast<unsigned>(*it - '0') * factor + carry;
    *it = static_cast<char>('0' + cell % 10);
    carry = cell / 10;
  }
  for (; carry > 0; carry /= 10) { digits.insert(digits.begin(), static_cast<char>('0' + carry % 10)); }
  const auto first = digits.find_first_not_of('0');
  if (first == std::string::npos) {
    digits = "0";
  } else if (first > 0) {
    digits.erase(0, first);
  }
}

}  // namespace pyjudge::support
