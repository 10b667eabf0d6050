/***
 * Name: pyjudge::support (decimal)
 * Purpose: Exact integer arithmetic on base-10 digit strings, for Python
 *   ints that do not fit 64 bits.
 * Theory of Operation: Magnitudes are canonical digit strings: no sign, no
 *   leading zeros, "0" for zero.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace pyjudge::support {

/*** MultiplyAddDecimal: digits = digits * factor + addend, kept canonical. */
void MultiplyAddDecimal(std::string& digits, unsigned factor, unsigned addend);

/*** DecimalToInt64: Signed value of a canonical magnitude; false when it does not fit. */
bool DecimalToInt64(std::string_view digits, bool negative, std::int64_t& out);

/*** DecimalOfIntegralDouble: Exact signed base-10 text of a finite, integral double. */
std::string DecimalOfIntegralDouble(double number);

}  // namespace pyjudge::support
