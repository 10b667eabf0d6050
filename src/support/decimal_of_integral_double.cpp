/***
 * Name: pyjudge::support::DecimalOfIntegralDouble
 * Purpose: Spell an integral double exactly (1e30 is 1000000000000000019884624838656).
 * Theory of Operation: Split into a 53-bit mantissa and a power of two, then
 *   double the mantissa's digits once per remaining exponent step.
 */
#include "pyjudge/support/decimal.h"

#include <cmath>
#include <cstdint>
#include <string>

namespace pyjudge::support {

auto DecimalOfIntegralDouble(double number) -> std::string {
  constexpr int kMantissaBits = 53;
  int exponent = 0;
  const double fraction = std::frexp(std::fabs(number), &exponent);
  auto mantissa = static_cast<std::uint64_t>(std::ldexp(fraction, kMantissaBits));
  exponent -= kMantissaBits;
  // Integral input: the bits shifted out here are zero
  for (; exponent < 0 && mantissa != 0; ++exponent) { mantissa >>= 1U; }
  std::string digits = std::to_string(mantissa);
  for (; exponent > 0; --exponent) { MultiplyAddDecimal(digits, 2, 0); }
  if (number < 0 && digits != "0") { digits.insert(digits.begin(), '-'); }
  return digits;
}

}  // namespace pyjudge::support
