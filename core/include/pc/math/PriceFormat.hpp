#pragma once
#include <string>

namespace pc {

// Display formatting for prices and market caps. Rounding matches the
// browser number formatting the chart was designed against: fixed decimals
// round half away from zero on the exact decimal expansion of the double.

// 0 -> "0"; >= 10000 -> "12,346"; >= 100 -> "150.50"; >= 1 -> "1.2346";
// below 1 -> "0.0(5)1234" (count of leading zero digits, then 4 digits),
// falling back to 4 significant digits.
std::string formatPrice(double price);

// 0 -> "$0"; "$2.50B", "$12.30M", "$4.5K", "$999.99".
std::string formatMarketCap(double value);

// Fixed-point with `digits` decimals.
std::string toFixed(double value, int digits);

// `precision` significant digits; exponent form when the decimal exponent
// is below -6 or at least `precision` ("1.235e-7", "1.235e+5").
std::string toPrecision(double value, int precision);

// Rounded to an integer and grouped with commas ("1,234,568").
std::string groupThousands(double value);

} // namespace pc
