#include "pc/math/PriceFormat.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace pc {

static std::string printfDouble(const char* fmt, int prec, double v) {
  int n = std::snprintf(nullptr, 0, fmt, prec, v);
  if (n <= 0) return {};
  std::vector<char> buf(static_cast<std::size_t>(n) + 1);
  std::snprintf(buf.data(), buf.size(), fmt, prec, v);
  return std::string(buf.data(), static_cast<std::size_t>(n));
}

static std::string nonFinite(double v) {
  if (std::isnan(v)) return "NaN";
  return v > 0 ? "Infinity" : "-Infinity";
}

// Adds one unit in the last place of a string of decimal digits.
static void incrementDigits(std::string& digits) {
  for (std::size_t i = digits.size(); i-- > 0; ) {
    if (digits[i] == '9') {
      digits[i] = '0';
    } else {
      digits[i]++;
      return;
    }
  }
  digits.insert(digits.begin(), '1');
}

std::string toFixed(double value, int digits) {
  if (!std::isfinite(value)) return nonFinite(value);
  if (digits < 0) digits = 0;

  const bool negative = value < 0;
  const double x = std::fabs(value);

  // glibc prints the exact binary expansion, so 30 guard digits expose ties.
  std::string s = printfDouble("%.*f", digits + 30, x);
  const std::size_t dot = s.find('.');
  std::string intPart = s.substr(0, dot);
  std::string frac = dot == std::string::npos ? std::string() : s.substr(dot + 1);
  frac.resize(static_cast<std::size_t>(digits) + 1, '0');

  std::string kept = intPart + frac.substr(0, static_cast<std::size_t>(digits));
  if (frac[static_cast<std::size_t>(digits)] >= '5') incrementDigits(kept);

  std::string out = negative ? "-" : "";
  const std::size_t intLen = kept.size() - static_cast<std::size_t>(digits);
  out += kept.substr(0, intLen);
  if (digits > 0) {
    out += '.';
    out += kept.substr(intLen);
  }
  return out;
}

std::string toPrecision(double value, int precision) {
  if (!std::isfinite(value)) return nonFinite(value);
  if (precision < 1) precision = 1;

  std::string sign = value < 0 ? "-" : "";
  const double x = std::fabs(value);

  if (x == 0.0) {
    std::string out = "0";
    if (precision > 1) out += "." + std::string(static_cast<std::size_t>(precision - 1), '0');
    return sign + out;
  }

  // "d.ddde[+-]xx" gives the rounded mantissa digits and decimal exponent.
  const std::string e = printfDouble("%.*e", precision - 1, x);
  const std::size_t ePos = e.find('e');
  std::string mantissa;
  for (std::size_t i = 0; i < ePos; i++) {
    if (e[i] != '.') mantissa += e[i];
  }
  const int exponent = std::atoi(e.c_str() + ePos + 1);

  if (exponent < -6 || exponent >= precision) {
    std::string out = mantissa.substr(0, 1);
    if (precision > 1) out += "." + mantissa.substr(1);
    out += exponent >= 0 ? "e+" : "e-";
    out += std::to_string(std::abs(exponent));
    return sign + out;
  }

  if (exponent >= 0) {
    const std::size_t intLen = static_cast<std::size_t>(exponent) + 1;
    std::string out = mantissa.substr(0, intLen);
    if (mantissa.size() > intLen) out += "." + mantissa.substr(intLen);
    return sign + out;
  }

  return sign + "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + mantissa;
}

std::string groupThousands(double value) {
  if (!std::isfinite(value)) return nonFinite(value);

  const double rounded = std::round(value);
  std::string digits = printfDouble("%.*f", 0, std::fabs(rounded));

  std::string out;
  const std::size_t n = digits.size();
  for (std::size_t i = 0; i < n; i++) {
    if (i > 0 && (n - i) % 3 == 0) out += ',';
    out += digits[i];
  }
  return (rounded < 0 ? "-" : "") + out;
}

std::string formatPrice(double price) {
  if (price == 0) return "0";
  if (price >= 10000) return groupThousands(price);
  if (price >= 100) return toFixed(price, 2);
  if (price >= 1) return toFixed(price, 4);

  // "0.000001234500..." -> "0.0(5)1234". The zero run gives back digits
  // when fewer than four remain after it, so an all-zero expansion still
  // yields four digits.
  constexpr int kExpansionDigits = 20;
  constexpr int kShownDigits = 4;
  const std::string s = toFixed(price, kExpansionDigits);
  if (s.size() == 2 + kExpansionDigits && s[0] == '0' && s[1] == '.') {
    int zeros = 0;
    while (zeros < kExpansionDigits && s[2 + zeros] == '0') zeros++;
    if (zeros > kExpansionDigits - kShownDigits) zeros = kExpansionDigits - kShownDigits;
    if (zeros >= 1) {
      return "0.0(" + std::to_string(zeros) + ")" +
             s.substr(2 + static_cast<std::size_t>(zeros), kShownDigits);
    }
  }
  return toPrecision(price, 4);
}

std::string formatMarketCap(double value) {
  if (value == 0 || std::isnan(value)) return "$0";
  if (value >= 1e9) return "$" + toFixed(value / 1e9, 2) + "B";
  if (value >= 1e6) return "$" + toFixed(value / 1e6, 2) + "M";
  if (value >= 1e3) return "$" + toFixed(value / 1e3, 1) + "K";
  return "$" + toFixed(value, 2);
}

} // namespace pc
