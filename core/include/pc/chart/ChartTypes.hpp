#pragma once
#include <cstdint>
#include <string>

namespace pc {

struct PricePoint {
  std::int64_t timestamp{0}; // seconds since epoch
  double price{0};
};

enum class MarkerKind : std::uint8_t {
  Buy,
  Sell
};

inline const char* toString(MarkerKind k) {
  switch (k) {
    case MarkerKind::Buy: return "buy";
    case MarkerKind::Sell: return "sell";
  }
  return "unknown";
}

// Attached to the first point with the same timestamp; drawn at its own price.
struct ChartMarker {
  std::int64_t timestamp{0};
  double price{0};
  MarkerKind kind{MarkerKind::Buy};
  std::string label;
};

} // namespace pc
