#include "pc/viewport/AutoScale.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pc {

bool AutoScale::computeBounds(const std::vector<PricePoint>& points, PriceBounds& out) const {
  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  bool found = false;

  for (const auto& p : points) {
    if (!std::isfinite(p.price)) continue;
    lo = std::min(lo, p.price);
    hi = std::max(hi, p.price);
    found = true;
  }

  if (!found) return false;

  const double scale = std::max(std::fabs(lo), std::fabs(hi));
  if (hi - lo <= std::numeric_limits<double>::epsilon() * scale) {
    // 10% of zero is zero, so a flat zero (or negative) series gets a fixed pad.
    const double pad = lo > 0 ? lo * config_.flatFraction : config_.flatEpsilon;
    out.min = lo - pad;
    out.max = hi + pad;
    return true;
  }

  const double margin = (hi - lo) * config_.marginFraction;
  out.min = lo - margin;
  out.max = hi + margin;
  return true;
}

} // namespace pc
