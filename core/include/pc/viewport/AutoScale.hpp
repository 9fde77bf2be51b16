#pragma once
#include "pc/chart/ChartTypes.hpp"
#include <vector>

namespace pc {

struct PriceBounds {
  double min{0};
  double max{1};
};

struct AutoScaleConfig {
  double marginFraction{0.1};   // of the price range, on each side
  double flatFraction{0.1};     // of the price, when every price is equal
  double flatEpsilon{1e-7};     // flat series at zero or below
};

class AutoScale {
public:
  void setConfig(const AutoScaleConfig& cfg) { config_ = cfg; }
  const AutoScaleConfig& config() const { return config_; }

  // Padded price range of the whole series; max > min on success.
  // Returns false when no finite price exists.
  bool computeBounds(const std::vector<PricePoint>& points, PriceBounds& out) const;

private:
  AutoScaleConfig config_;
};

} // namespace pc
