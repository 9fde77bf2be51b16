#pragma once
#include "pc/viewport/AutoScale.hpp"

namespace pc {

struct AxisAnimatorConfig {
  double smoothing{0.15};   // fraction of the remaining distance per frame
  double tolerance{1e-4};   // per-side distance below which animation stops
};

struct AxisState {
  double min{0};
  double max{1};
  double targetMin{0};
  double targetMax{1};
};

// Eases the rendered price axis toward its target range, one step per frame.
class AxisAnimator {
public:
  AxisAnimator() = default;
  explicit AxisAnimator(const AxisAnimatorConfig& cfg) : config_(cfg) {}

  void setConfig(const AxisAnimatorConfig& cfg) { config_ = cfg; }
  const AxisAnimatorConfig& config() const { return config_; }

  // Snap live and target bounds.
  void reset(const PriceBounds& bounds);

  // Retarget, keeping the live bounds. Snaps if nothing was set before.
  void setTarget(const PriceBounds& bounds);

  // Forget all bounds (empty series, teardown).
  void clear();

  bool hasBounds() const { return hasBounds_; }

  // Advance one frame. Once within tolerance the live bounds land on target.
  void step();

  // True while either side is farther than `tolerance` from its target.
  bool needsAnimation() const;

  const AxisState& state() const { return state_; }

private:
  AxisAnimatorConfig config_;
  AxisState state_;
  bool hasBounds_{false};
};

} // namespace pc
