#include "pc/viewport/AxisAnimator.hpp"
#include <cmath>

namespace pc {

void AxisAnimator::reset(const PriceBounds& bounds) {
  state_.min = state_.targetMin = bounds.min;
  state_.max = state_.targetMax = bounds.max;
  hasBounds_ = true;
}

void AxisAnimator::setTarget(const PriceBounds& bounds) {
  if (!hasBounds_) {
    reset(bounds);
    return;
  }
  state_.targetMin = bounds.min;
  state_.targetMax = bounds.max;
}

void AxisAnimator::clear() {
  state_ = AxisState{};
  hasBounds_ = false;
}

bool AxisAnimator::needsAnimation() const {
  if (!hasBounds_) return false;
  return std::fabs(state_.min - state_.targetMin) > config_.tolerance ||
         std::fabs(state_.max - state_.targetMax) > config_.tolerance;
}

void AxisAnimator::step() {
  if (!hasBounds_) return;

  if (!needsAnimation()) {
    state_.min = state_.targetMin;
    state_.max = state_.targetMax;
    return;
  }

  state_.min += (state_.targetMin - state_.min) * config_.smoothing;
  state_.max += (state_.targetMax - state_.max) * config_.smoothing;
}

} // namespace pc
