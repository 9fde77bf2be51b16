#include "pc/interaction/InteractionController.hpp"
#include "pc/viewport/Viewport.hpp"

namespace pc {

void InteractionController::setSeries(const std::vector<PricePoint>* points,
                                      const Viewport* viewport) {
  points_ = points;
  viewport_ = viewport;
}

void InteractionController::requestRender() {
  if (requestRender_) requestRender_();
}

void InteractionController::releaseCapture() {
  if (capturedPointer_ < 0) return;
  if (capture_) capture_->releasePointer(capturedPointer_);
  capturedPointer_ = -1;
}

void InteractionController::pointerDown(int pointerId, double /*x*/, double /*y*/,
                                        double nowMs) {
  // A second press re-arms; only one deadline is ever outstanding.
  pending_ = true;
  deadlineMs_ = nowMs + config_.longPressDelayMs;

  if (capturedPointer_ >= 0 && capturedPointer_ != pointerId) releaseCapture();
  if (capture_ && capturedPointer_ != pointerId) capture_->capturePointer(pointerId);
  capturedPointer_ = pointerId;
}

bool InteractionController::tick(double nowMs) {
  if (!pending_ || nowMs < deadlineMs_) return false;
  pending_ = false;
  state_.isLongPress = true;
  triggerHaptic(haptics_, config_.longPressHaptic);
  requestRender();
  return true;
}

void InteractionController::pointerMove(double x, double y) {
  if (!points_ || !viewport_ || points_->empty()) return;

  const int index = viewport_->nearestIndex(x);
  if (index < 0) return;

  state_.crosshairX = x;
  state_.crosshairY = y;
  state_.selectedIndex = index;

  if (onSelect_) onSelect_(&(*points_)[static_cast<std::size_t>(index)]);
  requestRender();
}

void InteractionController::pointerUp(int pointerId) {
  pending_ = false;
  state_.isLongPress = false;
  if (capturedPointer_ == pointerId) releaseCapture();
  requestRender();
}

void InteractionController::pointerCancel() {
  pending_ = false;
  state_.isLongPress = false;
  capturedPointer_ = -1;
  requestRender();
}

void InteractionController::pointerLeave() {
  state_.clearSelection();
  if (onSelect_) onSelect_(nullptr);
  requestRender();
}

void InteractionController::reset() {
  state_.clearSelection();
}

void InteractionController::cancelPending() {
  pending_ = false;
  state_.isLongPress = false;
  releaseCapture();
}

} // namespace pc
