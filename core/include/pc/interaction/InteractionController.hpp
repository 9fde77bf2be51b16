#pragma once
#include "pc/chart/ChartTypes.hpp"
#include "pc/interaction/Haptics.hpp"
#include "pc/interaction/InteractionState.hpp"
#include <functional>
#include <utility>
#include <vector>

namespace pc {

class Viewport;

// Host-side pointer capture (keeps move/up events flowing to the chart while
// the pointer is pressed outside it).
class PointerCaptureHost {
public:
  virtual ~PointerCaptureHost() = default;
  virtual void capturePointer(int pointerId) = 0;
  virtual void releasePointer(int pointerId) = 0;
};

// Receives the selected point, or nullptr when the selection clears.
using SelectionCallback = std::function<void(const PricePoint*)>;
using RenderRequest = std::function<void()>;

struct InteractionConfig {
  double longPressDelayMs{300};
  HapticStyle longPressHaptic{HapticStyle::Medium};
};

// Pointer state machine: crosshair tracking, nearest-point selection and
// long-press detection. Single-threaded; time is supplied by the host
// (pointerDown arms a deadline that tick() fires).
class InteractionController {
public:
  InteractionController() = default;

  void setConfig(const InteractionConfig& config) { config_ = config; }
  const InteractionConfig& config() const { return config_; }

  // Series and mapping used by pointerMove; both must outlive the controller
  // or be reset with nullptr.
  void setSeries(const std::vector<PricePoint>* points, const Viewport* viewport);

  void setSelectionCallback(SelectionCallback cb) { onSelect_ = std::move(cb); }
  void setRenderRequest(RenderRequest cb) { requestRender_ = std::move(cb); }
  void setHapticDriver(HapticDriver* driver) { haptics_ = driver; }
  void setCaptureHost(PointerCaptureHost* host) { capture_ = host; }

  void pointerDown(int pointerId, double x, double y, double nowMs);
  void pointerMove(double x, double y);
  void pointerUp(int pointerId);
  void pointerCancel();
  void pointerLeave();

  // Fires an expired long-press deadline. Returns true when it fired.
  bool tick(double nowMs);

  // Data or viewport changed: clear the selection without notifying.
  void reset();

  // Teardown: drop the pending deadline and any capture.
  void cancelPending();

  bool longPressPending() const { return pending_; }
  double longPressDeadlineMs() const { return deadlineMs_; }

  const InteractionState& state() const { return state_; }

private:
  InteractionConfig config_;
  InteractionState state_;

  const std::vector<PricePoint>* points_{nullptr};
  const Viewport* viewport_{nullptr};

  SelectionCallback onSelect_;
  RenderRequest requestRender_;
  HapticDriver* haptics_{nullptr};
  PointerCaptureHost* capture_{nullptr};

  bool pending_{false};
  double deadlineMs_{0};
  int capturedPointer_{-1};

  void requestRender();
  void releaseCapture();
};

} // namespace pc
