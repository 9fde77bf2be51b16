// D6.1 - Pointer interaction and long-press
// Tests: crosshair selection, selection callback, long-press deadline with
// haptic pulse, cancellation paths, pointer capture, leave clearing.

#include "pc/interaction/Haptics.hpp"
#include "pc/interaction/InteractionController.hpp"
#include "pc/viewport/Viewport.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

class RecordingHaptics : public pc::HapticDriver {
public:
  void vibrate(int durationMs) override { pulses.push_back(durationMs); }
  std::vector<int> pulses;
};

class RecordingCapture : public pc::PointerCaptureHost {
public:
  void capturePointer(int id) override { captured.push_back(id); }
  void releasePointer(int id) override { released.push_back(id); }
  std::vector<int> captured;
  std::vector<int> released;
};

int main() {
  // --- haptic helper ---
  {
    requireTrue(pc::hapticDurationMs(pc::HapticStyle::Light) == 10, "light 10ms");
    requireTrue(pc::hapticDurationMs(pc::HapticStyle::Medium) == 20, "medium 20ms");
    requireTrue(pc::hapticDurationMs(pc::HapticStyle::Heavy) == 30, "heavy 30ms");
    requireTrue(!pc::triggerHaptic(nullptr, pc::HapticStyle::Heavy), "no driver is a no-op");
    RecordingHaptics h;
    requireTrue(pc::triggerHaptic(&h), "driver pulses");
    requireTrue(h.pulses.size() == 1 && h.pulses[0] == 10, "default style is light");
  }

  std::vector<pc::PricePoint> points;
  for (int i = 0; i < 11; i++) {
    pc::PricePoint p;
    p.timestamp = 1000 + i * 60;
    p.price = 1.0 + i;
    points.push_back(p);
  }

  pc::Viewport vp;
  vp.setSize(120, 100);
  vp.setPadding(pc::paddingFor(false));   // plot x in [10, 110], spacing 10
  vp.setPointCount(points.size());
  vp.setAxis(0, 12);

  RecordingHaptics haptics;
  RecordingCapture capture;
  int renders = 0;
  std::vector<const pc::PricePoint*> selections;

  pc::InteractionController ic;
  ic.setSeries(&points, &vp);
  ic.setHapticDriver(&haptics);
  ic.setCaptureHost(&capture);
  ic.setRenderRequest([&renders]() { renders++; });
  ic.setSelectionCallback([&selections](const pc::PricePoint* p) { selections.push_back(p); });

  // --- move selects the nearest point ---
  ic.pointerMove(44, 30);
  requireTrue(ic.state().selectedIndex == 3, "x=44 -> index 3");
  requireTrue(ic.state().crosshairX == 44 && ic.state().crosshairY == 30, "raw cursor kept");
  requireTrue(ic.state().hasSelection(), "has selection");
  requireTrue(selections.size() == 1 && selections[0] == &points[3], "callback gets the point");
  requireTrue(renders == 1, "move re-renders");

  ic.pointerMove(-50, 30);
  requireTrue(ic.state().selectedIndex == 0, "left of the plot clamps to first");
  ic.pointerMove(500, 30);
  requireTrue(ic.state().selectedIndex == 10, "right of the plot clamps to last");

  // --- long-press fires at the deadline, once, with a medium pulse ---
  ic.pointerDown(7, 60, 40, 1000.0);
  requireTrue(ic.longPressPending(), "armed");
  requireTrue(ic.longPressDeadlineMs() == 1300.0, "300ms default delay");
  requireTrue(capture.captured.size() == 1 && capture.captured[0] == 7, "pointer captured");

  requireTrue(!ic.tick(1299.0), "not yet");
  requireTrue(!ic.state().isLongPress && haptics.pulses.empty(), "no pulse before deadline");
  const int before = renders;
  requireTrue(ic.tick(1300.0), "fires at deadline");
  requireTrue(ic.state().isLongPress, "long-press active");
  requireTrue(haptics.pulses.size() == 1 && haptics.pulses[0] == 20, "one medium pulse");
  requireTrue(renders == before + 1, "long-press re-renders");
  requireTrue(!ic.tick(2000.0), "fires only once");
  requireTrue(haptics.pulses.size() == 1, "still one pulse");

  // moving during the long-press keeps it
  ic.pointerMove(80, 40);
  requireTrue(ic.state().isLongPress && ic.state().selectedIndex == 7, "drag while pressed");

  ic.pointerUp(7);
  requireTrue(!ic.state().isLongPress, "up ends long-press");
  requireTrue(ic.state().hasSelection(), "crosshair survives pointer up");
  requireTrue(capture.released.size() == 1 && capture.released[0] == 7, "capture released");

  // --- release before the deadline never fires ---
  ic.pointerDown(1, 60, 40, 5000.0);
  ic.pointerUp(1);
  requireTrue(!ic.longPressPending(), "disarmed by up");
  requireTrue(!ic.tick(6000.0), "no late fire");
  requireTrue(haptics.pulses.size() == 1, "no pulse for a short tap");

  // --- cancel behaves like up ---
  ic.pointerDown(2, 60, 40, 7000.0);
  ic.pointerCancel();
  requireTrue(!ic.tick(8000.0) && !ic.state().isLongPress, "cancel disarms");

  // --- a second press re-arms with a fresh deadline ---
  ic.pointerDown(3, 60, 40, 9000.0);
  ic.pointerDown(3, 60, 40, 9200.0);
  requireTrue(!ic.tick(9300.0), "first deadline superseded");
  requireTrue(ic.tick(9500.0), "second deadline fires");
  ic.pointerUp(3);

  // --- leave clears the selection and notifies with null ---
  selections.clear();
  ic.pointerLeave();
  requireTrue(!ic.state().hasSelection(), "selection cleared");
  requireTrue(ic.state().selectedIndex == -1 && ic.state().crosshairX == -1, "sentinels");
  requireTrue(selections.size() == 1 && selections[0] == nullptr, "null callback");

  // --- configurable delay ---
  pc::InteractionConfig cfg;
  cfg.longPressDelayMs = 500;
  ic.setConfig(cfg);
  ic.pointerDown(4, 60, 40, 0.0);
  requireTrue(!ic.tick(499.0) && ic.tick(500.0), "custom delay");

  // --- teardown drops the deadline and releases capture ---
  ic.pointerDown(5, 60, 40, 1000.0);
  ic.cancelPending();
  requireTrue(!ic.longPressPending() && !ic.tick(5000.0), "cancelPending disarms");
  requireTrue(capture.released.back() == 5, "teardown releases capture");

  // --- reset clears silently ---
  ic.pointerMove(50, 50);
  selections.clear();
  ic.reset();
  requireTrue(!ic.state().hasSelection() && selections.empty(), "reset does not notify");

  // --- no data: moves are ignored ---
  {
    std::vector<pc::PricePoint> none;
    pc::Viewport empty = vp;
    empty.setPointCount(0);
    pc::InteractionController idle;
    idle.setSeries(&none, &empty);
    idle.pointerMove(50, 50);
    requireTrue(!idle.state().hasSelection(), "nothing to select");
  }

  std::printf("D6.1 interaction PASS\n");
  return 0;
}
