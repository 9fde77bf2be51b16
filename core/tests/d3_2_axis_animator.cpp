// D3.2 - Auto-scale bounds and axis easing

#include "pc/viewport/AutoScale.hpp"
#include "pc/viewport/AxisAnimator.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

static std::vector<pc::PricePoint> series(std::initializer_list<double> prices) {
  std::vector<pc::PricePoint> out;
  std::int64_t t = 1000;
  for (double p : prices) {
    pc::PricePoint pt;
    pt.timestamp = t;
    pt.price = p;
    out.push_back(pt);
    t += 60;
  }
  return out;
}

int main() {
  pc::AutoScale scale;
  pc::PriceBounds b;

  // --- 10% margin of the range on each side ---
  requireTrue(scale.computeBounds(series({10, 20, 15}), b), "bounds for normal series");
  requireTrue(near(b.min, 9) && near(b.max, 21), "10% margin");

  // --- flat series ---
  requireTrue(scale.computeBounds(series({50}), b), "single point");
  requireTrue(near(b.min, 45) && near(b.max, 55), "flat pads by 10% of the price");

  requireTrue(scale.computeBounds(series({0, 0}), b), "flat zero");
  requireTrue(near(b.min, -1e-7, 1e-15) && near(b.max, 1e-7, 1e-15), "flat zero uses epsilon");
  requireTrue(b.max > b.min, "strictly ordered");

  requireTrue(scale.computeBounds(series({-3, -3}), b), "flat negative");
  requireTrue(b.max > b.min, "negative flat still ordered");

  // prices one rounding step apart count as flat
  requireTrue(scale.computeBounds(series({0.1 + 0.2, 0.3}), b), "rounding-flat");
  requireTrue(near(b.min, 0.27, 1e-12) && near(b.max, 0.33, 1e-12),
              "rounding noise pads like a flat series");

  // a genuine spread at 1e-13 is not flat
  requireTrue(scale.computeBounds(series({1e-13, 3e-13}), b), "tiny spread");
  requireTrue(near(b.min, 0.8e-13, 1e-25) && near(b.max, 3.2e-13, 1e-25),
              "tiny spread keeps the range margin");

  // --- non-finite prices ignored, none at all fails ---
  const double nan = std::numeric_limits<double>::quiet_NaN();
  requireTrue(scale.computeBounds(series({nan, 10, 20}), b), "NaN skipped");
  requireTrue(near(b.min, 9) && near(b.max, 21), "NaN does not widen bounds");
  requireTrue(!scale.computeBounds(series({nan}), b), "all NaN fails");
  requireTrue(!scale.computeBounds({}, b), "empty fails");

  // --- animator: first target snaps ---
  pc::AxisAnimator axis;
  requireTrue(!axis.hasBounds() && !axis.needsAnimation(), "fresh animator idle");
  axis.setTarget({0, 100});
  requireTrue(axis.hasBounds(), "first target sets bounds");
  requireTrue(axis.state().min == 0 && axis.state().max == 100, "first target snaps");
  requireTrue(!axis.needsAnimation(), "nothing to animate after snap");

  // --- exponential decay toward a new target ---
  axis.setTarget({10, 200});
  requireTrue(axis.needsAnimation(), "retarget animates");
  axis.step();
  requireTrue(near(axis.state().min, 1.5) && near(axis.state().max, 115),
              "15% of remaining distance per step");

  double lastGap = std::fabs(axis.state().max - 200);
  int frames = 1;
  while (axis.needsAnimation()) {
    axis.step();
    const double gap = std::fabs(axis.state().max - 200);
    requireTrue(gap < lastGap, "distance shrinks every frame");
    lastGap = gap;
    requireTrue(++frames < 500, "animation terminates");
  }
  requireTrue(frames > 40, "eased over many frames, not snapped");

  // Settled: the next step lands exactly on target.
  axis.step();
  requireTrue(axis.state().min == 10 && axis.state().max == 200, "lands on target");
  requireTrue(!axis.needsAnimation(), "idle once settled");

  // --- tolerance is absolute ---
  axis.setTarget({10 + 5e-5, 200 - 5e-5});
  requireTrue(!axis.needsAnimation(), "sub-tolerance retarget does not animate");

  // --- reset / clear ---
  axis.reset({1, 2});
  requireTrue(axis.state().targetMin == 1 && axis.state().min == 1, "reset snaps both");
  axis.clear();
  requireTrue(!axis.hasBounds() && !axis.needsAnimation(), "cleared");
  axis.step();
  requireTrue(!axis.hasBounds(), "step without bounds is a no-op");

  std::printf("D3.2 axis animator PASS\n");
  return 0;
}
