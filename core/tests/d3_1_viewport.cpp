// D3.1 - Viewport mapping
// Tests: padding, index/price mapping, nearest index, pixel->clip transform,
// autoscaled series at very small prices.

#include "pc/viewport/AutoScale.hpp"
#include "pc/viewport/Viewport.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

int main() {
  // --- padding presets ---
  {
    pc::Padding withLabels = pc::paddingFor(true);
    requireTrue(withLabels.top == 20 && withLabels.right == 60 &&
                withLabels.bottom == 30 && withLabels.left == 10, "label padding");
    pc::Padding bare = pc::paddingFor(false);
    requireTrue(bare.top == 10 && bare.right == 10 && bare.bottom == 10 && bare.left == 10,
                "bare padding");
  }

  pc::Viewport vp;
  vp.setSize(800, 400);
  vp.setPadding(pc::paddingFor(true));
  vp.setPointCount(101);
  vp.setAxis(100.0, 200.0);

  // --- plot area ---
  requireTrue(near(vp.chartWidth(), 730), "chartWidth");
  requireTrue(near(vp.chartHeight(), 350), "chartHeight");
  requireTrue(near(vp.chartRight(), 740), "chartRight");
  requireTrue(near(vp.chartBottom(), 370), "chartBottom");

  // --- index -> x ---
  requireTrue(near(vp.indexToX(0), 10), "first point at left padding");
  requireTrue(near(vp.indexToX(100), 740), "last point at chartRight");
  requireTrue(near(vp.indexToX(50), 375), "middle point");

  // --- price -> y (Y grows down) ---
  requireTrue(near(vp.priceToY(200.0), 20), "axis max at top padding");
  requireTrue(near(vp.priceToY(100.0), 370), "axis min at chart bottom");
  requireTrue(near(vp.priceToY(150.0), 195), "midpoint");
  requireTrue(vp.priceToY(210.0) < 20, "above the axis maps above the plot");

  // --- nearest index ---
  requireTrue(vp.nearestIndex(10) == 0, "x at left -> 0");
  requireTrue(vp.nearestIndex(-500) == 0, "clamped low");
  requireTrue(vp.nearestIndex(5000) == 100, "clamped high");
  requireTrue(vp.nearestIndex(10 + 7.3 * 3.2) == 3, "rounds down below half spacing");
  requireTrue(vp.nearestIndex(10 + 7.3 * 3.6) == 4, "rounds up above half spacing");

  // --- degenerate counts ---
  {
    pc::Viewport one = vp;
    one.setPointCount(1);
    requireTrue(one.pointSpacing() == 0.0, "single point has no spacing");
    requireTrue(near(one.indexToX(0), 10), "single point at left");
    requireTrue(one.nearestIndex(300) == 0, "single point always selected");

    pc::Viewport none = vp;
    none.setPointCount(0);
    requireTrue(none.nearestIndex(300) == -1, "no data -> -1");
  }

  // --- collapsed axis never divides by zero ---
  {
    pc::Viewport flat = vp;
    flat.setAxis(5.0, 5.0);
    requireTrue(flat.axisRange() == 1.0, "collapsed axis uses a unit range");
    requireTrue(std::isfinite(flat.priceToY(5.0)), "finite y on flat axis");
    requireTrue(near(flat.priceToY(5.0), 370), "collapsed axis sits on the bottom");

    pc::Viewport tiny = vp;
    tiny.setAxis(1e-13, 3e-13);
    requireTrue(near(tiny.axisRange(), 2e-13, 1e-25), "sub-picounit range kept");
    requireTrue(near(tiny.priceToY(3e-13), 20, 1e-6), "tiny axis max at top");
  }

  // --- autoscaled series: rising price maps upward ---
  {
    std::vector<pc::PricePoint> pts(3);
    pts[0].timestamp = 0;   pts[0].price = 100;
    pts[1].timestamp = 60;  pts[1].price = 110;
    pts[2].timestamp = 120; pts[2].price = 90;

    pc::AutoScale scale;
    pc::PriceBounds b;
    requireTrue(scale.computeBounds(pts, b), "bounds");
    pc::Viewport v;
    v.setSize(800, 400);
    v.setPadding(pc::paddingFor(true));
    v.setPointCount(pts.size());
    v.setAxis(b.min, b.max);
    requireTrue(v.priceToY(110) < v.priceToY(100) && v.priceToY(100) < v.priceToY(90),
                "Y(110) < Y(100) < Y(90)");
    requireTrue(v.priceToY(110) > 20 && v.priceToY(90) < 370, "margins keep extremes inside");
  }

  // --- autoscaled series around 1e-13 fill the plot ---
  {
    pc::AutoScale scale;
    pc::PriceBounds b;
    pc::Viewport v;
    v.setSize(800, 400);
    v.setPadding(pc::paddingFor(true));   // plot y in [20, 370]

    std::vector<pc::PricePoint> flat(2);
    flat[0].price = 5e-13;
    flat[1].price = 5e-13;
    requireTrue(scale.computeBounds(flat, b), "flat tiny bounds");
    requireTrue(near(b.min, 4.5e-13, 1e-25) && near(b.max, 5.5e-13, 1e-25), "10% of the price");
    v.setAxis(b.min, b.max);
    requireTrue(near(v.priceToY(5e-13), 195, 1e-6), "flat tiny series centered");

    std::vector<pc::PricePoint> ramp(2);
    ramp[0].price = 1e-13;
    ramp[1].price = 3e-13;
    requireTrue(scale.computeBounds(ramp, b), "ramp bounds");
    v.setAxis(b.min, b.max);
    requireTrue(near(v.priceToY(1e-13), 370 - 350.0 * 0.2 / 2.4, 1e-6), "low end near bottom");
    requireTrue(near(v.priceToY(3e-13), 370 - 350.0 * 2.2 / 2.4, 1e-6), "high end near top");
  }

  // --- pixel -> clip ---
  {
    pc::TransformParams tp = vp.computeTransformParams();
    requireTrue(near(tp.sx, 2.0 / 800, 1e-7) && near(tp.sy, -2.0 / 400, 1e-7),
                "scale maps pixels to clip");
    requireTrue(tp.tx == -1.0f && tp.ty == 1.0f, "origin top-left");

    // top-left and bottom-right pixels land on the clip corners
    requireTrue(near(tp.sx * 0 + tp.tx, -1, 1e-6) && near(tp.sy * 0 + tp.ty, 1, 1e-6),
                "top-left corner");
    requireTrue(near(tp.sx * 800 + tp.tx, 1, 1e-6) && near(tp.sy * 400 + tp.ty, -1, 1e-6),
                "bottom-right corner");
  }

  // --- empty viewport ---
  {
    pc::Viewport empty;
    requireTrue(!empty.hasArea(), "default viewport has no area");
    pc::TransformParams tp = empty.computeTransformParams();
    requireTrue(tp.sx == 1.0f && tp.sy == 1.0f, "identity without area");
  }

  std::printf("D3.1 viewport PASS\n");
  return 0;
}
