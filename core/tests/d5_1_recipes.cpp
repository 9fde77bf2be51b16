// D5.1 - Chart recipes (no GL)
// Tests: id layout and build commands applied to a real scene, grid levels,
// line/area/crosshair geometry, marker matching.

#include "pc/commands/CommandProcessor.hpp"
#include "pc/recipe/AreaRecipe.hpp"
#include "pc/recipe/AxisRecipe.hpp"
#include "pc/recipe/CrosshairRecipe.hpp"
#include "pc/recipe/LineRecipe.hpp"
#include "pc/recipe/MarkerRecipe.hpp"
#include "pc/scene/ResourceRegistry.hpp"
#include "pc/scene/Scene.hpp"
#include "pc/viewport/Viewport.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireOk(const pc::CmdResult& r, const char* ctx) {
  if (!r.ok) {
    std::fprintf(stderr, "FAIL [%s]: code=%s msg=%s\n",
                 ctx, r.err.code.c_str(), r.err.message.c_str());
    std::exit(1);
  }
}

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(double a, double b, double eps = 1e-3) {
  return std::fabs(a - b) <= eps;
}

static void applyAll(pc::CommandProcessor& cp, const std::vector<pc::CmdString>& cmds,
                     const char* ctx) {
  for (const auto& c : cmds) requireOk(cp.applyJsonText(c), ctx);
}

static std::vector<pc::PricePoint> makePoints() {
  // 5 points: 10, 20, 15, 30, 25 at one-minute spacing
  const double prices[] = {10, 20, 15, 30, 25};
  std::vector<pc::PricePoint> pts;
  for (int i = 0; i < 5; i++) {
    pc::PricePoint p;
    p.timestamp = 1700000000 + i * 60;
    p.price = prices[i];
    pts.push_back(p);
  }
  return pts;
}

int main() {
  pc::Scene scene;
  pc::ResourceRegistry reg;
  pc::CommandProcessor cp(scene, reg);

  requireOk(cp.applyJsonText(R"({"cmd":"createPane","id":1})"), "pane");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":2,"paneId":1})"), "grid layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":3,"paneId":1})"), "fill layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":4,"paneId":1})"), "mask layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":5,"paneId":1})"), "line layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":6,"paneId":1})"), "label layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createLayer","id":7,"paneId":1})"), "overlay layer");
  requireOk(cp.applyJsonText(R"({"cmd":"createTransform","id":20})"), "transform");

  pc::Viewport vp;
  vp.setSize(400, 200);
  vp.setPadding(pc::paddingFor(true));
  const auto pts = makePoints();
  vp.setPointCount(pts.size());
  vp.setAxis(0.0, 40.0);

  // --- axis ---
  pc::AxisRecipeConfig axisCfg;
  axisCfg.gridLayerId = 2;
  axisCfg.labelLayerId = 6;
  axisCfg.transformId = 20;
  axisCfg.name = "axis";
  pc::AxisRecipe axis(100, axisCfg);
  applyAll(cp, axis.build().createCommands, "axis build");
  requireTrue(scene.getDrawItem(102)->pipeline == "line2d@1", "grid draws lines");
  requireTrue(scene.getDrawItem(105)->pipeline == "textSDF@1", "labels draw text");
  requireTrue(scene.getDrawItem(102)->transformId == 20, "grid uses pixel transform");
  requireTrue(scene.getDrawItem(105)->layerId == 6, "labels on label layer");

  {
    auto prices = axis.levelPrices(0.0, 40.0);
    requireTrue(prices.size() == 6, "six levels");
    requireTrue(prices[0] == 40.0 && prices[5] == 0.0, "top max, bottom min");
    requireTrue(near(prices[2], 24.0), "even steps");

    auto ys = axis.levelYs(vp);
    requireTrue(near(ys[0], 20) && near(ys[5], vp.chartBottom()), "rows span the plot");

    auto grid = axis.computeGrid(vp);
    requireTrue(grid.count == 12, "two vertices per row");
    requireTrue(grid.values[0] == 10.0f && grid.values[2] == static_cast<float>(vp.chartRight()),
                "rows run left padding to chartRight");
    requireOk(cp.applyJsonText(pc::Recipe::vertexCountCommand(axis.gridSlot().geometryId,
                                                               grid.count)), "grid count");
  }

  // --- area ---
  pc::AreaRecipeConfig areaCfg;
  areaCfg.fillLayerId = 3;
  areaCfg.maskLayerId = 4;
  areaCfg.transformId = 20;
  areaCfg.name = "area";
  pc::AreaRecipe area(110, areaCfg);
  applyAll(cp, area.build().createCommands, "area build");
  requireTrue(scene.getDrawItem(112)->maskDrawItemId == 115, "sprite masked by silhouette");
  requireTrue(scene.getDrawItem(115)->isMask, "silhouette is a mask");
  requireTrue(scene.getDrawItem(112)->pipeline == "texturedQuad@1", "sprite is textured");

  {
    auto fill = area.computeFill(vp);
    requireTrue(fill.count == 1, "one sprite");
    requireTrue(fill.values[0] == 0.0f && fill.values[1] == 20.0f &&
                fill.values[2] == 400.0f && near(fill.values[3], 20 + vp.chartHeight()),
                "full width, plot height");

    auto mask = area.computeMask(vp, pts);
    requireTrue(mask.count == 4 * 6, "one quad per segment");
    requireTrue(mask.values[3] == static_cast<float>(vp.chartBottom()), "down to chart bottom");
    requireOk(cp.applyJsonText(pc::Recipe::vertexCountCommand(area.maskSlot().geometryId,
                                                               mask.count)), "mask count");

    std::vector<pc::PricePoint> single(1, pts[0]);
    requireTrue(area.computeMask(vp, single).count == 0, "single point has no area");
  }

  // --- line ---
  pc::LineRecipeConfig lineCfg;
  lineCfg.layerId = 5;
  lineCfg.transformId = 20;
  lineCfg.name = "price";
  pc::LineRecipe line(120, lineCfg);
  applyAll(cp, line.build().createCommands, "line build");
  requireTrue(scene.getDrawItem(122)->lineWidth == 2.0f, "line width 2");
  requireTrue(scene.getDrawItem(122)->pipeline == "lineAA@1", "AA segments");

  {
    auto seg = line.computeSegments(vp, pts);
    requireTrue(seg.count == 4 && seg.values.size() == 16, "n-1 segments");
    requireTrue(near(seg.values[0], vp.indexToX(0)) && near(seg.values[1], vp.priceToY(10)),
                "first segment starts at first point");
    requireTrue(near(seg.values[14], vp.indexToX(4)) && near(seg.values[15], vp.priceToY(25)),
                "last segment ends at last point");
    // segments chain
    for (int i = 1; i < 4; i++) {
      requireTrue(seg.values[i * 4] == seg.values[i * 4 - 2] &&
                  seg.values[i * 4 + 1] == seg.values[i * 4 - 1], "contiguous");
    }

    auto joins = line.computeJoins(vp, pts);
    requireTrue(joins.count == 5 && joins.values[2] == 1.0f, "round joins at half width");

    auto dot = line.computeDot(vp, pts);
    requireTrue(dot.count == 1 && dot.values[2] == 5.0f, "current price dot r=5");
    requireTrue(near(dot.values[0], vp.indexToX(4)), "dot at last point");

    requireTrue(line.computeSegments(vp, {}).count == 0, "no data, no line");
    requireTrue(line.computeDot(vp, {}).count == 0, "no data, no dot");
  }

  // --- markers ---
  pc::MarkerRecipeConfig markerCfg;
  markerCfg.layerId = 5;
  markerCfg.transformId = 20;
  markerCfg.name = "markers";
  pc::MarkerRecipe markers(130, markerCfg);
  applyAll(cp, markers.build().createCommands, "marker build");

  {
    std::vector<pc::ChartMarker> ms;
    pc::ChartMarker buy;
    buy.timestamp = pts[1].timestamp;
    buy.price = 18.0;
    buy.kind = pc::MarkerKind::Buy;
    ms.push_back(buy);
    pc::ChartMarker sell;
    sell.timestamp = pts[3].timestamp;
    sell.price = 30.0;
    sell.kind = pc::MarkerKind::Sell;
    ms.push_back(sell);
    pc::ChartMarker orphan;
    orphan.timestamp = 42;
    orphan.kind = pc::MarkerKind::Sell;
    ms.push_back(orphan);

    auto m = markers.computeMarkers(vp, pts, ms);
    requireTrue(m.matched == 2, "unmatched marker skipped");
    requireTrue(m.buy.count == 3 && m.sell.count == 3, "one triangle each");

    const float bx = static_cast<float>(vp.indexToX(1));
    const float by = static_cast<float>(vp.priceToY(18.0));
    requireTrue(m.buy.values[0] == bx && near(m.buy.values[1], by - 12), "buy tip above");
    requireTrue(near(m.buy.values[3], by + 4), "buy base below the price");
    const float sy = static_cast<float>(vp.priceToY(30.0));
    requireTrue(near(m.sell.values[1], sy + 12), "sell tip below");

    // duplicate timestamps: marker lands on the first occurrence
    auto dup = pts;
    dup.push_back(pts[1]);
    pc::Viewport vp6 = vp;
    vp6.setPointCount(dup.size());
    auto md = markers.computeMarkers(vp6, dup, {buy});
    requireTrue(md.buy.values[0] == static_cast<float>(vp6.indexToX(1)), "first match wins");
  }

  // --- crosshair ---
  pc::CrosshairRecipeConfig crossCfg;
  crossCfg.layerId = 7;
  crossCfg.transformId = 20;
  crossCfg.name = "crosshair";
  pc::CrosshairRecipe cross(140, crossCfg);
  applyAll(cp, cross.build().createCommands, "crosshair build");

  {
    const double x = vp.indexToX(2);
    const double y = vp.priceToY(15);
    auto guides = cross.computeGuides(vp, x, y);
    requireTrue(guides.count > 0 && guides.count % 2 == 0, "line pairs");
    requireOk(cp.applyJsonText(pc::Recipe::vertexCountCommand(cross.guideSlot().geometryId,
                                                               guides.count)), "guide count");

    // first dash starts at the top padding on x, length 4
    requireTrue(near(guides.values[0], x) && near(guides.values[1], 20), "vertical from top");
    requireTrue(near(guides.values[3] - guides.values[1], 4), "4px dash");
    bool sawHorizontal = false;
    float minX = 1e9f;
    float maxX = 0;
    for (std::size_t i = 0; i + 3 < guides.values.size(); i += 4) {
      if (guides.values[i + 1] == guides.values[i + 3] && near(guides.values[i + 1], y)) {
        sawHorizontal = true;
        minX = std::min(minX, guides.values[i]);
        maxX = std::max(maxX, guides.values[i + 2]);
      }
      requireTrue(guides.values[i + 3] <= static_cast<float>(vp.chartBottom()) + 1e-3f,
                  "no dash past the chart bottom");
    }
    requireTrue(sawHorizontal, "horizontal guide through the point");
    requireTrue(near(minX, vp.padding().left), "starts at the left padding");
    requireTrue(maxX <= static_cast<float>(vp.chartRight()) + 1e-3f, "stops at chartRight");

    auto ring = cross.computeRing(x, y);
    auto dot = cross.computeDot(x, y);
    requireTrue(ring.values[2] == 8.0f && dot.values[2] == 4.0f, "ring r8, dot r4");
  }

  // --- dispose removes everything the build created ---
  applyAll(cp, cross.build().disposeCommands, "crosshair dispose");
  applyAll(cp, markers.build().disposeCommands, "marker dispose");
  applyAll(cp, line.build().disposeCommands, "line dispose");
  applyAll(cp, area.build().disposeCommands, "area dispose");
  applyAll(cp, axis.build().disposeCommands, "axis dispose");
  requireTrue(scene.drawItemIds().empty(), "all draw items gone");
  requireTrue(scene.bufferIds().empty() && scene.geometryIds().empty(), "buffers gone");

  std::printf("D5.1 recipes PASS\n");
  return 0;
}
