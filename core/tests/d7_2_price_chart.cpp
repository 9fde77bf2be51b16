// D7.2 - PriceChart frame pipeline against a recording surface (no GL)
// Tests: placeholder frame, layer stack, per-layer contents, axis easing
// frame requests, crosshair/long-press rendering, loading overlay, teardown.

#include "pc/chart/ChartScene.hpp"
#include "pc/chart/PriceChart.hpp"
#include "pc/chart/RenderSurface.hpp"
#include "pc/texture/TextureStore.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <map>
#include <set>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

class MemoryTextureStore : public pc::TextureStore {
public:
  pc::Id createTexture(int, int, const std::uint8_t*) override {
    uploads++;
    pc::Id id = next++;
    live.insert(id);
    return id;
  }
  void destroyTexture(pc::Id id) override { live.erase(id); }
  bool hasTexture(pc::Id id) const override { return live.count(id) != 0; }

  pc::Id next{1};
  int uploads{0};
  std::set<pc::Id> live;
};

// Keeps staged buffer bytes and counts presents.
class RecordingSurface : public pc::RenderSurface {
public:
  pc::TextureStore* textures() override { return &store; }
  void setGlyphAtlas(pc::GlyphAtlas* a) override { atlas = a; }
  void setBufferData(pc::Id bufferId, const void* data, std::uint32_t bytes) override {
    const auto* p = static_cast<const std::uint8_t*>(data);
    buffers[bufferId].assign(p, p + bytes);
  }
  void releaseBuffer(pc::Id bufferId) override {
    buffers.erase(bufferId);
    released++;
  }
  bool present(const pc::Scene& scene, int width, int height) override {
    presents++;
    lastWidth = width;
    lastHeight = height;
    lastLayerCount = scene.layerIds().size();
    return true;
  }

  MemoryTextureStore store;
  pc::GlyphAtlas* atlas{nullptr};
  std::map<pc::Id, std::vector<std::uint8_t>> buffers;
  int presents{0};
  int released{0};
  int lastWidth{0};
  int lastHeight{0};
  std::size_t lastLayerCount{0};
};

class CountingHaptics : public pc::HapticDriver {
public:
  void vibrate(int ms) override { pulses.push_back(ms); }
  std::vector<int> pulses;
};

static std::vector<pc::PricePoint> makeSeries(int n, double base) {
  std::vector<pc::PricePoint> out;
  for (int i = 0; i < n; i++) {
    pc::PricePoint p;
    p.timestamp = 1700000000 + i * 60;
    p.price = base + (i % 7) * 2.0 + i * 0.5;
    out.push_back(p);
  }
  return out;
}

int main() {
  RecordingSurface surface;
  CountingHaptics haptics;
  std::vector<const pc::PricePoint*> selections;

  pc::PriceChart chart;
  chart.setHapticDriver(&haptics);
  chart.setSelectionCallback([&selections](const pc::PricePoint* p) { selections.push_back(p); });

  auto vc = [&chart](const pc::DrawSlot& s) { return chart.chartScene().vertexCount(s); };

  // --- no surface / no area ---
  requireTrue(!chart.render(), "no surface -> no frame");
  requireTrue(chart.attachSurface(&surface), "attach");
  requireTrue(surface.atlas == &chart.glyphAtlas(), "surface gets the atlas");
  requireTrue(!chart.render(), "zero size -> no frame");
  requireTrue(surface.presents == 0, "nothing presented");

  chart.resize(400, 200);

  // --- layer stack ---
  const pc::ChartScene& cs = chart.chartScene();
  {
    auto order = cs.layerOrder();
    requireTrue(order.size() == 8, "eight layers");
    const char* names[] = {"grid", "gradientFill", "gradientMask", "line",
                           "labels", "overlay", "tooltip", "status"};
    for (std::size_t i = 0; i < order.size(); i++) {
      const pc::Layer* l = cs.scene().getLayer(order[i]);
      requireTrue(l && l->name == names[i], "layer order");
    }
    requireTrue(cs.scene().getPane(pc::ChartScene::kPaneId)->name == "chart", "pane name");
  }

  // --- empty data: placeholder frame only ---
  requireTrue(chart.render(), "placeholder frame renders");
  requireTrue(surface.presents == 1 && surface.lastWidth == 400, "presented at size");
  requireTrue(surface.lastLayerCount == 8, "full layer stack presented");
  requireTrue(vc(cs.lineRecipe().segmentSlot()) == 0, "no line");
  requireTrue(vc(cs.axisRecipe().gridSlot()) == 0, "no grid without data");
  requireTrue(chart.gradientCache().entry().textureId == pc::kInvalidId, "no gradient yet");
  requireTrue(!chart.frameRequested(), "idle after placeholder");

  // --- first data set: snaps, draws every layer ---
  auto series = makeSeries(50, 100.0);
  chart.setData(series);
  requireTrue(chart.frameRequested(), "data change requests a frame");
  requireTrue(!chart.axis().needsAnimation(), "first data set snaps");

  std::vector<pc::ChartMarker> markers(2);
  markers[0].timestamp = series[10].timestamp;
  markers[0].price = series[10].price;
  markers[0].kind = pc::MarkerKind::Buy;
  markers[1].timestamp = 5;   // no such point
  markers[1].kind = pc::MarkerKind::Sell;
  chart.setMarkers(markers);

  requireTrue(chart.onAnimationFrame(0.0), "data frame");
  requireTrue(vc(cs.axisRecipe().gridSlot()) == 12, "six grid rows");
  requireTrue(vc(cs.areaRecipe().fillSlot()) == 1, "gradient sprite");
  requireTrue(vc(cs.areaRecipe().maskSlot()) == 49 * 6, "gradient mask");
  requireTrue(vc(cs.lineRecipe().segmentSlot()) == 49, "line segments");
  requireTrue(vc(cs.lineRecipe().joinSlot()) == 50, "joins");
  requireTrue(vc(cs.lineRecipe().dotSlot()) == 1, "current price dot");
  requireTrue(vc(cs.markerRecipe().buySlot()) == 3, "matched buy marker");
  requireTrue(vc(cs.markerRecipe().sellSlot()) == 0, "unmatched sell skipped");
  requireTrue(vc(cs.crosshairRecipe().guideSlot()) == 0, "no crosshair yet");
  requireTrue(vc(cs.statusRecipe().veilSlot()) == 0, "not loading");
  requireTrue(surface.store.live.size() == 1, "one gradient texture");
  requireTrue(!surface.buffers[cs.lineRecipe().segmentSlot().bufferId].empty(),
              "line bytes staged");
  requireTrue(surface.buffers[cs.lineRecipe().segmentSlot().bufferId].size() ==
              49 * 4 * sizeof(float), "rect4 per segment");
  requireTrue(!chart.frameRequested(), "settled axis stops requesting frames");
  requireTrue(cs.failedCommands() == 0, "no rejected commands");

  // --- second data set: eases toward the new range ---
  chart.setData(makeSeries(60, 300.0));
  requireTrue(chart.axis().needsAnimation(), "retarget animates");
  const double startMax = chart.axis().state().max;
  chart.onAnimationFrame(16.0);
  requireTrue(chart.frameRequested(), "keeps requesting while easing");
  requireTrue(chart.axis().state().max > startMax &&
              chart.axis().state().max < chart.axis().state().targetMax, "partial step");
  int frames = 1;
  while (chart.frameRequested()) {
    chart.onAnimationFrame(16.0 * ++frames);
    requireTrue(frames < 1000, "easing terminates");
  }
  requireTrue(frames > 10, "eased over several frames");
  requireTrue(std::fabs(chart.viewport().axisMax() - chart.axis().state().targetMax) <= 1e-4,
              "settled within tolerance");
  requireTrue(vc(cs.lineRecipe().segmentSlot()) == 59, "new series drawn");

  // --- crosshair: move renders immediately ---
  const int presentsBefore = surface.presents;
  const double x = chart.viewport().indexToX(20);
  chart.pointerMove(x + 1.0, 50.0);
  requireTrue(surface.presents == presentsBefore + 1, "move re-renders now");
  requireTrue(chart.interaction().selectedIndex == 20, "nearest point selected");
  requireTrue(!selections.empty() && selections.back() == &chart.points()[20], "callback");
  requireTrue(vc(cs.crosshairRecipe().guideSlot()) > 0, "guides drawn");
  requireTrue(vc(cs.tooltipRecipe().fillSlot()) > 0, "tooltip card drawn");
  requireTrue(vc(cs.crosshairRecipe().ringSlot()) == 0, "no highlight before long-press");

  // --- long-press ---
  chart.pointerDown(1, x, 50.0, 1000.0);
  chart.tick(1299.0);
  requireTrue(haptics.pulses.empty(), "no pulse before 300ms");
  chart.tick(1300.0);
  requireTrue(haptics.pulses.size() == 1 && haptics.pulses[0] == 20, "one medium pulse");
  requireTrue(chart.interaction().isLongPress, "long-press state");
  requireTrue(vc(cs.crosshairRecipe().ringSlot()) == 1 && vc(cs.crosshairRecipe().dotSlot()) == 1,
              "highlight drawn on fire");
  chart.pointerUp(1);
  requireTrue(vc(cs.crosshairRecipe().ringSlot()) == 0, "highlight gone on release");
  requireTrue(vc(cs.crosshairRecipe().guideSlot()) > 0, "crosshair stays after release");

  // short tap: no pulse
  chart.pointerDown(2, x, 50.0, 5000.0);
  chart.pointerUp(2);
  chart.tick(6000.0);
  requireTrue(haptics.pulses.size() == 1, "tap does not pulse");

  // --- leave clears ---
  chart.pointerLeave();
  requireTrue(selections.back() == nullptr, "null selection on leave");
  requireTrue(vc(cs.crosshairRecipe().guideSlot()) == 0, "crosshair cleared");
  requireTrue(vc(cs.tooltipRecipe().fillSlot()) == 0, "tooltip cleared");

  // --- config: grid off, loading on ---
  pc::ChartConfig cfg = chart.config();
  cfg.showGrid = false;
  cfg.isLoading = true;
  cfg.lineColor = "not-a-color";
  chart.setConfig(cfg);
  requireTrue(chart.onAnimationFrame(7000.0), "loading frame");
  requireTrue(vc(cs.axisRecipe().gridSlot()) == 0, "grid hidden");
  requireTrue(vc(cs.statusRecipe().veilSlot()) == 6, "veil");
  requireTrue(vc(cs.statusRecipe().spinnerSlot()) > 0, "spinner");
  requireTrue(chart.frameRequested(), "loading keeps animating");
  requireTrue(vc(cs.areaRecipe().fillSlot()) == 0, "bad line color skips the gradient");
  {
    // loading frames keep coming; the failed color is not rebuilt each time
    const int uploads = surface.store.uploads;
    const std::size_t live = surface.store.live.size();
    requireTrue(chart.onAnimationFrame(7016.0) && chart.onAnimationFrame(7032.0),
                "more loading frames");
    requireTrue(surface.store.uploads == uploads && surface.store.live.size() == live,
                "failed gradient not retried");
    requireTrue(chart.gradientCache().entry().failed, "failure remembered");
  }
  {
    const pc::DrawItem* line = cs.scene().getDrawItem(cs.lineRecipe().segmentSlot().drawItemId);
    const pc::ChartTheme& t = chart.theme();
    requireTrue(line->color[0] == t.lineColor[0] && line->color[2] == t.lineColor[2],
                "bad line color falls back to theme");
  }

  cfg.isLoading = false;
  cfg.showAxisLabels = false;
  cfg.lineColor = "#16a34a";
  chart.setConfig(cfg);
  chart.onAnimationFrame(8000.0);
  requireTrue(!chart.frameRequested(), "idle again");
  requireTrue(chart.viewport().padding().right == 10, "compact padding without labels");
  requireTrue(surface.store.live.size() == 1, "gradient rebuilt for new color, old freed");

  // --- back to empty ---
  chart.setData({});
  chart.render();
  requireTrue(vc(cs.lineRecipe().segmentSlot()) == 0, "empty again");

  // --- teardown is idempotent ---
  const std::uint64_t frames0 = chart.framesRendered();
  requireTrue(frames0 > 0, "frames counted");
  chart.teardown();
  requireTrue(chart.surface() == nullptr, "surface detached");
  requireTrue(surface.store.live.empty(), "gradient texture released");
  requireTrue(surface.buffers.empty(), "staged buffers released");
  requireTrue(!chart.chartScene().isInitialized(), "scene disposed");
  requireTrue(chart.chartScene().scene().drawItemIds().empty(), "no draw items left");
  chart.teardown();
  requireTrue(!chart.render(), "no frames after teardown");

  // --- can be re-attached ---
  chart.setData(makeSeries(10, 5.0));
  requireTrue(chart.attachSurface(&surface), "re-attach");
  requireTrue(chart.render(), "renders again");
  requireTrue(vc(chart.chartScene().lineRecipe().segmentSlot()) == 9, "redrawn");
  requireTrue(chart.chartScene().failedCommands() == 0, "clean re-init");

  // teardown without ever attaching
  {
    pc::PriceChart never;
    never.teardown();
    never.teardown();
  }

  std::printf("D7.2 price chart PASS\n");
  return 0;
}
