// Price chart demo
// GLFW: live window with crosshair, long-press and axis animation
// OSMesa fallback: renders one frame with a selection, writes PPM

#include "pc/chart/PriceChart.hpp"
#include "pc/export/ChartSnapshot.hpp"
#include "pc/gl/GlContext.hpp"
#include "pc/gl/GlRenderSurface.hpp"
#include "pc/interaction/Haptics.hpp"
#include "pc/math/PriceFormat.hpp"

#ifdef PC_HAS_GLFW
#include "pc/gl/GlfwContext.hpp"
#endif
#ifdef PC_HAS_OSMESA
#include "pc/gl/OsMesaContext.hpp"
#endif

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <memory>
#include <vector>

// Logs pulses instead of vibrating.
class ConsoleHaptics : public pc::HapticDriver {
public:
  void vibrate(int durationMs) override {
    std::printf("haptic: %d ms\n", durationMs);
  }
};

static std::vector<pc::PricePoint> makeSeries(int count, std::int64_t now,
                                              std::uint32_t& seed) {
  auto rng = [&seed]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0;
  };

  std::vector<pc::PricePoint> out;
  out.reserve(static_cast<std::size_t>(count));
  double price = 0.00015;
  for (int i = 0; i < count; i++) {
    double change = (rng() - 0.48) * price * 0.06;
    price = std::max(price + change, 0.0000001);
    pc::PricePoint p;
    p.timestamp = now - static_cast<std::int64_t>(count - i) * 60;
    p.price = price;
    out.push_back(p);
  }
  return out;
}

static std::vector<pc::ChartMarker> makeMarkers(const std::vector<pc::PricePoint>& pts,
                                                std::uint32_t& seed) {
  std::vector<pc::ChartMarker> out;
  const int indices[] = {30, 75, 120, 160};
  for (int i : indices) {
    if (i >= static_cast<int>(pts.size())) continue;
    seed = seed * 1103515245u + 12345u;
    pc::ChartMarker m;
    m.timestamp = pts[static_cast<std::size_t>(i)].timestamp;
    m.price = pts[static_cast<std::size_t>(i)].price;
    m.kind = ((seed >> 16) & 1u) ? pc::MarkerKind::Buy : pc::MarkerKind::Sell;
    out.push_back(m);
  }
  return out;
}

int main() {
  constexpr int W = 900, H = 400;

  // 1. GL context
  std::unique_ptr<pc::GlContext> glCtx;
  bool isGlfw = false;
#ifdef PC_HAS_GLFW
  { auto g = std::make_unique<pc::GlfwContext>();
    if (g->init(W, H)) { glCtx = std::move(g); isGlfw = true; } }
#endif
#ifdef PC_HAS_OSMESA
  if (!glCtx) {
    auto m = std::make_unique<pc::OsMesaContext>();
    if (!m->init(W, H)) { std::fprintf(stderr, "OSMesa init failed\n"); return 1; }
    glCtx = std::move(m);
    std::printf("Using OSMesa (headless), single frame\n");
  }
#endif
  if (!glCtx) { std::fprintf(stderr, "No GL context\n"); return 1; }

  pc::GlRenderSurface surface(*glCtx);
  if (!surface.init()) { std::fprintf(stderr, "Renderer init failed\n"); return 1; }

  // 2. Data
  std::uint32_t seed = 42;
  const std::int64_t now = static_cast<std::int64_t>(std::time(nullptr));
  auto points = makeSeries(200, now, seed);
  auto markers = makeMarkers(points, seed);
  const double lastPrice = points.back().price;

  pc::ChartConfig cfg;
  cfg.name = "demo";
  cfg.hasCurrentPrice = true;
  cfg.currentPrice = lastPrice;
  cfg.hasCurrentMcap = true;
  cfg.currentMcap = lastPrice * 1000000000.0;

  // 3. Chart
  pc::PriceChart chart(cfg);
#ifdef FONT_PATH
  if (chart.loadFontFile(FONT_PATH)) std::printf("Font loaded\n");
#endif
  ConsoleHaptics haptics;
  chart.setHapticDriver(&haptics);
  chart.setSelectionCallback([](const pc::PricePoint* p) {
    if (p) std::printf("selected $%s\n", pc::formatPrice(p->price).c_str());
  });

  chart.resize(glCtx->width(), glCtx->height());
  if (!chart.attachSurface(&surface)) {
    std::fprintf(stderr, "attachSurface failed\n");
    return 1;
  }
  chart.setData(points);
  chart.setMarkers(markers);

  std::printf("Price chart: %zu points, %zu markers, last $%s\n",
              points.size(), markers.size(), pc::formatPrice(lastPrice).c_str());

  if (isGlfw) {
#ifdef PC_HAS_GLFW
    auto* glfw = static_cast<pc::GlfwContext*>(glCtx.get());
    glfw->setTitle("Price chart | hold to long-press");
    chart.render();

    double nextDataMs = glfw->nowMs() + 5000.0;
    while (!glfw->shouldClose()) {
      auto events = glfw->pollEvents();
      chart.resize(glfw->width(), glfw->height());

      for (const auto& ev : events) {
        switch (ev.type) {
          case pc::PointerEventType::Down:
            chart.pointerDown(ev.pointerId, ev.x, ev.y, ev.timeMs);
            break;
          case pc::PointerEventType::Move:
            chart.pointerMove(ev.x, ev.y);
            break;
          case pc::PointerEventType::Up:
            chart.pointerUp(ev.pointerId);
            break;
          case pc::PointerEventType::Leave:
            chart.pointerLeave();
            break;
        }
      }

      const double t = glfw->nowMs();
      if (t >= nextDataMs) {
        // Append a point so the axis animates toward the new range.
        auto pts = chart.points();
        auto extra = makeSeries(1, pts.back().timestamp + 60, seed);
        pc::PricePoint p = extra.front();
        p.price = pts.back().price * (1.0 + (static_cast<int>((seed >> 16) % 200u) - 100) / 1000.0);
        pts.push_back(p);
        chart.setData(std::move(pts));
        nextDataMs = t + 5000.0;
      }

      chart.tick(t);
      if (chart.frameRequested()) chart.onAnimationFrame(t);
    }
#endif
  } else {
    // Headless: select a point mid-series and hold long enough to trigger
    // the long-press before drawing.
    surface.setSwapOnPresent(false);
    chart.render();
    const auto& vp = chart.viewport();
    const double x = vp.indexToX(120);
    chart.pointerDown(1, x, vp.height() * 0.5, 0.0);
    chart.pointerMove(x, vp.height() * 0.5);
    chart.tick(350.0);
    for (int i = 0; i < 4; i++) chart.onAnimationFrame(350.0 + i * 16.0);

    auto pixels = glCtx->readPixels();
    if (pc::writePPM("price_chart_demo.ppm", pixels.data(),
                     glCtx->width(), glCtx->height(), true)) {
      std::printf("Wrote price_chart_demo.ppm (%dx%d)\n", glCtx->width(), glCtx->height());
    }
    const auto& st = surface.lastStats();
    std::printf("draw calls: %u (masked %u), frame %.2f ms\n",
                st.drawCalls, st.maskedDrawCalls, st.frameMs);
  }

  chart.teardown();
  return 0;
}
