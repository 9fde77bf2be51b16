#pragma once
#include "pc/chart/ChartConfig.hpp"
#include "pc/chart/ChartScene.hpp"
#include "pc/chart/ChartTypes.hpp"
#include "pc/interaction/InteractionController.hpp"
#include "pc/style/Theme.hpp"
#include "pc/text/GlyphAtlas.hpp"
#include "pc/texture/GradientCache.hpp"
#include "pc/viewport/AutoScale.hpp"
#include "pc/viewport/AxisAnimator.hpp"
#include "pc/viewport/Viewport.hpp"

#include <string>
#include <vector>

namespace pc {

class RenderSurface;

// A real-time price chart bound to a host-provided surface.
//
// The host owns time and the frame loop: it forwards pointer events and a
// millisecond clock, and calls onAnimationFrame() whenever frameRequested()
// is true. Everything runs on the host's thread.
class PriceChart {
public:
  PriceChart();
  explicit PriceChart(const ChartConfig& config);
  ~PriceChart();

  PriceChart(const PriceChart&) = delete;
  PriceChart& operator=(const PriceChart&) = delete;

  // ---- inputs ----
  void setData(std::vector<PricePoint> points);
  void setMarkers(std::vector<ChartMarker> markers);
  void setConfig(const ChartConfig& config);
  void setTheme(const ChartTheme& theme);
  void resize(double width, double height);

  // Font for labels, tooltip and status text. Without one, text layers stay
  // empty and everything else draws.
  bool loadFontFile(const std::string& path);
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // ---- surface ----
  bool attachSurface(RenderSurface* surface);
  void detachSurface();
  RenderSurface* surface() const { return surface_; }

  // ---- frames ----
  // Draw one frame now. No-op (false) without a surface or with an empty
  // viewport.
  bool render();

  // Advance the host clock: fires a due long-press and drives the spinner.
  void tick(double nowMs);

  bool frameRequested() const { return frameRequested_; }

  // tick() + render() for a requested animation frame.
  bool onAnimationFrame(double nowMs);

  // ---- pointer events (surface pixels) ----
  void pointerDown(int pointerId, double x, double y, double nowMs);
  void pointerMove(double x, double y);
  void pointerUp(int pointerId);
  void pointerCancel();
  void pointerLeave();

  void setSelectionCallback(SelectionCallback cb);
  void setHapticDriver(HapticDriver* driver);
  void setPointerCaptureHost(PointerCaptureHost* host);

  // Cancel timers and frame requests, release the gradient texture and all
  // scene resources, detach the surface. Safe to call repeatedly.
  void teardown();

  // ---- state ----
  const ChartConfig& config() const { return config_; }
  const ChartTheme& theme() const { return theme_; }
  const std::vector<PricePoint>& points() const { return points_; }
  const std::vector<ChartMarker>& markers() const { return markers_; }
  const Viewport& viewport() const { return viewport_; }
  const AxisAnimator& axis() const { return axis_; }
  const InteractionState& interaction() const { return interaction_.state(); }
  const InteractionController& interactionController() const { return interaction_; }
  const GradientCache& gradientCache() const { return gradient_; }
  const ChartScene& chartScene() const { return scene_; }
  const GlyphAtlas& glyphAtlas() const { return atlas_; }
  std::uint64_t framesRendered() const { return framesRendered_; }

private:
  ChartConfig config_;
  ChartTheme theme_;

  std::vector<PricePoint> points_;
  std::vector<ChartMarker> markers_;

  Viewport viewport_;
  AutoScale autoScale_;
  AxisAnimator axis_;
  GradientCache gradient_;
  GlyphAtlas atlas_;
  InteractionController interaction_;
  ChartScene scene_;

  RenderSurface* surface_{nullptr};

  bool frameRequested_{false};
  bool rendering_{false};
  double lastTickMs_{0};
  std::uint64_t framesRendered_{0};

  void wireInteraction();
  void retarget(bool snap);
  bool ensureScene();
  void onRenderRequested();
  void fontLoaded();
};

} // namespace pc
