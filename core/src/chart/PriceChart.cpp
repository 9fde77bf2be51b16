#include "pc/chart/PriceChart.hpp"
#include "pc/chart/RenderSurface.hpp"

#include <cmath>
#include <cstdio>
#include <utility>

namespace pc {

PriceChart::PriceChart() : PriceChart(ChartConfig{}) {}

PriceChart::PriceChart(const ChartConfig& config)
  : config_(config), theme_(defaultChartTheme()) {
  viewport_.setPadding(paddingFor(config_.showAxisLabels));
  InteractionConfig ic;
  ic.longPressDelayMs = config_.longPressDelayMs;
  interaction_.setConfig(ic);
  wireInteraction();
}

PriceChart::~PriceChart() {
  teardown();
}

void PriceChart::wireInteraction() {
  interaction_.setSeries(&points_, &viewport_);
  interaction_.setRenderRequest([this]() { onRenderRequested(); });
}

void PriceChart::onRenderRequested() {
  // Handlers re-render immediately; a request raised while drawing waits
  // for the next animation frame.
  if (rendering_) {
    frameRequested_ = true;
    return;
  }
  render();
}

void PriceChart::retarget(bool snap) {
  PriceBounds bounds;
  if (!autoScale_.computeBounds(points_, bounds)) {
    axis_.clear();
    return;
  }
  if (snap || !axis_.hasBounds()) {
    axis_.reset(bounds);
  } else {
    axis_.setTarget(bounds);
  }
}

void PriceChart::setData(std::vector<PricePoint> points) {
  points_ = std::move(points);
  viewport_.setPointCount(points_.size());
  retarget(false);
  interaction_.reset();
  frameRequested_ = true;
}

void PriceChart::setMarkers(std::vector<ChartMarker> markers) {
  markers_ = std::move(markers);
  frameRequested_ = true;
}

void PriceChart::setConfig(const ChartConfig& config) {
  const bool paddingChanged = config.showAxisLabels != config_.showAxisLabels;
  config_ = config;

  viewport_.setPadding(paddingFor(config_.showAxisLabels));
  if (paddingChanged) interaction_.reset();

  InteractionConfig ic = interaction_.config();
  ic.longPressDelayMs = config_.longPressDelayMs;
  interaction_.setConfig(ic);

  if (scene_.isInitialized()) scene_.applyStyle(config_, theme_);
  frameRequested_ = true;
}

void PriceChart::setTheme(const ChartTheme& theme) {
  theme_ = theme;
  if (scene_.isInitialized()) scene_.applyStyle(config_, theme_);
  frameRequested_ = true;
}

void PriceChart::resize(double width, double height) {
  if (width == viewport_.width() && height == viewport_.height()) return;
  viewport_.setSize(width < 0 ? 0 : width, height < 0 ? 0 : height);
  interaction_.reset();
  frameRequested_ = true;
}

void PriceChart::fontLoaded() {
  if (!atlas_.ensureAscii()) {
    std::fprintf(stderr, "PriceChart: glyph atlas could not take the ASCII set\n");
  }
  frameRequested_ = true;
}

bool PriceChart::loadFontFile(const std::string& path) {
  if (!atlas_.loadFontFile(path)) return false;
  fontLoaded();
  return true;
}

bool PriceChart::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!atlas_.loadFont(data, len)) return false;
  fontLoaded();
  return true;
}

bool PriceChart::ensureScene() {
  if (scene_.isInitialized()) return true;
  scene_.setGlyphAtlas(&atlas_);
  if (!scene_.init(config_.name)) {
    std::fprintf(stderr, "PriceChart: scene setup failed\n");
    // A partial scene still draws whatever was created.
  }
  scene_.applyStyle(config_, theme_);
  return scene_.isInitialized();
}

bool PriceChart::attachSurface(RenderSurface* surface) {
  if (surface == surface_) return surface_ != nullptr;
  detachSurface();
  if (!surface) return false;

  surface_ = surface;
  surface_->setGlyphAtlas(&atlas_);
  gradient_.setStore(surface_->textures());
  scene_.setSurface(surface_);
  frameRequested_ = true;
  return ensureScene();
}

void PriceChart::detachSurface() {
  if (!surface_) return;
  // The cached texture lives in the old surface's store.
  gradient_.setStore(nullptr);
  scene_.setSurface(nullptr);
  surface_->setGlyphAtlas(nullptr);
  surface_ = nullptr;
}

bool PriceChart::render() {
  if (!surface_ || !viewport_.hasArea()) return false;
  if (!ensureScene()) return false;

  rendering_ = true;
  const int w = static_cast<int>(viewport_.width());
  const int h = static_cast<int>(viewport_.height());

  if (points_.empty()) {
    scene_.buildEmptyFrame(viewport_.width(), viewport_.height());
    const bool ok = scene_.present(w, h);
    rendering_ = false;
    frameRequested_ = false;
    if (ok) framesRendered_++;
    return ok;
  }

  if (!axis_.hasBounds()) retarget(true);
  axis_.step();
  viewport_.setAxis(axis_.state().min, axis_.state().max);

  const Id gradientTex = gradient_.getTexture(
    static_cast<int>(viewport_.width()), static_cast<int>(viewport_.chartHeight()),
    config_.lineColor);

  ChartFrame frame;
  frame.viewport = &viewport_;
  frame.points = &points_;
  frame.markers = &markers_;
  frame.config = &config_;
  frame.interaction = &interaction_.state();
  frame.gradientTextureId = gradientTex;
  frame.loadingPhase = std::fmod(lastTickMs_ / 1000.0, 1.0);

  bool ok = scene_.buildFrame(frame);
  ok = scene_.present(w, h) && ok;
  rendering_ = false;
  if (ok) framesRendered_++;

  frameRequested_ = axis_.needsAnimation() || config_.isLoading;
  return ok;
}

void PriceChart::tick(double nowMs) {
  lastTickMs_ = nowMs;
  interaction_.tick(nowMs);
  if (config_.isLoading && surface_) frameRequested_ = true;
}

bool PriceChart::onAnimationFrame(double nowMs) {
  frameRequested_ = false;
  tick(nowMs);
  return render();
}

void PriceChart::pointerDown(int pointerId, double x, double y, double nowMs) {
  lastTickMs_ = nowMs;
  interaction_.pointerDown(pointerId, x, y, nowMs);
}

void PriceChart::pointerMove(double x, double y) {
  interaction_.pointerMove(x, y);
}

void PriceChart::pointerUp(int pointerId) {
  interaction_.pointerUp(pointerId);
}

void PriceChart::pointerCancel() {
  interaction_.pointerCancel();
}

void PriceChart::pointerLeave() {
  interaction_.pointerLeave();
}

void PriceChart::setSelectionCallback(SelectionCallback cb) {
  interaction_.setSelectionCallback(std::move(cb));
}

void PriceChart::setHapticDriver(HapticDriver* driver) {
  interaction_.setHapticDriver(driver);
}

void PriceChart::setPointerCaptureHost(PointerCaptureHost* host) {
  interaction_.setCaptureHost(host);
}

void PriceChart::teardown() {
  interaction_.cancelPending();
  frameRequested_ = false;
  gradient_.release();
  // Scene buffers are released on the surface before it goes.
  scene_.dispose();
  detachSurface();
  axis_.clear();
}

} // namespace pc
