#include "pc/chart/ChartScene.hpp"
#include "pc/chart/RenderSurface.hpp"
#include "pc/style/Color.hpp"
#include "pc/text/GlyphAtlas.hpp"
#include "pc/viewport/Viewport.hpp"

#include <cstdio>
#include <string>

namespace pc {

namespace {

std::string idStr(Id id) { return std::to_string(id); }

std::string numStr(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  return buf;
}

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) continue;
        out += c;
    }
  }
  return out;
}

constexpr int kLayerCount = static_cast<int>(ChartLayer::Count);

} // namespace

const char* toString(ChartLayer layer) {
  switch (layer) {
    case ChartLayer::Grid: return "grid";
    case ChartLayer::GradientFill: return "gradientFill";
    case ChartLayer::GradientMask: return "gradientMask";
    case ChartLayer::Line: return "line";
    case ChartLayer::Labels: return "labels";
    case ChartLayer::Overlay: return "overlay";
    case ChartLayer::Tooltip: return "tooltip";
    case ChartLayer::Status: return "status";
    case ChartLayer::Count: break;
  }
  return "unknown";
}

ChartScene::ChartScene() : cp_(scene_, registry_) {}

ChartScene::~ChartScene() {
  dispose();
}

Id ChartScene::layerId(ChartLayer layer) const {
  return kFirstLayerId + static_cast<Id>(layer);
}

std::vector<Id> ChartScene::layerOrder() const {
  std::vector<Id> out;
  for (Id id : scene_.layerIds()) {
    const Layer* l = scene_.getLayer(id);
    if (l && l->paneId == kPaneId) out.push_back(id);
  }
  return out;
}

bool ChartScene::apply(const std::string& cmd) {
  CmdResult r = cp_.applyJsonText(cmd);
  if (!r.ok) {
    failedCommands_++;
    std::fprintf(stderr, "ChartScene: command failed [%s] %s %s\n",
                 r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
  }
  return r.ok;
}

bool ChartScene::applyAll(const std::vector<CmdString>& cmds) {
  bool ok = true;
  for (const auto& c : cmds) ok = apply(c) && ok;
  return ok;
}

bool ChartScene::init(const std::string& paneName) {
  if (inited_) return true;

  bool ok = apply(R"({"cmd":"createPane","id":)" + idStr(kPaneId) +
                  R"(,"name":")" + jsonEscape(paneName) + R"("})");
  for (int i = 0; i < kLayerCount; i++) {
    const auto layer = static_cast<ChartLayer>(i);
    ok = apply(R"({"cmd":"createLayer","id":)" + idStr(layerId(layer)) +
               R"(,"paneId":)" + idStr(kPaneId) +
               R"(,"name":")" + toString(layer) + R"("})") && ok;
  }
  ok = apply(R"({"cmd":"createTransform","id":)" + idStr(kTransformId) + "}") && ok;
  if (!ok) {
    std::fprintf(stderr, "ChartScene::init: failed to create pane/layers\n");
    return false;
  }

  AxisRecipeConfig axisCfg;
  axisCfg.gridLayerId = layerId(ChartLayer::Grid);
  axisCfg.labelLayerId = layerId(ChartLayer::Labels);
  axisCfg.transformId = kTransformId;
  axisCfg.name = "axis";
  axis_ = std::make_unique<AxisRecipe>(kAxisBase, axisCfg);

  AreaRecipeConfig areaCfg;
  areaCfg.fillLayerId = layerId(ChartLayer::GradientFill);
  areaCfg.maskLayerId = layerId(ChartLayer::GradientMask);
  areaCfg.transformId = kTransformId;
  areaCfg.name = "area";
  area_ = std::make_unique<AreaRecipe>(kAreaBase, areaCfg);

  LineRecipeConfig lineCfg;
  lineCfg.layerId = layerId(ChartLayer::Line);
  lineCfg.transformId = kTransformId;
  lineCfg.name = "price";
  line_ = std::make_unique<LineRecipe>(kLineBase, lineCfg);

  MarkerRecipeConfig markerCfg;
  markerCfg.layerId = layerId(ChartLayer::Line);
  markerCfg.transformId = kTransformId;
  markerCfg.name = "markers";
  markers_ = std::make_unique<MarkerRecipe>(kMarkerBase, markerCfg);

  CrosshairRecipeConfig crossCfg;
  crossCfg.layerId = layerId(ChartLayer::Overlay);
  crossCfg.transformId = kTransformId;
  crossCfg.name = "crosshair";
  crosshair_ = std::make_unique<CrosshairRecipe>(kCrosshairBase, crossCfg);

  TooltipRecipeConfig tipCfg;
  tipCfg.layerId = layerId(ChartLayer::Tooltip);
  tipCfg.transformId = kTransformId;
  tipCfg.name = "tooltip";
  tooltip_ = std::make_unique<TooltipRecipe>(kTooltipBase, tipCfg);

  StatusRecipeConfig statusCfg;
  statusCfg.layerId = layerId(ChartLayer::Status);
  statusCfg.transformId = kTransformId;
  statusCfg.name = "status";
  status_ = std::make_unique<StatusRecipe>(kStatusBase, statusCfg);

  const Recipe* recipes[] = {axis_.get(), area_.get(), line_.get(), markers_.get(),
                             crosshair_.get(), tooltip_.get(), status_.get()};
  slots_.clear();
  for (const Recipe* r : recipes) {
    ok = applyAll(r->build().createCommands) && ok;
    for (const auto& s : r->slots()) slots_.push_back(s);
  }
  if (!ok) {
    std::fprintf(stderr, "ChartScene::init: recipe setup incomplete\n");
  }

  inited_ = true;
  return ok;
}

void ChartScene::dispose() {
  if (!inited_) return;
  releaseSurfaceBuffers();

  const Recipe* recipes[] = {status_.get(), tooltip_.get(), crosshair_.get(),
                             markers_.get(), line_.get(), area_.get(), axis_.get()};
  for (const Recipe* r : recipes) {
    if (r) applyAll(r->build().disposeCommands);
  }
  apply(R"({"cmd":"delete","id":)" + idStr(kTransformId) + "}");
  // Deleting the pane cascades to its layers.
  apply(R"({"cmd":"delete","id":)" + idStr(kPaneId) + "}");

  axis_.reset();
  area_.reset();
  line_.reset();
  markers_.reset();
  crosshair_.reset();
  tooltip_.reset();
  status_.reset();
  slots_.clear();
  boundTexture_ = 0;
  inited_ = false;
}

void ChartScene::setSurface(RenderSurface* surface) {
  if (surface == surface_) return;
  releaseSurfaceBuffers();
  surface_ = surface;
  boundTexture_ = 0;
}

void ChartScene::releaseSurfaceBuffers() {
  if (!surface_) return;
  for (const auto& s : slots_) surface_->releaseBuffer(s.bufferId);
}

void ChartScene::setPaneName(const std::string& name) {
  Pane* p = scene_.getPaneMutable(kPaneId);
  if (p) p->name = name;
}

void ChartScene::applyStyle(const ChartConfig& config, const ChartTheme& theme) {
  if (!inited_) return;

  float line[4], grid[4], cross[4];
  resolveHexColor(config.lineColor, theme.lineColor, line);
  resolveHexColor(config.gridColor, theme.gridColor, grid);
  resolveHexColor(config.crosshairColor, theme.crosshairColor, cross);

  float ring[4] = {line[0], line[1], line[2], line[3] * theme.highlightOuterAlpha};
  const float white[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  std::vector<CmdString> cmds = {
    Recipe::colorCommand(axis_->gridSlot().drawItemId, grid),
    Recipe::colorCommand(axis_->labelSlot().drawItemId, theme.labelColor),
    Recipe::colorCommand(area_->fillSlot().drawItemId, white),
    Recipe::colorCommand(area_->maskSlot().drawItemId, white),
    Recipe::colorCommand(line_->segmentSlot().drawItemId, line),
    Recipe::colorCommand(line_->joinSlot().drawItemId, line),
    Recipe::colorCommand(line_->dotSlot().drawItemId, line),
    Recipe::colorCommand(markers_->buySlot().drawItemId, theme.markerUp),
    Recipe::colorCommand(markers_->sellSlot().drawItemId, theme.markerDown),
    Recipe::colorCommand(crosshair_->guideSlot().drawItemId, cross),
    Recipe::colorCommand(crosshair_->ringSlot().drawItemId, ring),
    Recipe::colorCommand(crosshair_->dotSlot().drawItemId, line),
    Recipe::colorCommand(tooltip_->fillSlot().drawItemId, theme.tooltipFill),
    Recipe::colorCommand(tooltip_->borderSlot().drawItemId, theme.tooltipBorder),
    Recipe::colorCommand(tooltip_->mutedTextSlot().drawItemId, theme.labelColor),
    Recipe::colorCommand(tooltip_->valueTextSlot().drawItemId, theme.valueColor),
    Recipe::colorCommand(status_->veilSlot().drawItemId, theme.loadingVeil),
    Recipe::colorCommand(status_->pillSlot().drawItemId, theme.loadingPill),
    Recipe::colorCommand(status_->spinnerSlot().drawItemId, theme.loadingInk),
    Recipe::colorCommand(status_->pillTextSlot().drawItemId, theme.loadingInk),
    Recipe::colorCommand(status_->placeholderSlot().drawItemId, theme.labelColor),
  };
  cmds.push_back(R"({"cmd":"setPaneClearColor","paneId":)" + idStr(kPaneId) +
                 R"(,"r":)" + numStr(theme.backgroundColor[0]) +
                 R"(,"g":)" + numStr(theme.backgroundColor[1]) +
                 R"(,"b":)" + numStr(theme.backgroundColor[2]) +
                 R"(,"a":)" + numStr(theme.backgroundColor[3]) + "}");
  applyAll(cmds);
  setPaneName(config.name);
}

std::uint32_t ChartScene::vertexCount(const DrawSlot& slot) const {
  const Geometry* g = scene_.getGeometry(slot.geometryId);
  return g ? g->vertexCount : 0;
}

void ChartScene::resetCounts() {
  for (const auto& s : slots_) {
    const Geometry* g = scene_.getGeometry(s.geometryId);
    if (g && g->vertexCount != 0) apply(Recipe::vertexCountCommand(s.geometryId, 0));
  }
}

void ChartScene::upload(const DrawSlot& slot, const VertexData& data) {
  if (data.count == 0) return;
  if (surface_) {
    const auto bytes = static_cast<std::uint32_t>(data.values.size() * sizeof(float));
    surface_->setBufferData(slot.bufferId, data.values.data(), bytes);
  }
  apply(Recipe::vertexCountCommand(slot.geometryId, data.count));
}

void ChartScene::bindGradientTexture(Id textureId) {
  if (textureId == boundTexture_) return;
  apply(R"({"cmd":"setDrawItemTexture","drawItemId":)" +
        idStr(area_->fillSlot().drawItemId) +
        R"(,"textureId":)" + idStr(textureId) + "}");
  boundTexture_ = textureId;
}

void ChartScene::setTransform(const Viewport& vp) {
  const TransformParams tp = vp.computeTransformParams();
  apply(R"({"cmd":"setTransform","id":)" + idStr(kTransformId) +
        R"(,"tx":)" + numStr(tp.tx) + R"(,"ty":)" + numStr(tp.ty) +
        R"(,"sx":)" + numStr(tp.sx) + R"(,"sy":)" + numStr(tp.sy) + "}");
}

bool ChartScene::buildEmptyFrame(double width, double height) {
  if (!inited_) return false;
  apply(R"({"cmd":"beginFrame"})");
  resetCounts();

  Viewport vp;
  vp.setSize(width, height);
  setTransform(vp);
  upload(status_->placeholderSlot(), status_->computePlaceholder(width, height, atlas_));

  apply(R"({"cmd":"commitFrame"})");
  return true;
}

bool ChartScene::buildFrame(const ChartFrame& frame) {
  if (!inited_ || !frame.viewport || !frame.points || !frame.config) return false;
  const Viewport& vp = *frame.viewport;
  const auto& points = *frame.points;
  const ChartConfig& cfg = *frame.config;

  apply(R"({"cmd":"beginFrame"})");
  resetCounts();
  setTransform(vp);

  if (cfg.showGrid) {
    upload(axis_->gridSlot(), axis_->computeGrid(vp));
  }

  // Gradient and its mask stay empty when no texture could be produced.
  bindGradientTexture(frame.gradientTextureId);
  if (frame.gradientTextureId != kInvalidId) {
    upload(area_->fillSlot(), area_->computeFill(vp));
    upload(area_->maskSlot(), area_->computeMask(vp, points));
  }

  upload(line_->segmentSlot(), line_->computeSegments(vp, points));
  upload(line_->joinSlot(), line_->computeJoins(vp, points));
  upload(line_->dotSlot(), line_->computeDot(vp, points));

  if (frame.markers && !frame.markers->empty()) {
    auto m = markers_->computeMarkers(vp, points, *frame.markers);
    upload(markers_->buySlot(), m.buy);
    upload(markers_->sellSlot(), m.sell);
  }

  if (cfg.showAxisLabels && atlas_ && atlas_->hasFont()) {
    upload(axis_->labelSlot(), axis_->computeLabels(vp, *atlas_));
  }

  buildCrosshair(frame);

  if (cfg.isLoading) buildLoading(frame);

  apply(R"({"cmd":"commitFrame"})");
  return true;
}

void ChartScene::buildCrosshair(const ChartFrame& frame) {
  if (!frame.interaction || !frame.interaction->hasSelection()) return;
  const auto& points = *frame.points;
  const int index = frame.interaction->selectedIndex;
  if (index < 0 || static_cast<std::size_t>(index) >= points.size()) return;

  const Viewport& vp = *frame.viewport;
  const ChartConfig& cfg = *frame.config;
  const PricePoint& p = points[static_cast<std::size_t>(index)];
  const double x = vp.indexToX(static_cast<double>(index));
  const double y = vp.priceToY(p.price);

  upload(crosshair_->guideSlot(), crosshair_->computeGuides(vp, x, y));
  if (frame.interaction->isLongPress) {
    upload(crosshair_->ringSlot(), crosshair_->computeRing(x, y));
    upload(crosshair_->dotSlot(), crosshair_->computeDot(x, y));
  }

  const TooltipContent content = TooltipRecipe::makeContent(
    p, cfg.hasCurrentMcap, cfg.currentMcap, cfg.hasCurrentPrice, cfg.currentPrice,
    cfg.utcTimestamps);
  const TooltipBox box = tooltip_->place(x, y, vp.width(), vp.height(), content.hasMcap);
  const TooltipVertices v = tooltip_->compute(box, content, atlas_);
  upload(tooltip_->fillSlot(), v.fill);
  upload(tooltip_->borderSlot(), v.border);
  upload(tooltip_->mutedTextSlot(), v.mutedText);
  upload(tooltip_->valueTextSlot(), v.valueText);
}

void ChartScene::buildLoading(const ChartFrame& frame) {
  const Viewport& vp = *frame.viewport;
  const LoadingVertices v = status_->computeLoading(vp.width(), vp.height(),
                                                    frame.loadingPhase, atlas_);
  upload(status_->veilSlot(), v.veil);
  upload(status_->pillSlot(), v.pill);
  upload(status_->spinnerSlot(), v.spinner);
  upload(status_->pillTextSlot(), v.text);
}

bool ChartScene::present(int width, int height) {
  if (!surface_) return false;
  return surface_->present(scene_, width, height);
}

} // namespace pc
