#pragma once
#include "pc/chart/ChartConfig.hpp"
#include "pc/chart/ChartTypes.hpp"
#include "pc/commands/CommandProcessor.hpp"
#include "pc/interaction/InteractionState.hpp"
#include "pc/recipe/AreaRecipe.hpp"
#include "pc/recipe/AxisRecipe.hpp"
#include "pc/recipe/CrosshairRecipe.hpp"
#include "pc/recipe/LineRecipe.hpp"
#include "pc/recipe/MarkerRecipe.hpp"
#include "pc/recipe/StatusRecipe.hpp"
#include "pc/recipe/TooltipRecipe.hpp"
#include "pc/scene/ResourceRegistry.hpp"
#include "pc/scene/Scene.hpp"
#include "pc/style/Theme.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pc {

class GlyphAtlas;
class RenderSurface;
class Viewport;

// Scene layers, bottom to top. Created once in this order, never reordered.
enum class ChartLayer : std::uint8_t {
  Grid,
  GradientFill,
  GradientMask,
  Line,
  Labels,
  Overlay,
  Tooltip,
  Status,
  Count
};

const char* toString(ChartLayer layer);

// Everything a frame is drawn from. Pointers are borrowed for the call.
struct ChartFrame {
  const Viewport* viewport{nullptr};
  const std::vector<PricePoint>* points{nullptr};
  const std::vector<ChartMarker>* markers{nullptr};
  const ChartConfig* config{nullptr};
  const InteractionState* interaction{nullptr};
  Id gradientTextureId{0};    // 0: no gradient this frame
  double loadingPhase{0};     // spinner rotation, fraction of a turn
};

// Owns the chart's scene graph: one pane, the fixed layer stack and the
// recipes that fill it. Each frame clears every draw item and repopulates
// it from the frame inputs, then uploads through the attached surface.
class ChartScene {
public:
  static constexpr Id kPaneId = 1;
  static constexpr Id kFirstLayerId = 2;
  static constexpr Id kTransformId = 20;

  static constexpr Id kAxisBase = 100;
  static constexpr Id kAreaBase = 110;
  static constexpr Id kLineBase = 120;
  static constexpr Id kMarkerBase = 130;
  static constexpr Id kCrosshairBase = 140;
  static constexpr Id kTooltipBase = 150;
  static constexpr Id kStatusBase = 170;

  ChartScene();
  ~ChartScene();

  ChartScene(const ChartScene&) = delete;
  ChartScene& operator=(const ChartScene&) = delete;

  // Create the pane, the layer stack, the pixel transform and every recipe.
  bool init(const std::string& paneName);

  // Dispose recipes, layers and pane; releases staged surface buffers.
  void dispose();

  bool isInitialized() const { return inited_; }

  // Surfaces are borrowed. Switching releases buffers staged on the old one.
  void setSurface(RenderSurface* surface);
  RenderSurface* surface() const { return surface_; }

  void setGlyphAtlas(const GlyphAtlas* atlas) { atlas_ = atlas; }

  void setPaneName(const std::string& name);

  // Push colors and line styles to the draw items.
  void applyStyle(const ChartConfig& config, const ChartTheme& theme);

  // Full chart frame. Returns false when the frame could not be built.
  bool buildFrame(const ChartFrame& frame);

  // No data: every layer empty except the centered placeholder.
  bool buildEmptyFrame(double width, double height);

  // Hand the scene to the surface. False without a surface.
  bool present(int width, int height);

  const Scene& scene() const { return scene_; }
  CommandProcessor& commands() { return cp_; }

  Id layerId(ChartLayer layer) const;
  std::vector<Id> layerOrder() const;

  // Current vertex (or instance) count of a slot's geometry.
  std::uint32_t vertexCount(const DrawSlot& slot) const;

  const AxisRecipe& axisRecipe() const { return *axis_; }
  const AreaRecipe& areaRecipe() const { return *area_; }
  const LineRecipe& lineRecipe() const { return *line_; }
  const MarkerRecipe& markerRecipe() const { return *markers_; }
  const CrosshairRecipe& crosshairRecipe() const { return *crosshair_; }
  const TooltipRecipe& tooltipRecipe() const { return *tooltip_; }
  const StatusRecipe& statusRecipe() const { return *status_; }

  // Commands rejected by the processor since init (each one is logged).
  std::uint64_t failedCommands() const { return failedCommands_; }

private:
  Scene scene_;
  ResourceRegistry registry_;
  CommandProcessor cp_;

  std::unique_ptr<AxisRecipe> axis_;
  std::unique_ptr<AreaRecipe> area_;
  std::unique_ptr<LineRecipe> line_;
  std::unique_ptr<MarkerRecipe> markers_;
  std::unique_ptr<CrosshairRecipe> crosshair_;
  std::unique_ptr<TooltipRecipe> tooltip_;
  std::unique_ptr<StatusRecipe> status_;

  RenderSurface* surface_{nullptr};
  const GlyphAtlas* atlas_{nullptr};

  std::vector<DrawSlot> slots_;
  Id boundTexture_{0};
  bool inited_{false};
  std::uint64_t failedCommands_{0};

  bool apply(const std::string& cmd);
  bool applyAll(const std::vector<CmdString>& cmds);

  void resetCounts();
  void upload(const DrawSlot& slot, const VertexData& data);
  void bindGradientTexture(Id textureId);
  void setTransform(const Viewport& vp);
  void releaseSurfaceBuffers();

  void buildCrosshair(const ChartFrame& frame);
  void buildLoading(const ChartFrame& frame);
};

} // namespace pc
