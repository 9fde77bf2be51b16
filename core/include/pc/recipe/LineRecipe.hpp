#pragma once
#include "pc/recipe/Recipe.hpp"
#include "pc/chart/ChartTypes.hpp"
#include <string>
#include <vector>

namespace pc {

class Viewport;

// Price polyline with round joins and the current-price dot.
//
// ID layout (offsets from idBase, 9 slots):
//   0-2: segments (buffer, geometry, drawItem) - lineAA@1
//   3-5: joins    (buffer, geometry, drawItem) - disc@1, one per vertex
//   6-8: dot      (buffer, geometry, drawItem) - disc@1, last point
struct LineRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float lineWidth{2.0f};
  float dotRadius{5.0f};
};

class LineRecipe : public Recipe {
public:
  LineRecipe(Id idBase, const LineRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override {
    return {segmentSlot(), joinSlot(), dotSlot()};
  }

  DrawSlot segmentSlot() const { return slotAt(0, VertexFormat::Rect4); }
  DrawSlot joinSlot() const    { return slotAt(3, VertexFormat::Disc3); }
  DrawSlot dotSlot() const     { return slotAt(6, VertexFormat::Disc3); }

  static constexpr std::uint32_t ID_SLOTS = 9;

  const LineRecipeConfig& config() const { return config_; }

  VertexData computeSegments(const Viewport& vp, const std::vector<PricePoint>& points) const;
  VertexData computeJoins(const Viewport& vp, const std::vector<PricePoint>& points) const;
  VertexData computeDot(const Viewport& vp, const std::vector<PricePoint>& points) const;

private:
  LineRecipeConfig config_;
};

} // namespace pc
