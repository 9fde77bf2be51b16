#pragma once
#include "pc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace pc {

class Viewport;

// Dashed guide lines through the selected point and the long-press
// highlight (translucent outer disc plus solid inner disc).
//
// ID layout (offsets from idBase, 9 slots):
//   0-2: guide dashes (buffer, geometry, drawItem) - line2d@1
//   3-5: outer ring   (buffer, geometry, drawItem) - disc@1
//   6-8: inner dot    (buffer, geometry, drawItem) - disc@1
struct CrosshairRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float dashLength{4.0f};
  float gapLength{4.0f};
  float outerRadius{8.0f};
  float innerRadius{4.0f};
};

class CrosshairRecipe : public Recipe {
public:
  CrosshairRecipe(Id idBase, const CrosshairRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override {
    return {guideSlot(), ringSlot(), dotSlot()};
  }

  DrawSlot guideSlot() const { return slotAt(0, VertexFormat::Pos2_Clip); }
  DrawSlot ringSlot() const  { return slotAt(3, VertexFormat::Disc3); }
  DrawSlot dotSlot() const   { return slotAt(6, VertexFormat::Disc3); }

  static constexpr std::uint32_t ID_SLOTS = 9;

  // Vertical dashes top -> chartBottom through x, horizontal dashes
  // left -> chartRight through y.
  VertexData computeGuides(const Viewport& vp, double x, double y) const;

  VertexData computeRing(double x, double y) const;
  VertexData computeDot(double x, double y) const;

private:
  CrosshairRecipeConfig config_;
};

} // namespace pc
