#pragma once
#include "pc/recipe/Recipe.hpp"
#include "pc/chart/ChartTypes.hpp"
#include <string>
#include <vector>

namespace pc {

class Viewport;

// Gradient under the price line: a texture sprite over the plot area,
// stencil-masked by the silhouette between the line and the chart bottom.
//
// ID layout (offsets from idBase, 6 slots):
//   0-2: gradient sprite (buffer, geometry, drawItem) - texturedQuad@1
//   3-5: silhouette mask (buffer, geometry, drawItem) - triSolid@1, mask only
struct AreaRecipeConfig {
  Id fillLayerId{0};
  Id maskLayerId{0};
  Id transformId{0};
  std::string name;
};

class AreaRecipe : public Recipe {
public:
  AreaRecipe(Id idBase, const AreaRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override { return {fillSlot(), maskSlot()}; }

  DrawSlot fillSlot() const { return slotAt(0, VertexFormat::Rect4); }
  DrawSlot maskSlot() const { return slotAt(3, VertexFormat::Pos2_Clip); }

  static constexpr std::uint32_t ID_SLOTS = 6;

  // Sprite rectangle: full viewport width, plot-area height.
  VertexData computeFill(const Viewport& vp) const;

  // Closed polygon line -> bottom-right -> bottom-left, triangulated as one
  // quad per segment down to the chart bottom.
  VertexData computeMask(const Viewport& vp, const std::vector<PricePoint>& points) const;

private:
  AreaRecipeConfig config_;
};

} // namespace pc
