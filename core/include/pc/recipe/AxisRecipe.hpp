#pragma once
#include "pc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace pc {

class GlyphAtlas;
class Viewport;

// Horizontal price grid and its right-aligned price labels.
//
// ID layout (offsets from idBase, 6 slots):
//   0-2: grid lines (buffer, geometry, drawItem) - line2d@1
//   3-5: labels     (buffer, geometry, drawItem) - textSDF@1
struct AxisRecipeConfig {
  Id gridLayerId{0};
  Id labelLayerId{0};
  Id transformId{0};
  std::string name;
  int steps{5};              // grid rows = steps + 1
  float labelFontSize{11.0f};
  float labelRightInset{8.0f};
};

class AxisRecipe : public Recipe {
public:
  AxisRecipe(Id idBase, const AxisRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override { return {gridSlot(), labelSlot()}; }

  DrawSlot gridSlot() const  { return slotAt(0, VertexFormat::Pos2_Clip); }
  DrawSlot labelSlot() const { return slotAt(3, VertexFormat::Glyph8); }

  static constexpr std::uint32_t ID_SLOTS = 6;

  const AxisRecipeConfig& config() const { return config_; }

  // Price at each grid row, top row first: axisMax - i * (range / steps).
  std::vector<double> levelPrices(double axisMin, double axisMax) const;

  // Y of each grid row, top row first.
  std::vector<double> levelYs(const Viewport& vp) const;

  VertexData computeGrid(const Viewport& vp) const;
  VertexData computeLabels(const Viewport& vp, const GlyphAtlas& atlas) const;

private:
  AxisRecipeConfig config_;
};

} // namespace pc
