#include "pc/recipe/CrosshairRecipe.hpp"
#include "pc/recipe/Shapes.hpp"
#include "pc/viewport/Viewport.hpp"

namespace pc {

CrosshairRecipe::CrosshairRecipe(Id idBase, const CrosshairRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult CrosshairRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, guideSlot(), config_.layerId, config_.name + "_guides",
          "line2d@1", config_.transformId);
  addSlot(result, ringSlot(), config_.layerId, config_.name + "_ring",
          "disc@1", config_.transformId);
  addSlot(result, dotSlot(), config_.layerId, config_.name + "_dot",
          "disc@1", config_.transformId);
  addDispose(result, slots());
  return result;
}

VertexData CrosshairRecipe::computeGuides(const Viewport& vp, double x, double y) const {
  VertexData data;
  const float fx = static_cast<float>(x);
  const float fy = static_cast<float>(y);
  appendDashedLine(data, fx, static_cast<float>(vp.padding().top),
                   fx, static_cast<float>(vp.chartBottom()),
                   config_.dashLength, config_.gapLength);
  appendDashedLine(data, static_cast<float>(vp.padding().left), fy,
                   static_cast<float>(vp.chartRight()), fy,
                   config_.dashLength, config_.gapLength);
  return data;
}

VertexData CrosshairRecipe::computeRing(double x, double y) const {
  VertexData data;
  data.values = {static_cast<float>(x), static_cast<float>(y), config_.outerRadius};
  data.count = 1;
  return data;
}

VertexData CrosshairRecipe::computeDot(double x, double y) const {
  VertexData data;
  data.values = {static_cast<float>(x), static_cast<float>(y), config_.innerRadius};
  data.count = 1;
  return data;
}

} // namespace pc
