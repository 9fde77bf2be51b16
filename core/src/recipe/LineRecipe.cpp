#include "pc/recipe/LineRecipe.hpp"
#include "pc/viewport/Viewport.hpp"

namespace pc {

LineRecipe::LineRecipe(Id idBase, const LineRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult LineRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, segmentSlot(), config_.layerId, config_.name + "_line",
          "lineAA@1", config_.transformId);
  addSlot(result, joinSlot(), config_.layerId, config_.name + "_joins",
          "disc@1", config_.transformId);
  addSlot(result, dotSlot(), config_.layerId, config_.name + "_dot",
          "disc@1", config_.transformId);
  result.createCommands.push_back(lineWidthCommand(segmentSlot().drawItemId, config_.lineWidth));
  addDispose(result, slots());
  return result;
}

VertexData LineRecipe::computeSegments(const Viewport& vp,
                                       const std::vector<PricePoint>& points) const {
  VertexData data;
  if (points.size() < 2) return data;
  data.values.reserve((points.size() - 1) * 4);

  float x0 = static_cast<float>(vp.indexToX(0));
  float y0 = static_cast<float>(vp.priceToY(points[0].price));
  for (std::size_t i = 1; i < points.size(); i++) {
    const float x1 = static_cast<float>(vp.indexToX(static_cast<double>(i)));
    const float y1 = static_cast<float>(vp.priceToY(points[i].price));
    data.values.insert(data.values.end(), {x0, y0, x1, y1});
    x0 = x1;
    y0 = y1;
  }
  data.count = static_cast<std::uint32_t>(points.size() - 1);
  return data;
}

VertexData LineRecipe::computeJoins(const Viewport& vp,
                                    const std::vector<PricePoint>& points) const {
  VertexData data;
  const float r = config_.lineWidth * 0.5f;
  data.values.reserve(points.size() * 3);
  for (std::size_t i = 0; i < points.size(); i++) {
    data.values.push_back(static_cast<float>(vp.indexToX(static_cast<double>(i))));
    data.values.push_back(static_cast<float>(vp.priceToY(points[i].price)));
    data.values.push_back(r);
  }
  data.count = static_cast<std::uint32_t>(points.size());
  return data;
}

VertexData LineRecipe::computeDot(const Viewport& vp,
                                  const std::vector<PricePoint>& points) const {
  VertexData data;
  if (points.empty()) return data;
  const std::size_t last = points.size() - 1;
  data.values = {static_cast<float>(vp.indexToX(static_cast<double>(last))),
                 static_cast<float>(vp.priceToY(points[last].price)),
                 config_.dotRadius};
  data.count = 1;
  return data;
}

} // namespace pc
