#include "pc/recipe/AreaRecipe.hpp"
#include "pc/viewport/Viewport.hpp"

namespace pc {

AreaRecipe::AreaRecipe(Id idBase, const AreaRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult AreaRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, fillSlot(), config_.fillLayerId, config_.name + "_gradient",
          "texturedQuad@1", config_.transformId);
  addSlot(result, maskSlot(), config_.maskLayerId, config_.name + "_mask",
          "triSolid@1", config_.transformId);
  result.createCommands.push_back(
    R"({"cmd":"setDrawItemMask","drawItemId":)" + std::to_string(fillSlot().drawItemId) +
    R"(,"maskDrawItemId":)" + std::to_string(maskSlot().drawItemId) + "}");
  addDispose(result, slots());
  return result;
}

VertexData AreaRecipe::computeFill(const Viewport& vp) const {
  VertexData data;
  const float top = static_cast<float>(vp.padding().top);
  data.values = {0.0f, top, static_cast<float>(vp.width()),
                 top + static_cast<float>(vp.chartHeight())};
  data.count = 1;
  return data;
}

VertexData AreaRecipe::computeMask(const Viewport& vp,
                                   const std::vector<PricePoint>& points) const {
  VertexData data;
  if (points.size() < 2) return data;

  const float bottom = static_cast<float>(vp.chartBottom());
  data.values.reserve((points.size() - 1) * 12);

  float x0 = static_cast<float>(vp.indexToX(0));
  float y0 = static_cast<float>(vp.priceToY(points[0].price));
  for (std::size_t i = 1; i < points.size(); i++) {
    const float x1 = static_cast<float>(vp.indexToX(static_cast<double>(i)));
    const float y1 = static_cast<float>(vp.priceToY(points[i].price));

    // top-left, bottom-left, top-right / top-right, bottom-left, bottom-right
    data.values.insert(data.values.end(), {x0, y0, x0, bottom, x1, y1,
                                           x1, y1, x0, bottom, x1, bottom});
    x0 = x1;
    y0 = y1;
  }
  data.count = static_cast<std::uint32_t>((points.size() - 1) * 6);
  return data;
}

} // namespace pc
