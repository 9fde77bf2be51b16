#include "pc/recipe/AxisRecipe.hpp"
#include "pc/math/PriceFormat.hpp"
#include "pc/text/TextLayout.hpp"
#include "pc/viewport/Viewport.hpp"

namespace pc {

AxisRecipe::AxisRecipe(Id idBase, const AxisRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult AxisRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, gridSlot(), config_.gridLayerId, config_.name + "_grid",
          "line2d@1", config_.transformId);
  addSlot(result, labelSlot(), config_.labelLayerId, config_.name + "_labels",
          "textSDF@1", config_.transformId);
  addDispose(result, slots());
  return result;
}

std::vector<double> AxisRecipe::levelPrices(double axisMin, double axisMax) const {
  std::vector<double> out;
  const double step = (axisMax - axisMin) / config_.steps;
  for (int i = 0; i <= config_.steps; i++) out.push_back(axisMax - i * step);
  return out;
}

std::vector<double> AxisRecipe::levelYs(const Viewport& vp) const {
  std::vector<double> out;
  const double step = vp.chartHeight() / config_.steps;
  for (int i = 0; i <= config_.steps; i++) out.push_back(vp.padding().top + i * step);
  return out;
}

VertexData AxisRecipe::computeGrid(const Viewport& vp) const {
  VertexData data;
  const float x0 = static_cast<float>(vp.padding().left);
  const float x1 = static_cast<float>(vp.chartRight());
  for (double y : levelYs(vp)) {
    const float fy = static_cast<float>(y);
    data.values.insert(data.values.end(), {x0, fy, x1, fy});
    data.count += 2;
  }
  return data;
}

VertexData AxisRecipe::computeLabels(const Viewport& vp, const GlyphAtlas& atlas) const {
  VertexData data;
  const std::vector<double> prices = levelPrices(vp.axisMin(), vp.axisMax());
  const std::vector<double> ys = levelYs(vp);
  const float rightX = static_cast<float>(vp.width()) - config_.labelRightInset;

  for (std::size_t i = 0; i < prices.size(); i++) {
    const std::string text = formatPrice(prices[i]);
    const float baseline = baselineForMiddle(atlas, static_cast<float>(ys[i]),
                                             config_.labelFontSize);
    auto layout = layoutTextRightAligned(atlas, text, rightX, baseline, config_.labelFontSize);
    data.values.insert(data.values.end(),
                       layout.glyphInstances.begin(), layout.glyphInstances.end());
    data.count += static_cast<std::uint32_t>(layout.glyphCount);
  }
  return data;
}

} // namespace pc
