#include "pc/recipe/MarkerRecipe.hpp"
#include "pc/viewport/Viewport.hpp"

#include <unordered_map>

namespace pc {

MarkerRecipe::MarkerRecipe(Id idBase, const MarkerRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult MarkerRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, buySlot(), config_.layerId, config_.name + "_buy",
          "triSolid@1", config_.transformId);
  addSlot(result, sellSlot(), config_.layerId, config_.name + "_sell",
          "triSolid@1", config_.transformId);
  addDispose(result, slots());
  return result;
}

MarkerRecipe::MarkerData MarkerRecipe::computeMarkers(
    const Viewport& vp, const std::vector<PricePoint>& points,
    const std::vector<ChartMarker>& markers) const {
  MarkerData out;
  if (markers.empty() || points.empty()) return out;

  std::unordered_map<std::int64_t, std::size_t> firstIndex;
  firstIndex.reserve(points.size());
  for (std::size_t i = 0; i < points.size(); i++) {
    firstIndex.emplace(points[i].timestamp, i);
  }

  for (const auto& m : markers) {
    auto it = firstIndex.find(m.timestamp);
    if (it == firstIndex.end()) continue;

    const float x = static_cast<float>(vp.indexToX(static_cast<double>(it->second)));
    const float y = static_cast<float>(vp.priceToY(m.price));
    const float hw = config_.halfWidth;

    if (m.kind == MarkerKind::Buy) {
      out.buy.values.insert(out.buy.values.end(), {
        x, y - config_.tipOffset,
        x - hw, y + config_.baseOffset,
        x + hw, y + config_.baseOffset});
      out.buy.count += 3;
    } else {
      out.sell.values.insert(out.sell.values.end(), {
        x, y + config_.tipOffset,
        x - hw, y - config_.baseOffset,
        x + hw, y - config_.baseOffset});
      out.sell.count += 3;
    }
    out.matched++;
  }
  return out;
}

} // namespace pc
