#pragma once
#include "pc/recipe/Recipe.hpp"
#include "pc/chart/ChartTypes.hpp"
#include <string>
#include <vector>

namespace pc {

class Viewport;

// Trade markers: upward triangles for buys, downward for sells.
//
// ID layout (offsets from idBase, 6 slots):
//   0-2: buy markers  (buffer, geometry, drawItem) - triSolid@1
//   3-5: sell markers (buffer, geometry, drawItem) - triSolid@1
struct MarkerRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float tipOffset{12.0f};
  float baseOffset{4.0f};
  float halfWidth{8.0f};
};

class MarkerRecipe : public Recipe {
public:
  MarkerRecipe(Id idBase, const MarkerRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override { return {buySlot(), sellSlot()}; }

  DrawSlot buySlot() const  { return slotAt(0, VertexFormat::Pos2_Clip); }
  DrawSlot sellSlot() const { return slotAt(3, VertexFormat::Pos2_Clip); }

  static constexpr std::uint32_t ID_SLOTS = 6;

  struct MarkerData {
    VertexData buy;
    VertexData sell;
    int matched{0};
  };

  // A marker lands on the first point sharing its timestamp; markers with
  // no such point are skipped.
  MarkerData computeMarkers(const Viewport& vp, const std::vector<PricePoint>& points,
                            const std::vector<ChartMarker>& markers) const;

private:
  MarkerRecipeConfig config_;
};

} // namespace pc
