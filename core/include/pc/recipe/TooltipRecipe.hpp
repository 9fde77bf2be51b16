#pragma once
#include "pc/recipe/Recipe.hpp"
#include "pc/chart/ChartTypes.hpp"
#include <string>
#include <vector>

namespace pc {

class GlyphAtlas;

// Tooltip box next to the selected point: rounded white card with the
// timestamp, the price and (optionally) the implied market cap.
//
// ID layout (offsets from idBase, 12 slots):
//   0-2:  card fill   (buffer, geometry, drawItem) - triSolid@1
//   3-5:  card border (buffer, geometry, drawItem) - lineAA@1
//   6-8:  muted text  (buffer, geometry, drawItem) - textSDF@1 (timestamp, mcap)
//   9-11: value text  (buffer, geometry, drawItem) - textSDF@1 (price)
struct TooltipRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float width{130.0f};
  float heightWithMcap{65.0f};
  float heightWithoutMcap{50.0f};
  float cornerRadius{6.0f};
  float textInset{8.0f};
  float timestampFontSize{10.0f};
  float valueFontSize{12.0f};
};

struct TooltipBox {
  float x{0}, y{0}, w{0}, h{0};
  bool flipped{false};
};

struct TooltipContent {
  std::string timestamp;
  std::string price;  // "$" + formatPrice
  std::string mcap;   // "MCAP: " + formatMarketCap, empty when not shown
  bool hasMcap{false};
};

struct TooltipVertices {
  VertexData fill;
  VertexData border;
  VertexData mutedText;
  VertexData valueText;
};

class TooltipRecipe : public Recipe {
public:
  TooltipRecipe(Id idBase, const TooltipRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override {
    return {fillSlot(), borderSlot(), mutedTextSlot(), valueTextSlot()};
  }

  DrawSlot fillSlot() const      { return slotAt(0, VertexFormat::Pos2_Clip); }
  DrawSlot borderSlot() const    { return slotAt(3, VertexFormat::Rect4); }
  DrawSlot mutedTextSlot() const { return slotAt(6, VertexFormat::Glyph8); }
  DrawSlot valueTextSlot() const { return slotAt(9, VertexFormat::Glyph8); }

  static constexpr std::uint32_t ID_SLOTS = 12;

  const TooltipRecipeConfig& config() const { return config_; }

  // Flips left of the anchor when the box would come within 30px of the
  // right edge; Y is clamped to a 10px margin inside the viewport.
  TooltipBox place(double anchorX, double anchorY, double viewWidth, double viewHeight,
                   bool hasMcap) const;

  // Implied market cap is currentMcap * price / currentPrice, shown only when
  // both references are present, currentPrice > 0 and the result is non-zero.
  static TooltipContent makeContent(const PricePoint& point,
                                    bool hasCurrentMcap, double currentMcap,
                                    bool hasCurrentPrice, double currentPrice,
                                    bool utc = false);

  // Card geometry is produced without an atlas; text stays empty when
  // `atlas` is null.
  TooltipVertices compute(const TooltipBox& box, const TooltipContent& content,
                          const GlyphAtlas* atlas) const;

private:
  TooltipRecipeConfig config_;
};

} // namespace pc
