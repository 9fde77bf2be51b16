#pragma once
#include "pc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace pc {

class GlyphAtlas;

// Status overlays drawn above everything else: the loading veil with its
// spinner pill, and the "no data" placeholder text.
//
// ID layout (offsets from idBase, 15 slots):
//   0-2:   veil        (buffer, geometry, drawItem) - triSolid@1
//   3-5:   pill        (buffer, geometry, drawItem) - triSolid@1
//   6-8:   spinner arc (buffer, geometry, drawItem) - lineAA@1
//   9-11:  pill text   (buffer, geometry, drawItem) - textSDF@1
//   12-14: placeholder (buffer, geometry, drawItem) - textSDF@1
struct StatusRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  std::string loadingText{"Loading..."};
  std::string emptyText{"No chart data available"};
  float loadingFontSize{12.0f};
  float emptyFontSize{14.0f};
  float spinnerRadius{8.0f};
  float spinnerWidth{2.0f};
  float spinnerSweep{4.71238898f}; // 270 degrees
  int spinnerSegments{24};
  float pillPaddingX{12.0f};
  float pillHeight{32.0f};
  float pillGap{8.0f};
  float pillRadius{8.0f};
};

struct LoadingVertices {
  VertexData veil;
  VertexData pill;
  VertexData spinner;
  VertexData text;
};

class StatusRecipe : public Recipe {
public:
  StatusRecipe(Id idBase, const StatusRecipeConfig& config);

  RecipeBuildResult build() const override;
  std::vector<DrawSlot> slots() const override {
    return {veilSlot(), pillSlot(), spinnerSlot(), pillTextSlot(), placeholderSlot()};
  }

  DrawSlot veilSlot() const        { return slotAt(0, VertexFormat::Pos2_Clip); }
  DrawSlot pillSlot() const        { return slotAt(3, VertexFormat::Pos2_Clip); }
  DrawSlot spinnerSlot() const     { return slotAt(6, VertexFormat::Rect4); }
  DrawSlot pillTextSlot() const    { return slotAt(9, VertexFormat::Glyph8); }
  DrawSlot placeholderSlot() const { return slotAt(12, VertexFormat::Glyph8); }

  static constexpr std::uint32_t ID_SLOTS = 15;

  const StatusRecipeConfig& config() const { return config_; }

  // `phase` in [0,1) is the spinner rotation as a fraction of a turn.
  LoadingVertices computeLoading(double width, double height, double phase,
                                 const GlyphAtlas* atlas) const;

  // Centered placeholder text; empty without a font.
  VertexData computePlaceholder(double width, double height, const GlyphAtlas* atlas) const;

private:
  StatusRecipeConfig config_;
};

} // namespace pc
