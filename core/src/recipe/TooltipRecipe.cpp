#include "pc/recipe/TooltipRecipe.hpp"
#include "pc/math/PriceFormat.hpp"
#include "pc/math/TimeFormat.hpp"
#include "pc/recipe/Shapes.hpp"
#include "pc/text/GlyphAtlas.hpp"
#include "pc/text/TextLayout.hpp"

#include <algorithm>
#include <cmath>

namespace pc {

namespace {

constexpr double kEdgeMargin = 10.0;
constexpr double kAnchorGap = 15.0;
constexpr double kFlipSlack = 30.0;

void appendText(VertexData& out, const GlyphAtlas& atlas, const std::string& text,
                float x, float top, float fontSize) {
  if (text.empty()) return;
  auto layout = layoutText(atlas, text, x, baselineForTop(atlas, top, fontSize), fontSize);
  out.values.insert(out.values.end(),
                    layout.glyphInstances.begin(), layout.glyphInstances.end());
  out.count += static_cast<std::uint32_t>(layout.glyphCount);
}

} // namespace

TooltipRecipe::TooltipRecipe(Id idBase, const TooltipRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult TooltipRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, fillSlot(), config_.layerId, config_.name + "_card",
          "triSolid@1", config_.transformId);
  addSlot(result, borderSlot(), config_.layerId, config_.name + "_border",
          "lineAA@1", config_.transformId);
  addSlot(result, mutedTextSlot(), config_.layerId, config_.name + "_muted",
          "textSDF@1", config_.transformId);
  addSlot(result, valueTextSlot(), config_.layerId, config_.name + "_value",
          "textSDF@1", config_.transformId);
  result.createCommands.push_back(lineWidthCommand(borderSlot().drawItemId, 1.0f));
  addDispose(result, slots());
  return result;
}

TooltipBox TooltipRecipe::place(double anchorX, double anchorY,
                                double viewWidth, double viewHeight, bool hasMcap) const {
  const double w = config_.width;
  const double h = hasMcap ? config_.heightWithMcap : config_.heightWithoutMcap;

  TooltipBox box;
  box.flipped = anchorX > viewWidth - w - kFlipSlack;
  const double x = box.flipped
    ? std::max(kEdgeMargin, anchorX - w - kAnchorGap)
    : std::min(anchorX + kAnchorGap, viewWidth - w - kEdgeMargin);
  // max before min: a viewport shorter than the box pins it to the bottom margin.
  const double y = std::min(std::max(anchorY - h / 2.0, kEdgeMargin),
                            viewHeight - h - kEdgeMargin);

  box.x = static_cast<float>(x);
  box.y = static_cast<float>(y);
  box.w = static_cast<float>(w);
  box.h = static_cast<float>(h);
  return box;
}

TooltipContent TooltipRecipe::makeContent(const PricePoint& point,
                                          bool hasCurrentMcap, double currentMcap,
                                          bool hasCurrentPrice, double currentPrice,
                                          bool utc) {
  TooltipContent c;
  c.timestamp = formatTooltipTimestamp(point.timestamp, utc);
  c.price = "$" + formatPrice(point.price);

  if (hasCurrentMcap && hasCurrentPrice && currentMcap != 0.0 && currentPrice > 0.0) {
    const double mcap = currentMcap * (point.price / currentPrice);
    if (mcap != 0.0 && !std::isnan(mcap)) {
      c.mcap = "MCAP: " + formatMarketCap(mcap);
      c.hasMcap = true;
    }
  }
  return c;
}

TooltipVertices TooltipRecipe::compute(const TooltipBox& box, const TooltipContent& content,
                                       const GlyphAtlas* atlas) const {
  TooltipVertices v;
  appendRoundedRect(v.fill, box.x, box.y, box.w, box.h, config_.cornerRadius);
  appendRoundedRectOutline(v.border, box.x, box.y, box.w, box.h, config_.cornerRadius);

  if (!atlas || !atlas->hasFont()) return v;

  const float tx = box.x + config_.textInset;
  appendText(v.mutedText, *atlas, content.timestamp, tx, box.y + 6.0f,
             config_.timestampFontSize);
  appendText(v.valueText, *atlas, content.price, tx, box.y + 26.0f, config_.valueFontSize);
  if (content.hasMcap) {
    appendText(v.mutedText, *atlas, content.mcap, tx, box.y + 42.0f, config_.valueFontSize);
  }
  return v;
}

} // namespace pc
