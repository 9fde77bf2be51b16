#include "pc/recipe/StatusRecipe.hpp"
#include "pc/recipe/Shapes.hpp"
#include "pc/text/GlyphAtlas.hpp"
#include "pc/text/TextLayout.hpp"

#include <cmath>
#include <utility>

namespace pc {

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

StatusRecipe::StatusRecipe(Id idBase, const StatusRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

RecipeBuildResult StatusRecipe::build() const {
  RecipeBuildResult result;
  addSlot(result, veilSlot(), config_.layerId, config_.name + "_veil",
          "triSolid@1", config_.transformId);
  addSlot(result, pillSlot(), config_.layerId, config_.name + "_pill",
          "triSolid@1", config_.transformId);
  addSlot(result, spinnerSlot(), config_.layerId, config_.name + "_spinner",
          "lineAA@1", config_.transformId);
  addSlot(result, pillTextSlot(), config_.layerId, config_.name + "_loadingText",
          "textSDF@1", config_.transformId);
  addSlot(result, placeholderSlot(), config_.layerId, config_.name + "_placeholder",
          "textSDF@1", config_.transformId);
  result.createCommands.push_back(lineWidthCommand(spinnerSlot().drawItemId,
                                                   config_.spinnerWidth));
  addDispose(result, slots());
  return result;
}

LoadingVertices StatusRecipe::computeLoading(double width, double height, double phase,
                                             const GlyphAtlas* atlas) const {
  LoadingVertices v;
  const float w = static_cast<float>(width);
  const float h = static_cast<float>(height);
  appendQuad(v.veil, 0.0f, 0.0f, w, h);

  const bool withText = atlas && atlas->hasFont();
  const float textWidth = withText
    ? measureText(*atlas, config_.loadingText, config_.loadingFontSize) : 0.0f;
  const float spinnerDiameter = config_.spinnerRadius * 2.0f;
  const float pillW = config_.pillPaddingX * 2.0f + spinnerDiameter +
                      (withText ? config_.pillGap + textWidth : 0.0f);
  const float pillH = config_.pillHeight;
  const float pillX = (w - pillW) * 0.5f;
  const float pillY = (h - pillH) * 0.5f;
  appendRoundedRect(v.pill, pillX, pillY, pillW, pillH, config_.pillRadius);

  const float cx = pillX + config_.pillPaddingX + config_.spinnerRadius;
  const float cy = pillY + pillH * 0.5f;
  const double turn = phase - std::floor(phase);
  appendArc(v.spinner, cx, cy, config_.spinnerRadius,
            static_cast<float>(turn * kTwoPi), config_.spinnerSweep,
            config_.spinnerSegments);

  if (withText) {
    const float tx = pillX + config_.pillPaddingX + spinnerDiameter + config_.pillGap;
    auto layout = layoutText(*atlas, config_.loadingText, tx,
                             baselineForMiddle(*atlas, cy, config_.loadingFontSize),
                             config_.loadingFontSize);
    v.text.values = std::move(layout.glyphInstances);
    v.text.count = static_cast<std::uint32_t>(layout.glyphCount);
  }
  return v;
}

VertexData StatusRecipe::computePlaceholder(double width, double height,
                                            const GlyphAtlas* atlas) const {
  VertexData data;
  if (!atlas || !atlas->hasFont()) return data;
  const float cx = static_cast<float>(width * 0.5);
  const float cy = static_cast<float>(height * 0.5);
  auto layout = layoutTextCentered(*atlas, config_.emptyText, cx,
                                   baselineForMiddle(*atlas, cy, config_.emptyFontSize),
                                   config_.emptyFontSize);
  data.values = std::move(layout.glyphInstances);
  data.count = static_cast<std::uint32_t>(layout.glyphCount);
  return data;
}

} // namespace pc
