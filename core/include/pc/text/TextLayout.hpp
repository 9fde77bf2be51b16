#pragma once
#include "pc/text/GlyphAtlas.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pc {

// Layout in pixel space with Y growing downward. Glyph instances are glyph8
// records: x0, yTop, x1, yBottom, u0, vTop, u1, vBottom.
struct TextLayoutResult {
  std::vector<float> glyphInstances;
  int glyphCount{0};
  float advanceWidth{0};
};

inline float measureText(const GlyphAtlas& atlas, const std::string& text, float fontSize) {
  const float scale = fontSize / atlas.glyphPx();
  float width = 0;
  for (unsigned char c : text) {
    if (const GlyphInfo* g = atlas.getGlyph(c)) width += g->advance * scale;
  }
  return width;
}

inline TextLayoutResult layoutText(const GlyphAtlas& atlas, const std::string& text,
                                   float startX, float baselineY, float fontSize) {
  TextLayoutResult r;
  const float scale = fontSize / atlas.glyphPx();
  float cursorX = startX;

  for (unsigned char c : text) {
    const GlyphInfo* g = atlas.getGlyph(c);
    if (!g) continue;
    if (g->w > 0 && g->h > 0) {
      const float x0 = cursorX + g->bearingX * scale;
      const float y0 = baselineY - g->bearingY * scale;
      r.glyphInstances.insert(r.glyphInstances.end(), {
        x0, y0, x0 + g->w * scale, y0 + g->h * scale,
        g->u0, g->v0, g->u1, g->v1});
      r.glyphCount++;
    }
    cursorX += g->advance * scale;
  }
  r.advanceWidth = cursorX - startX;
  return r;
}

inline TextLayoutResult layoutTextRightAligned(const GlyphAtlas& atlas, const std::string& text,
                                               float endX, float baselineY, float fontSize) {
  return layoutText(atlas, text, endX - measureText(atlas, text, fontSize), baselineY, fontSize);
}

inline TextLayoutResult layoutTextCentered(const GlyphAtlas& atlas, const std::string& text,
                                           float centerX, float baselineY, float fontSize) {
  const float half = measureText(atlas, text, fontSize) * 0.5f;
  return layoutText(atlas, text, centerX - half, baselineY, fontSize);
}

// Baseline that puts the top of the line box at `topY`.
inline float baselineForTop(const GlyphAtlas& atlas, float topY, float fontSize) {
  return topY + atlas.ascent() * (fontSize / atlas.glyphPx());
}

// Baseline that centers the line box on `middleY`.
inline float baselineForMiddle(const GlyphAtlas& atlas, float middleY, float fontSize) {
  return middleY + (atlas.ascent() + atlas.descent()) * 0.5f * (fontSize / atlas.glyphPx());
}

} // namespace pc
