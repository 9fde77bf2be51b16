#include "pc/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace pc {

GlyphAtlas::GlyphAtlas() {
  setAtlasSize(atlasSize_);
}

void GlyphAtlas::setAtlasSize(std::uint32_t s) {
  atlasSize_ = s;
  atlas_.assign(static_cast<std::size_t>(s) * s, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
  dirty_ = true;
}

void GlyphAtlas::setGlyphPx(std::uint32_t px) {
  glyphPx_ = px;
  setAtlasSize(atlasSize_);
  if (fontLoaded_) updateMetrics();
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  fontData_.assign(data, data + len);
  fontLoaded_ = updateMetrics();
  return fontLoaded_;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas::loadFontFile: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  fontData_.resize(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(fontData_.data()), sz);
  fontLoaded_ = updateMetrics();
  return fontLoaded_;
}

bool GlyphAtlas::updateMetrics() {
  stbtt_fontinfo font;
  if (fontData_.empty() || !stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }
  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);
  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  ascent_ = static_cast<float>(asc) * scale;
  descent_ = static_cast<float>(desc) * scale;
  return true;
}

bool GlyphAtlas::ensureText(const std::string& text) {
  std::vector<std::uint32_t> cps;
  cps.reserve(text.size());
  for (unsigned char c : text) cps.push_back(c);
  return ensureGlyphs(cps.data(), static_cast<std::uint32_t>(cps.size()));
}

bool GlyphAtlas::ensureAscii() {
  std::vector<std::uint32_t> cps;
  for (std::uint32_t c = 32; c <= 126; c++) cps.push_back(c);
  return ensureGlyphs(cps.data(), static_cast<std::uint32_t>(cps.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  bool missing = false;
  for (std::uint32_t i = 0; i < count && !missing; i++) {
    missing = glyphs_.find(codepoints[i]) == glyphs_.end();
  }
  if (!missing) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }
  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  const float invAtlas = 1.0f / static_cast<float>(atlasSize_);
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    const std::uint32_t cp = codepoints[i];
    if (glyphs_.find(cp) != glyphs_.end()) continue;

    const int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));
    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);
    int ix0 = 0, iy0 = 0, ix1 = 0, iy1 = 0;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;
    info.bearingX = static_cast<float>(ix0);
    info.bearingY = static_cast<float>(-iy0);

    const int gw = ix1 - ix0;
    const int gh = iy1 - iy0;
    if (gw <= 0 || gh <= 0) {
      // whitespace: metrics only
      glyphs_[cp] = info;
      continue;
    }

    std::vector<std::uint8_t> coverage(static_cast<std::size_t>(gw) * gh, 0);
    stbtt_MakeGlyphBitmap(&font, coverage.data(), gw, gh, gw, scale, scale, glyphIdx);

    std::vector<std::uint8_t> sdf(coverage.size());
    encodeSdf(coverage.data(), gw, gh, static_cast<float>(sdfRange_), sdf.data());

    std::uint32_t ax = 0, ay = 0;
    if (!packGlyph(static_cast<std::uint32_t>(gw) + pad_ * 2,
                   static_cast<std::uint32_t>(gh) + pad_ * 2, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas: atlas full (cp=%u)\n", cp);
      continue;
    }

    const std::uint32_t ox = ax + pad_;
    const std::uint32_t oy = ay + pad_;
    for (int row = 0; row < gh; row++) {
      std::memcpy(&atlas_[(oy + static_cast<std::uint32_t>(row)) * atlasSize_ + ox],
                  &sdf[static_cast<std::size_t>(row) * gw],
                  static_cast<std::size_t>(gw));
    }

    info.u0 = static_cast<float>(ox) * invAtlas;
    info.v0 = static_cast<float>(oy) * invAtlas;
    info.u1 = static_cast<float>(ox + static_cast<std::uint32_t>(gw)) * invAtlas;
    info.v1 = static_cast<float>(oy + static_cast<std::uint32_t>(gh)) * invAtlas;
    info.w = static_cast<float>(gw);
    info.h = static_cast<float>(gh);
    glyphs_[cp] = info;
    modified = true;
  }

  if (modified) dirty_ = true;
  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  const std::uint32_t limit = atlasSize_ - 1;
  for (auto& shelf : shelves_) {
    if (shelf.h == 0 && shelf.y + h <= limit) shelf.h = h;
    if (h <= shelf.h && shelf.x + w <= limit) {
      outX = shelf.x;
      outY = shelf.y;
      shelf.x += w;
      return true;
    }
  }

  const Shelf& last = shelves_.back();
  const std::uint32_t ny = last.y + last.h;
  if (ny + h > limit) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

// Two-pass 3x3 chamfer transform. Cells holding 0 are seeds; every other
// cell ends up with its approximate distance to the nearest seed.
void GlyphAtlas::chamferDistance(std::vector<float>& field, int w, int h) {
  constexpr float kOrtho = 1.0f;
  constexpr float kDiag = 1.4142135f;

  auto at = [&](int x, int y) -> float& {
    return field[static_cast<std::size_t>(y) * w + x];
  };
  auto relax = [&](float& cell, int x, int y, float cost) {
    if (x < 0 || y < 0 || x >= w || y >= h) return;
    cell = std::min(cell, at(x, y) + cost);
  };

  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      float& c = at(x, y);
      if (c == 0.0f) continue;
      relax(c, x - 1, y, kOrtho);
      relax(c, x, y - 1, kOrtho);
      relax(c, x - 1, y - 1, kDiag);
      relax(c, x + 1, y - 1, kDiag);
    }
  }
  for (int y = h - 1; y >= 0; y--) {
    for (int x = w - 1; x >= 0; x--) {
      float& c = at(x, y);
      if (c == 0.0f) continue;
      relax(c, x + 1, y, kOrtho);
      relax(c, x, y + 1, kOrtho);
      relax(c, x + 1, y + 1, kDiag);
      relax(c, x - 1, y + 1, kDiag);
    }
  }
}

// 128 on the outline, >128 inside, <128 outside; saturates at +-range px.
void GlyphAtlas::encodeSdf(const std::uint8_t* coverage, int w, int h,
                           float range, std::uint8_t* out) {
  constexpr float kFar = 1e20f;
  const std::size_t n = static_cast<std::size_t>(w) * h;

  std::vector<float> toOutside(n), toInside(n);
  for (std::size_t i = 0; i < n; i++) {
    const bool in = coverage[i] > 127;
    toOutside[i] = in ? kFar : 0.0f;
    toInside[i] = in ? 0.0f : kFar;
  }
  chamferDistance(toOutside, w, h);
  chamferDistance(toInside, w, h);

  for (std::size_t i = 0; i < n; i++) {
    const float d = std::max(-range, std::min(range, toOutside[i] - toInside[i]));
    const float v = 128.0f + d / range * 127.0f;
    out[i] = static_cast<std::uint8_t>(std::max(0.0f, std::min(255.0f, v)));
  }
}

} // namespace pc
