#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace pc {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // UV rectangle in the atlas; v0 is the glyph's top row.
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Metrics in pixels at glyphPx
  float advance{0};
  float bearingX{0}, bearingY{0}; // bearingY: baseline to glyph top
  float w{0}, h{0};
};

// Single-channel signed distance field atlas, rasterized with stb_truetype.
class GlyphAtlas {
public:
  GlyphAtlas();

  bool loadFont(const std::uint8_t* data, std::uint32_t len);
  bool loadFontFile(const std::string& path);
  bool hasFont() const { return fontLoaded_; }

  // Rasterize any missing glyphs of `text`. Returns true if the atlas changed.
  bool ensureText(const std::string& text);
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);
  bool ensureAscii();

  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Vertical font metrics in pixels at glyphPx; descent is negative.
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }
  float glyphPx() const { return static_cast<float>(glyphPx_); }

  // Atlas R8 pixel data, row 0 first.
  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  void setGlyphPx(std::uint32_t px);
  void setAtlasSize(std::uint32_t s);

private:
  std::uint32_t atlasSize_{1024};
  std::uint32_t glyphPx_{48};
  std::uint32_t sdfRange_{8};
  std::uint32_t pad_{2};

  std::vector<std::uint8_t> atlas_;
  std::vector<std::uint8_t> fontData_;
  bool fontLoaded_{false};
  bool dirty_{false};
  float ascent_{0};
  float descent_{0};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  // Shelf packer
  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;

  bool updateMetrics();
  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  static void chamferDistance(std::vector<float>& field, int w, int h);
  static void encodeSdf(const std::uint8_t* coverage, int w, int h,
                        float range, std::uint8_t* out);
};

} // namespace pc
