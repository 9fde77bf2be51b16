#pragma once
#include "pc/ids/Id.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pc {

class TextureStore;

constexpr int kMaxGradientDimension = 8192;

// Vertical fade of `rgb` from alpha 0x40 at the top to 0 at the bottom,
// six evenly spaced stops, linear in between. RGBA8, top row first.
// Returns false when the raster cannot be allocated.
bool rasterizeVerticalFade(int width, int height, const float rgb[4],
                           std::vector<std::uint8_t>& out);

struct GradientCacheEntry {
  Id textureId{0};
  int width{0};
  int height{0};
  std::string colorKey;
  bool failed{false};   // key could not be built; not retried until it changes
};

// Single-slot cache of the area-fill gradient texture. At most one texture is
// alive; a key change releases the old texture before building the new one.
class GradientCache {
public:
  explicit GradientCache(TextureStore* store = nullptr);
  ~GradientCache();

  GradientCache(const GradientCache&) = delete;
  GradientCache& operator=(const GradientCache&) = delete;

  // Switching stores releases the texture held in the old one.
  void setStore(TextureStore* store);

  // Cached texture for (width, height, colorHex), or kInvalidId when it
  // cannot be produced. A failed key is remembered and returns kInvalidId
  // without another attempt until width, height or color changes.
  Id getTexture(int width, int height, const std::string& colorHex);

  void release();

  const GradientCacheEntry& entry() const { return entry_; }

private:
  TextureStore* store_{nullptr};
  GradientCacheEntry entry_;
};

} // namespace pc
