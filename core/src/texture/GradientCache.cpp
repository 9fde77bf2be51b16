#include "pc/texture/GradientCache.hpp"
#include "pc/texture/TextureStore.hpp"
#include "pc/style/Color.hpp"

#include <cmath>
#include <cstdio>
#include <new>

namespace pc {

namespace {

constexpr int kStopCount = 6;
constexpr float kStopOffsets[kStopCount] = {0.0f, 0.2f, 0.4f, 0.6f, 0.8f, 1.0f};
constexpr std::uint8_t kStopAlpha[kStopCount] = {0x40, 0x30, 0x20, 0x10, 0x08, 0x00};

float fadeAlphaAt(float t) {
  if (t <= kStopOffsets[0]) return kStopAlpha[0];
  for (int i = 1; i < kStopCount; i++) {
    if (t <= kStopOffsets[i]) {
      float f = (t - kStopOffsets[i - 1]) / (kStopOffsets[i] - kStopOffsets[i - 1]);
      return kStopAlpha[i - 1] + (kStopAlpha[i] - kStopAlpha[i - 1]) * f;
    }
  }
  return kStopAlpha[kStopCount - 1];
}

std::uint8_t toByte(float v) {
  float c = std::round(v);
  if (c < 0) c = 0;
  if (c > 255) c = 255;
  return static_cast<std::uint8_t>(c);
}

} // namespace

bool rasterizeVerticalFade(int width, int height, const float rgb[4],
                           std::vector<std::uint8_t>& out) {
  if (width <= 0 || height <= 0) return false;
  if (width > kMaxGradientDimension || height > kMaxGradientDimension) return false;

  try {
    out.assign(static_cast<std::size_t>(width) * height * 4, 0);
  } catch (const std::bad_alloc&) {
    std::fprintf(stderr, "rasterizeVerticalFade: cannot allocate %dx%d raster\n", width, height);
    out.clear();
    return false;
  }

  const std::uint8_t r = toByte(rgb[0] * 255.0f);
  const std::uint8_t g = toByte(rgb[1] * 255.0f);
  const std::uint8_t b = toByte(rgb[2] * 255.0f);

  for (int y = 0; y < height; y++) {
    // Sample at the pixel center.
    const float t = (static_cast<float>(y) + 0.5f) / static_cast<float>(height);
    const std::uint8_t a = toByte(fadeAlphaAt(t));
    std::uint8_t* row = out.data() + static_cast<std::size_t>(y) * width * 4;
    for (int x = 0; x < width; x++) {
      row[x * 4 + 0] = r;
      row[x * 4 + 1] = g;
      row[x * 4 + 2] = b;
      row[x * 4 + 3] = a;
    }
  }
  return true;
}

GradientCache::GradientCache(TextureStore* store) : store_(store) {}

GradientCache::~GradientCache() {
  release();
}

void GradientCache::setStore(TextureStore* store) {
  if (store == store_) return;
  release();
  store_ = store;
}

void GradientCache::release() {
  if (entry_.textureId != kInvalidId && store_) {
    store_->destroyTexture(entry_.textureId);
  }
  entry_ = GradientCacheEntry{};
}

Id GradientCache::getTexture(int width, int height, const std::string& colorHex) {
  const bool sameKey = entry_.width == width && entry_.height == height &&
                       entry_.colorKey == colorHex;
  if (sameKey && (entry_.textureId != kInvalidId || entry_.failed)) {
    return entry_.textureId;
  }

  release();

  if (!store_) return kInvalidId;

  entry_.width = width;
  entry_.height = height;
  entry_.colorKey = colorHex;
  entry_.failed = true;

  float rgb[4];
  if (!parseHexColor(colorHex, rgb)) {
    std::fprintf(stderr, "GradientCache::getTexture: invalid color '%s'\n", colorHex.c_str());
    return kInvalidId;
  }

  std::vector<std::uint8_t> pixels;
  if (!rasterizeVerticalFade(width, height, rgb, pixels)) {
    std::fprintf(stderr, "GradientCache::getTexture: no raster for %dx%d\n", width, height);
    return kInvalidId;
  }

  const Id tex = store_->createTexture(width, height, pixels.data());
  if (tex == kInvalidId) {
    std::fprintf(stderr, "GradientCache::getTexture: texture upload failed\n");
    return kInvalidId;
  }

  entry_.textureId = tex;
  entry_.failed = false;
  return tex;
}

} // namespace pc
