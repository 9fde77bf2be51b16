#pragma once
#include "pc/ids/Id.hpp"
#include <cstdint>

namespace pc {

// Owner of GPU textures, addressed by id. Draw items reference textures by
// these ids (DrawItem::textureId).
class TextureStore {
public:
  virtual ~TextureStore() = default;

  // Upload RGBA8 pixels, top row first. Returns kInvalidId on failure.
  virtual Id createTexture(int width, int height, const std::uint8_t* rgba) = 0;

  virtual void destroyTexture(Id textureId) = 0;

  virtual bool hasTexture(Id textureId) const = 0;
};

} // namespace pc
