#pragma once
#include "pc/texture/TextureStore.hpp"
#include <glad/gl.h>
#include <unordered_map>

namespace pc {

// RGBA8 GL textures addressed by TextureStore ids. Requires a current
// context for every call, including destruction.
class GpuTextureManager : public TextureStore {
public:
  GpuTextureManager() = default;
  ~GpuTextureManager() override;

  GpuTextureManager(const GpuTextureManager&) = delete;
  GpuTextureManager& operator=(const GpuTextureManager&) = delete;

  Id createTexture(int width, int height, const std::uint8_t* rgba) override;
  void destroyTexture(Id textureId) override;
  bool hasTexture(Id textureId) const override;

  GLuint getGlTexture(Id textureId) const;

  void releaseAll();

  std::uint32_t activeCount() const { return static_cast<std::uint32_t>(textures_.size()); }

private:
  std::unordered_map<Id, GLuint> textures_;
  Id next_{1};
};

} // namespace pc
