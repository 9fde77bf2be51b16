#include "pc/gl/GpuTextureManager.hpp"
#include <cstdio>

namespace pc {

GpuTextureManager::~GpuTextureManager() {
  releaseAll();
}

Id GpuTextureManager::createTexture(int width, int height, const std::uint8_t* rgba) {
  if (width <= 0 || height <= 0 || !rgba) {
    std::fprintf(stderr, "GpuTextureManager::createTexture: bad texture %dx%d\n", width, height);
    return kInvalidId;
  }

  GLint maxSize = 0;
  glGetIntegerv(GL_MAX_TEXTURE_SIZE, &maxSize);
  if (maxSize > 0 && (width > maxSize || height > maxSize)) {
    std::fprintf(stderr, "GpuTextureManager::createTexture: %dx%d exceeds GL limit %d\n",
                 width, height, maxSize);
    return kInvalidId;
  }

  GLuint tex = 0;
  glGenTextures(1, &tex);
  if (!tex) {
    std::fprintf(stderr, "GpuTextureManager::createTexture: glGenTextures failed\n");
    return kInvalidId;
  }

  glBindTexture(GL_TEXTURE_2D, tex);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, width, height, 0,
               GL_RGBA, GL_UNSIGNED_BYTE, rgba);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);

  if (glGetError() != GL_NO_ERROR) {
    std::fprintf(stderr, "GpuTextureManager::createTexture: upload of %dx%d failed\n",
                 width, height);
    glDeleteTextures(1, &tex);
    return kInvalidId;
  }

  const Id id = next_++;
  textures_.emplace(id, tex);
  return id;
}

void GpuTextureManager::destroyTexture(Id textureId) {
  auto it = textures_.find(textureId);
  if (it == textures_.end()) return;
  glDeleteTextures(1, &it->second);
  textures_.erase(it);
}

bool GpuTextureManager::hasTexture(Id textureId) const {
  return textures_.count(textureId) != 0;
}

GLuint GpuTextureManager::getGlTexture(Id textureId) const {
  auto it = textures_.find(textureId);
  return it == textures_.end() ? 0 : it->second;
}

void GpuTextureManager::releaseAll() {
  for (auto& [id, tex] : textures_) {
    glDeleteTextures(1, &tex);
  }
  textures_.clear();
}

} // namespace pc
