#pragma once
#include "pc/gl/ShaderProgram.hpp"
#include "pc/gl/GpuBufferManager.hpp"
#include "pc/gl/GpuTextureManager.hpp"
#include "pc/scene/Scene.hpp"
#include "pc/debug/Stats.hpp"
#include <glad/gl.h>

namespace pc {

class GlyphAtlas;

// Draws a Scene with GL 3.3 core. Items are visited pane -> layer -> drawItem
// in creation order. Mask items are skipped; an item with a mask is drawn
// through an 8-bit stencil written by its mask first.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO. Call once after GL context is current.
  bool init();

  // Glyph atlas for textSDF@1; uploaded whenever it reports dirty.
  void setGlyphAtlas(GlyphAtlas* atlas);

  // Walk the scene and issue draw calls.
  Stats render(const Scene& scene, GpuBufferManager& gpuBufs,
               const GpuTextureManager& textures, int viewW, int viewH);

private:
  ShaderProgram pos2Prog_;     // triSolid@1 + line2d@1
  ShaderProgram lineAAProg_;   // lineAA@1
  ShaderProgram discProg_;     // disc@1
  ShaderProgram textSdfProg_;  // textSDF@1
  ShaderProgram texQuadProg_;  // texturedQuad@1
  GLuint vao_{0};
  GLuint atlasTexture_{0};
  bool inited_{false};

  GlyphAtlas* atlas_{nullptr};

  struct DrawContext {
    const Scene& scene;
    GpuBufferManager& gpuBufs;
    const GpuTextureManager& textures;
    Stats& stats;
  };

  void drawItem(const DrawItem& di, DrawContext& ctx);
  void drawMasked(const DrawItem& di, const DrawItem& mask, DrawContext& ctx);

  void drawPos2(const DrawItem& di, const Geometry& geo, GLuint vbo, GLenum mode,
                DrawContext& ctx);
  void drawLineAA(const DrawItem& di, const Geometry& geo, GLuint vbo, DrawContext& ctx);
  void drawDisc(const DrawItem& di, const Geometry& geo, GLuint vbo, DrawContext& ctx);
  void drawTextSdf(const DrawItem& di, const Geometry& geo, GLuint vbo, DrawContext& ctx);
  void drawTexturedQuad(const DrawItem& di, const Geometry& geo, GLuint vbo,
                        DrawContext& ctx);

  // Per-instance float attribute of `size` components at `offset` in `stride`.
  void bindInstanceAttrib(const ShaderProgram& prog, const char* name, GLint size,
                          GLsizei stride, std::size_t offset);
  void unbindInstanceAttrib(const ShaderProgram& prog, const char* name);

  void uploadAtlasIfDirty();
};

} // namespace pc
