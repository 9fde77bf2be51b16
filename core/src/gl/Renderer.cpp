#include "pc/gl/Renderer.hpp"
#include "pc/text/GlyphAtlas.hpp"
#include "pc/scene/Geometry.hpp"
#include <cstdio>

namespace pc {

static const float kIdentityMat3[9] = {1,0,0, 0,1,0, 0,0,1};

static const float* resolveTransform(const DrawItem& di, const Scene& scene) {
  if (!di.transformId) return kIdentityMat3;
  const Transform* t = scene.getTransform(di.transformId);
  return t ? t->mat3 : kIdentityMat3;
}

// Shared corner table for instanced quads: two triangles, uv in [0,1].
#define PC_QUAD_CORNER_GLSL \
  "vec2 quadCorner(int vid) {\n" \
  "    int v = vid % 6;\n" \
  "    if (v == 0) return vec2(0.0, 0.0);\n" \
  "    if (v == 1) return vec2(1.0, 0.0);\n" \
  "    if (v == 2) return vec2(0.0, 1.0);\n" \
  "    if (v == 3) return vec2(0.0, 1.0);\n" \
  "    if (v == 4) return vec2(1.0, 0.0);\n" \
  "    return vec2(1.0, 1.0);\n" \
  "}\n"

// ---- Pos2 shader (triSolid + line2d) ----

static const char* kPos2Vert = R"GLSL(
#version 330 core
in vec2 a_pos;
uniform mat3 u_transform;
void main() {
    vec3 p = u_transform * vec3(a_pos, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- lineAA@1 shader ----
// Segment endpoints are in pixels; the quad is widened in pixel space before
// the transform so the width does not depend on the aspect ratio.

static const char* kLineAAVert = "#version 330 core\n" PC_QUAD_CORNER_GLSL R"GLSL(
in vec4 a_rect;
uniform mat3 u_transform;
uniform float u_halfWidth;
uniform float u_aaWidth;
out float v_dist;
void main() {
    vec2 p0 = a_rect.xy;
    vec2 p1 = a_rect.zw;
    vec2 dir = p1 - p0;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);

    float totalHW = u_halfWidth + u_aaWidth;
    vec2 c = quadCorner(gl_VertexID);
    float side = c.y * 2.0 - 1.0;

    vec2 pos = mix(p0, p1, c.x) + perp * (side * totalHW);
    vec3 p = u_transform * vec3(pos, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
    v_dist = side * totalHW;
}
)GLSL";

static const char* kLineAAFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_halfWidth;
uniform float u_aaWidth;
in float v_dist;
out vec4 outColor;
void main() {
    float d = abs(v_dist);
    float a = 1.0 - smoothstep(u_halfWidth, u_halfWidth + u_aaWidth, d);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

// ---- disc@1 shader ----

static const char* kDiscVert = "#version 330 core\n" PC_QUAD_CORNER_GLSL R"GLSL(
in vec3 a_disc;
uniform mat3 u_transform;
out vec2 v_local;
out float v_radius;
void main() {
    float extent = a_disc.z + 1.0;
    vec2 c = quadCorner(gl_VertexID) * 2.0 - 1.0;
    v_local = c * extent;
    v_radius = a_disc.z;
    vec3 p = u_transform * vec3(a_disc.xy + v_local, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kDiscFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
in vec2 v_local;
in float v_radius;
out vec4 outColor;
void main() {
    float d = length(v_local);
    float a = 1.0 - smoothstep(v_radius - 0.5, v_radius + 0.5, d);
    if (a <= 0.0) discard;
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

// ---- textSDF@1 shader ----

static const char* kTextSdfVert = "#version 330 core\n" PC_QUAD_CORNER_GLSL R"GLSL(
in vec4 a_g0;
in vec4 a_g1;
uniform mat3 u_transform;
out vec2 v_uv;
void main() {
    vec2 c = quadCorner(gl_VertexID);
    float x = mix(a_g0.x, a_g0.z, c.x);
    float y = mix(a_g0.y, a_g0.w, c.y);
    v_uv = vec2(mix(a_g1.x, a_g1.z, c.x), mix(a_g1.y, a_g1.w, c.y));
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kTextSdfFrag = R"GLSL(
#version 330 core
uniform sampler2D u_atlas;
uniform vec4 u_color;
in vec2 v_uv;
out vec4 outColor;
void main() {
    float val = texture(u_atlas, v_uv).r;
    float w = max(fwidth(val), 0.02);
    float a = smoothstep(0.5 - w, 0.5 + w, val);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

// ---- texturedQuad@1 shader ----

static const char* kTexQuadVert = "#version 330 core\n" PC_QUAD_CORNER_GLSL R"GLSL(
in vec4 a_rect;
uniform mat3 u_transform;
out vec2 v_uv;
void main() {
    vec2 c = quadCorner(gl_VertexID);
    v_uv = c;
    float x = mix(a_rect.x, a_rect.z, c.x);
    float y = mix(a_rect.y, a_rect.w, c.y);
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kTexQuadFrag = R"GLSL(
#version 330 core
uniform sampler2D u_tex;
uniform vec4 u_color;
in vec2 v_uv;
out vec4 outColor;
void main() {
    outColor = texture(u_tex, v_uv) * u_color;
}
)GLSL";

// ---- Renderer implementation ----

Renderer::~Renderer() {
  if (vao_) {
    glDeleteVertexArrays(1, &vao_);
  }
  if (atlasTexture_) {
    glDeleteTextures(1, &atlasTexture_);
  }
}

void Renderer::setGlyphAtlas(GlyphAtlas* atlas) {
  atlas_ = atlas;
}

bool Renderer::init() {
  if (!pos2Prog_.build("pos2", kPos2Vert, kSolidFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build pos2 shader\n");
    return false;
  }
  if (!lineAAProg_.build("lineAA", kLineAAVert, kLineAAFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build lineAA shader\n");
    return false;
  }
  if (!discProg_.build("disc", kDiscVert, kDiscFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build disc shader\n");
    return false;
  }
  if (!textSdfProg_.build("textSDF", kTextSdfVert, kTextSdfFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build textSdf shader\n");
    return false;
  }
  if (!texQuadProg_.build("texturedQuad", kTexQuadVert, kTexQuadFrag)) {
    std::fprintf(stderr, "Renderer::init: failed to build texturedQuad shader\n");
    return false;
  }

  glGenVertexArrays(1, &vao_);
  glGenTextures(1, &atlasTexture_);
  inited_ = true;
  return true;
}

void Renderer::bindInstanceAttrib(const ShaderProgram& prog, const char* name, GLint size,
                                  GLsizei stride, std::size_t offset) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glEnableVertexAttribArray(static_cast<GLuint>(loc));
  glVertexAttribPointer(static_cast<GLuint>(loc), size, GL_FLOAT, GL_FALSE, stride,
                        reinterpret_cast<const void*>(offset));
  glVertexAttribDivisor(static_cast<GLuint>(loc), 1);
}

void Renderer::unbindInstanceAttrib(const ShaderProgram& prog, const char* name) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glVertexAttribDivisor(static_cast<GLuint>(loc), 0);
  glDisableVertexAttribArray(static_cast<GLuint>(loc));
}

void Renderer::drawPos2(const DrawItem& di, const Geometry& geo, GLuint vbo, GLenum mode,
                        DrawContext& ctx) {
  pos2Prog_.use();
  pos2Prog_.setUniformMat3("u_transform", resolveTransform(di, ctx.scene));
  pos2Prog_.setUniformVec4("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLint aPos = pos2Prog_.attribLocation("a_pos");
  glEnableVertexAttribArray(static_cast<GLuint>(aPos));
  glVertexAttribPointer(static_cast<GLuint>(aPos), 2, GL_FLOAT, GL_FALSE, 0, nullptr);

  glDrawArrays(mode, 0, static_cast<GLsizei>(geo.vertexCount));
  ctx.stats.drawCalls++;

  glDisableVertexAttribArray(static_cast<GLuint>(aPos));
}

void Renderer::drawLineAA(const DrawItem& di, const Geometry& geo, GLuint vbo,
                          DrawContext& ctx) {
  lineAAProg_.use();
  lineAAProg_.setUniformMat3("u_transform", resolveTransform(di, ctx.scene));
  lineAAProg_.setUniformVec4("u_color", di.color);
  lineAAProg_.setUniformFloat("u_halfWidth", di.lineWidth * 0.5f);
  lineAAProg_.setUniformFloat("u_aaWidth", 1.0f);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4));
  bindInstanceAttrib(lineAAProg_, "a_rect", 4, stride, 0);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  ctx.stats.drawCalls++;

  unbindInstanceAttrib(lineAAProg_, "a_rect");
}

void Renderer::drawDisc(const DrawItem& di, const Geometry& geo, GLuint vbo,
                        DrawContext& ctx) {
  discProg_.use();
  discProg_.setUniformMat3("u_transform", resolveTransform(di, ctx.scene));
  discProg_.setUniformVec4("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Disc3));
  bindInstanceAttrib(discProg_, "a_disc", 3, stride, 0);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  ctx.stats.drawCalls++;

  unbindInstanceAttrib(discProg_, "a_disc");
}

void Renderer::uploadAtlasIfDirty() {
  if (!atlas_ || !atlas_->isDirty()) return;

  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  GLsizei sz = static_cast<GLsizei>(atlas_->atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, sz, sz, 0,
               GL_RED, GL_UNSIGNED_BYTE, atlas_->atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);
  atlas_->clearDirty();
}

void Renderer::drawTextSdf(const DrawItem& di, const Geometry& geo, GLuint vbo,
                           DrawContext& ctx) {
  if (!atlas_) return;

  textSdfProg_.use();
  textSdfProg_.setUniformMat3("u_transform", resolveTransform(di, ctx.scene));
  textSdfProg_.setUniformVec4("u_color", di.color);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  textSdfProg_.setUniformInt("u_atlas", 0);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Glyph8));
  bindInstanceAttrib(textSdfProg_, "a_g0", 4, stride, 0);
  bindInstanceAttrib(textSdfProg_, "a_g1", 4, stride, 16);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  ctx.stats.drawCalls++;

  unbindInstanceAttrib(textSdfProg_, "a_g0");
  unbindInstanceAttrib(textSdfProg_, "a_g1");
  glBindTexture(GL_TEXTURE_2D, 0);
}

void Renderer::drawTexturedQuad(const DrawItem& di, const Geometry& geo, GLuint vbo,
                                DrawContext& ctx) {
  GLuint tex = ctx.textures.getGlTexture(di.textureId);
  if (!tex) return;

  texQuadProg_.use();
  texQuadProg_.setUniformMat3("u_transform", resolveTransform(di, ctx.scene));
  texQuadProg_.setUniformVec4("u_color", di.color);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, tex);
  texQuadProg_.setUniformInt("u_tex", 0);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4));
  bindInstanceAttrib(texQuadProg_, "a_rect", 4, stride, 0);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  ctx.stats.drawCalls++;

  unbindInstanceAttrib(texQuadProg_, "a_rect");
  glBindTexture(GL_TEXTURE_2D, 0);
}

void Renderer::drawItem(const DrawItem& di, DrawContext& ctx) {
  const Geometry* geo = ctx.scene.getGeometry(di.geometryId);
  if (!geo) return;
  if (geo->vertexCount == 0) {
    ctx.stats.skippedEmpty++;
    return;
  }
  GLuint vbo = ctx.gpuBufs.getGlBuffer(geo->vertexBufferId);
  if (!vbo) return;

  if (di.pipeline == "triSolid@1") {
    drawPos2(di, *geo, vbo, GL_TRIANGLES, ctx);
  } else if (di.pipeline == "line2d@1") {
    drawPos2(di, *geo, vbo, GL_LINES, ctx);
  } else if (di.pipeline == "lineAA@1") {
    drawLineAA(di, *geo, vbo, ctx);
  } else if (di.pipeline == "disc@1") {
    drawDisc(di, *geo, vbo, ctx);
  } else if (di.pipeline == "textSDF@1") {
    drawTextSdf(di, *geo, vbo, ctx);
  } else if (di.pipeline == "texturedQuad@1") {
    drawTexturedQuad(di, *geo, vbo, ctx);
  }
}

void Renderer::drawMasked(const DrawItem& di, const DrawItem& mask, DrawContext& ctx) {
  const Geometry* maskGeo = ctx.scene.getGeometry(mask.geometryId);
  if (!maskGeo || maskGeo->vertexCount == 0) {
    // Nothing passes an empty mask.
    ctx.stats.skippedEmpty++;
    return;
  }

  glEnable(GL_STENCIL_TEST);
  glStencilMask(0xFF);
  glClear(GL_STENCIL_BUFFER_BIT);

  // Pass 1: mask silhouette -> stencil only.
  glColorMask(GL_FALSE, GL_FALSE, GL_FALSE, GL_FALSE);
  glStencilFunc(GL_ALWAYS, 1, 0xFF);
  glStencilOp(GL_KEEP, GL_KEEP, GL_REPLACE);
  drawItem(mask, ctx);

  // Pass 2: the item where the stencil was written.
  glColorMask(GL_TRUE, GL_TRUE, GL_TRUE, GL_TRUE);
  glStencilMask(0x00);
  glStencilFunc(GL_EQUAL, 1, 0xFF);
  glStencilOp(GL_KEEP, GL_KEEP, GL_KEEP);
  drawItem(di, ctx);
  ctx.stats.maskedDrawCalls++;

  glStencilMask(0xFF);
  glDisable(GL_STENCIL_TEST);
}

Stats Renderer::render(const Scene& scene, GpuBufferManager& gpuBufs,
                       const GpuTextureManager& textures, int viewW, int viewH) {
  Stats stats{};
  if (!inited_) return stats;

  uploadAtlasIfDirty();

  glViewport(0, 0, viewW, viewH);
  glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
  glClearStencil(0);
  glStencilMask(0xFF);
  glClear(GL_COLOR_BUFFER_BIT | GL_STENCIL_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  glBindVertexArray(vao_);

  DrawContext ctx{scene, gpuBufs, textures, stats};

  for (Id paneId : scene.paneIds()) {
    const Pane* pane = scene.getPane(paneId);
    if (!pane) continue;

    if (pane->hasClearColor) {
      glClearColor(pane->clearColor[0], pane->clearColor[1],
                   pane->clearColor[2], pane->clearColor[3]);
      glClear(GL_COLOR_BUFFER_BIT);
    }

    for (Id layerId : scene.layerIds()) {
      const Layer* layer = scene.getLayer(layerId);
      if (!layer || layer->paneId != paneId) continue;

      for (Id diId : scene.drawItemIds()) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di || di->layerId != layerId) continue;
        if (di->pipeline.empty()) continue;
        if (di->isMask) continue;

        const DrawItem* mask = di->maskDrawItemId
          ? scene.getDrawItem(di->maskDrawItemId) : nullptr;
        if (mask) {
          drawMasked(*di, *mask, ctx);
        } else {
          drawItem(*di, ctx);
        }
      }
    }
  }

  glBindVertexArray(0);
  glDisable(GL_BLEND);
  glFlush();

  stats.activeBuffers = gpuBufs.activeCount();
  stats.activeTextures = textures.activeCount();
  return stats;
}

} // namespace pc
