#pragma once
#include "pc/chart/RenderSurface.hpp"
#include "pc/debug/Stats.hpp"
#include "pc/gl/GpuBufferManager.hpp"
#include "pc/gl/GpuTextureManager.hpp"
#include "pc/gl/Renderer.hpp"

namespace pc {

class GlContext;

// RenderSurface backed by a GL context the host keeps current.
class GlRenderSurface : public RenderSurface {
public:
  explicit GlRenderSurface(GlContext& ctx);
  ~GlRenderSurface() override = default;

  GlRenderSurface(const GlRenderSurface&) = delete;
  GlRenderSurface& operator=(const GlRenderSurface&) = delete;

  // Builds the renderer; call with the context current.
  bool init();

  TextureStore* textures() override { return &textures_; }
  void setGlyphAtlas(GlyphAtlas* atlas) override { renderer_.setGlyphAtlas(atlas); }
  void setBufferData(Id bufferId, const void* data, std::uint32_t bytes) override;
  void releaseBuffer(Id bufferId) override { buffers_.release(bufferId); }
  bool present(const Scene& scene, int width, int height) override;

  // Skip the swap when the host reads pixels back before presenting itself.
  void setSwapOnPresent(bool swap) { swapOnPresent_ = swap; }

  const Stats& lastStats() const { return stats_; }
  GlContext& context() { return ctx_; }

private:
  GlContext& ctx_;
  Renderer renderer_;
  GpuBufferManager buffers_;
  GpuTextureManager textures_;
  Stats stats_{};
  bool inited_{false};
  bool swapOnPresent_{true};
};

} // namespace pc
