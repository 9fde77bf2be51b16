#include "pc/gl/GlRenderSurface.hpp"
#include "pc/gl/GlContext.hpp"

#include <chrono>
#include <cstdio>

namespace pc {

GlRenderSurface::GlRenderSurface(GlContext& ctx) : ctx_(ctx) {}

bool GlRenderSurface::init() {
  if (inited_) return true;
  if (!renderer_.init()) {
    std::fprintf(stderr, "GlRenderSurface::init: renderer init failed\n");
    return false;
  }
  inited_ = true;
  return true;
}

void GlRenderSurface::setBufferData(Id bufferId, const void* data, std::uint32_t bytes) {
  buffers_.setCpuData(bufferId, data, bytes);
}

bool GlRenderSurface::present(const Scene& scene, int width, int height) {
  if (!inited_) {
    std::fprintf(stderr, "GlRenderSurface::present: not initialized\n");
    return false;
  }
  if (width <= 0 || height <= 0) return false;

  auto t0 = std::chrono::steady_clock::now();
  const std::uint64_t uploaded = buffers_.uploadDirty();
  stats_ = renderer_.render(scene, buffers_, textures_, width, height);
  stats_.uploadedBytesThisFrame = uploaded;
  if (swapOnPresent_) ctx_.swapBuffers();
  auto t1 = std::chrono::steady_clock::now();
  stats_.frameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  return true;
}

} // namespace pc
