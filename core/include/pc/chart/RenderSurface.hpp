#pragma once
#include "pc/ids/Id.hpp"
#include <cstdint>

namespace pc {

class GlyphAtlas;
class Scene;
class TextureStore;

// Target a chart frame is submitted to. The chart writes vertex bytes per
// scene buffer, then presents the scene once per frame.
class RenderSurface {
public:
  virtual ~RenderSurface() = default;

  virtual TextureStore* textures() = 0;

  virtual void setGlyphAtlas(GlyphAtlas* atlas) = 0;

  // Stage the contents of a scene buffer for the next present().
  virtual void setBufferData(Id bufferId, const void* data, std::uint32_t bytes) = 0;
  virtual void releaseBuffer(Id bufferId) = 0;

  // Upload staged buffers and draw the scene. Returns false when the frame
  // could not be drawn.
  virtual bool present(const Scene& scene, int width, int height) = 0;
};

} // namespace pc
