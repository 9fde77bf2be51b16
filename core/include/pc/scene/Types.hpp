#pragma once
#include "pc/ids/Id.hpp"
#include <string>

namespace pc {

enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry,
  Transform
};

inline const char* toString(ResourceKind k) {
  switch (k) {
    case ResourceKind::Pane: return "pane";
    case ResourceKind::Layer: return "layer";
    case ResourceKind::DrawItem: return "drawItem";
    case ResourceKind::Buffer: return "buffer";
    case ResourceKind::Geometry: return "geometry";
    case ResourceKind::Transform: return "transform";
    default: return "unknown";
  }
}

struct Pane {
  Id id{0};
  std::string name;
  bool hasClearColor{false};
  float clearColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  // bindings for pipeline execution
  std::string pipeline;  // e.g. "triSolid@1"
  Id geometryId{0};      // must refer to a Geometry resource
  Id transformId{0};     // 0 = identity

  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float lineWidth{1.0f};

  // Stencil masking: a mask item only writes the stencil buffer and is skipped
  // in normal traversal; a masked item is drawn where its mask was written.
  bool isMask{false};
  Id maskDrawItemId{0};

  // texturedQuad@1 samples this texture (TextureStore id).
  Id textureId{0};
};

struct TransformParams {
  float tx{0}, ty{0};
  float sx{1}, sy{1};
};

// Column-major mat3, as uploaded to u_transform.
struct Transform {
  Id id{0};
  TransformParams params;
  float mat3[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};

  void recompute() {
    mat3[0] = params.sx; mat3[1] = 0;         mat3[2] = 0;
    mat3[3] = 0;         mat3[4] = params.sy; mat3[5] = 0;
    mat3[6] = params.tx; mat3[7] = params.ty; mat3[8] = 1;
  }
};

} // namespace pc
