#pragma once
#include "pc/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace pc {

enum class VertexFormat : std::uint8_t {
  Pos2_Clip = 1, // vec2 position (pre-transform)
  Rect4     = 2, // x0,y0,x1,y1 (segments, quads)
  Glyph8    = 3, // x0,y0,x1,y1,u0,v0,u1,v1
  Disc3     = 4  // cx,cy,radius
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return "pos2_clip";
    case VertexFormat::Rect4: return "rect4";
    case VertexFormat::Glyph8: return "glyph8";
    case VertexFormat::Disc3: return "disc3";
    default: return "unknown";
  }
}

inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2_clip") { out = VertexFormat::Pos2_Clip; return true; }
  if (s == "rect4")     { out = VertexFormat::Rect4; return true; }
  if (s == "glyph8")    { out = VertexFormat::Glyph8; return true; }
  if (s == "disc3")     { out = VertexFormat::Disc3; return true; }
  return false;
}

// Bytes per vertex (or per instance for instanced formats).
inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return 8;
    case VertexFormat::Rect4: return 16;
    case VertexFormat::Glyph8: return 32;
    case VertexFormat::Disc3: return 12;
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2_Clip};
  std::uint32_t vertexCount{0}; // vertices, or instances for instanced formats
};

} // namespace pc
