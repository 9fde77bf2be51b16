#include "pc/pipelines/PipelineCatalog.hpp"

namespace pc {

PipelineCatalog::PipelineCatalog() {
  add("triSolid",     VertexFormat::Pos2_Clip, 3, false); // filled triangles
  add("line2d",       VertexFormat::Pos2_Clip, 2, false); // 1px GL_LINES
  add("lineAA",       VertexFormat::Rect4,     1, true);  // wide AA segments
  add("disc",         VertexFormat::Disc3,     1, true);  // AA filled circles
  add("textSDF",      VertexFormat::Glyph8,    1, true);  // atlas glyph quads
  add("texturedQuad", VertexFormat::Rect4,     1, true);  // sampled texture quad
}

void PipelineCatalog::add(const char* name, VertexFormat fmt,
                          std::uint32_t multiple, bool instanced) {
  PipelineSpec s;
  s.name = name;
  s.version = 1;
  s.requiredVertexFormat = fmt;
  s.vertexMultiple = multiple;
  s.instanced = instanced;
  specs_.emplace(pipelineKey(s.name, s.version), std::move(s));
}

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  auto it = specs_.find(key);
  return it == specs_.end() ? nullptr : &it->second;
}

} // namespace pc
