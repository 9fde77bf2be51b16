#pragma once
#include "pc/scene/Geometry.hpp"
#include <string>
#include <unordered_map>

namespace pc {

struct PipelineSpec {
  std::string name;   // "triSolid"
  int version{1};
  VertexFormat requiredVertexFormat{VertexFormat::Pos2_Clip};
  std::uint32_t vertexMultiple{1}; // vertexCount must be a multiple of this
  bool instanced{false};
};

inline std::string pipelineKey(const std::string& name, int version) {
  return name + "@" + std::to_string(version);
}

class PipelineCatalog {
public:
  PipelineCatalog();

  const PipelineSpec* find(const std::string& key) const;

private:
  std::unordered_map<std::string, PipelineSpec> specs_;

  void add(const char* name, VertexFormat fmt, std::uint32_t multiple, bool instanced);
};

} // namespace pc
