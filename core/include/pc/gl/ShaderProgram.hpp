#pragma once
#include <glad/gl.h>
#include <string>

namespace pc {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (errors go to stderr).
  // `label` prefixes the log lines.
  bool build(const char* label, const char* vertSrc, const char* fragSrc);

  void use() const;

  GLint attribLocation(const char* name) const;
  GLint uniformLocation(const char* name) const;

  void setUniformMat3(const char* name, const float* data) const;
  void setUniformVec4(const char* name, const float rgba[4]) const;
  void setUniformVec2(const char* name, float x, float y) const;
  void setUniformFloat(const char* name, float v) const;
  void setUniformInt(const char* name, int v) const;

  GLuint id() const { return program_; }

private:
  GLuint program_{0};
};

} // namespace pc
