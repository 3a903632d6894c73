#pragma once
#include <glad/gl.h>

namespace fv {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (errors go to stderr).
  bool build(const char* vertSrc, const char* fragSrc);

  // Delete the GL program while the context is still current.
  void release();

  void use() const;

  GLint attribLocation(const char* name) const;
  GLint uniformLocation(const char* name) const;

  void setUniformMat4(GLint loc, const float* data) const;

  GLuint id() const { return program_; }

private:
  GLuint program_{0};
};

} // namespace fv
