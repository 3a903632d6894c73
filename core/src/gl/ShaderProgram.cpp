#include "fv/gl/ShaderProgram.hpp"
#include <cstdio>
#include <string>

namespace fv {

namespace {

using GetIv = PFNGLGETSHADERIVPROC;       // also fits glGetProgramiv
using GetLog = PFNGLGETSHADERINFOLOGPROC; // also fits glGetProgramInfoLog

// Info log of a shader or program object, empty if it has none.
std::string infoLog(GLuint obj, GetIv getIv, GetLog getLog) {
  GLint len = 0;
  getIv(obj, GL_INFO_LOG_LENGTH, &len);
  if (len <= 1) return {};
  std::string log(static_cast<std::size_t>(len), '\0');
  getLog(obj, len, nullptr, &log[0]);
  log.resize(static_cast<std::size_t>(len - 1));
  return log;
}

const char* stageName(GLenum stage) {
  return stage == GL_VERTEX_SHADER ? "vertex" : "fragment";
}

// Returns 0 and logs on failure.
GLuint compileStage(GLenum stage, const char* src) {
  GLuint s = glCreateShader(stage);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint status = GL_FALSE;
  glGetShaderiv(s, GL_COMPILE_STATUS, &status);
  if (status == GL_TRUE) return s;

  std::string log = infoLog(s, glGetShaderiv, glGetShaderInfoLog);
  std::fprintf(stderr, "ShaderProgram: %s stage failed to compile:\n%s\n",
               stageName(stage), log.c_str());
  glDeleteShader(s);
  return 0;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  release();
}

void ShaderProgram::release() {
  if (!program_) return;
  glDeleteProgram(program_);
  program_ = 0;
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  release();

  const GLenum stages[2] = {GL_VERTEX_SHADER, GL_FRAGMENT_SHADER};
  const char* sources[2] = {vertSrc, fragSrc};
  GLuint shaders[2] = {0, 0};
  for (int i = 0; i < 2; i++) {
    shaders[i] = compileStage(stages[i], sources[i]);
    if (!shaders[i]) {
      if (i == 1) glDeleteShader(shaders[0]);
      return false;
    }
  }

  GLuint prog = glCreateProgram();
  for (GLuint s : shaders) glAttachShader(prog, s);
  glLinkProgram(prog);
  for (GLuint s : shaders) {
    glDetachShader(prog, s);
    glDeleteShader(s);
  }

  GLint status = GL_FALSE;
  glGetProgramiv(prog, GL_LINK_STATUS, &status);
  if (status != GL_TRUE) {
    std::string log = infoLog(prog, glGetProgramiv, glGetProgramInfoLog);
    std::fprintf(stderr, "ShaderProgram: link failed:\n%s\n", log.c_str());
    glDeleteProgram(prog);
    return false;
  }

  program_ = prog;
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  return program_ ? glGetAttribLocation(program_, name) : -1;
}

GLint ShaderProgram::uniformLocation(const char* name) const {
  return program_ ? glGetUniformLocation(program_, name) : -1;
}

void ShaderProgram::setUniformMat4(GLint loc, const float* data) const {
  if (loc < 0) return;
  glUniformMatrix4fv(loc, 1, GL_FALSE, data);
}

} // namespace fv
