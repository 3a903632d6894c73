#include "fv/gl/MeshRenderer.hpp"
#include <cstdio>

namespace fv {

// ---- Mesh shader: per-vertex color, two-sided headlight ----

static const char* kMeshVert = R"GLSL(
#version 330 core
in vec3 a_pos;
in vec3 a_normal;
in vec4 a_color;
uniform mat4 u_view;
uniform mat4 u_proj;
out vec3 v_normal;
out vec4 v_color;
void main() {
    v_normal = mat3(u_view) * a_normal;
    v_color = a_color;
    gl_Position = u_proj * u_view * vec4(a_pos, 1.0);
}
)GLSL";

static const char* kMeshFrag = R"GLSL(
#version 330 core
in vec3 v_normal;
in vec4 v_color;
out vec4 outColor;
void main() {
    // Light sits at the camera, shining along -Z in view space.
    float len = length(v_normal);
    float diffuse = (len > 0.0) ? abs(v_normal.z / len) : 1.0;
    outColor = vec4(v_color.rgb * diffuse, v_color.a);
}
)GLSL";

MeshRenderer::~MeshRenderer() {
  release();
}

bool MeshRenderer::init() {
  if (!meshProg_.build(kMeshVert, kMeshFrag)) {
    std::fprintf(stderr, "MeshRenderer::init: failed to build mesh shader\n");
    return false;
  }

  glGenVertexArrays(1, &vao_);
  glEnable(GL_DEPTH_TEST);
  glDepthFunc(GL_LEQUAL);
  inited_ = true;
  return true;
}

void MeshRenderer::release() {
  gpuBufs_.release();
  meshProg_.release();
  if (vao_) {
    glDeleteVertexArrays(1, &vao_);
    vao_ = 0;
  }
  indexCount_ = 0;
  inited_ = false;
}

void MeshRenderer::setMesh(const RenderableMesh& mesh, const std::vector<float>& colors) {
  gpuBufs_.setCpuData(MeshBuffer::Positions, GL_ARRAY_BUFFER, mesh.positions.data(),
                      static_cast<std::uint32_t>(mesh.positions.size() * sizeof(float)));
  gpuBufs_.setCpuData(MeshBuffer::Normals, GL_ARRAY_BUFFER, mesh.normals.data(),
                      static_cast<std::uint32_t>(mesh.normals.size() * sizeof(float)));
  gpuBufs_.setCpuData(MeshBuffer::Indices, GL_ELEMENT_ARRAY_BUFFER, mesh.indices.data(),
                      static_cast<std::uint32_t>(mesh.indices.size() * sizeof(std::uint32_t)));
  indexCount_ = static_cast<std::uint32_t>(mesh.indices.size());
  setColors(colors);
}

void MeshRenderer::setColors(const std::vector<float>& colors) {
  gpuBufs_.setCpuData(MeshBuffer::Colors, GL_ARRAY_BUFFER, colors.data(),
                      static_cast<std::uint32_t>(colors.size() * sizeof(float)));
}

static void bindAttrib(const ShaderProgram& prog, const char* name,
                       GLuint vbo, GLint components) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  glEnableVertexAttribArray(static_cast<GLuint>(loc));
  glVertexAttribPointer(static_cast<GLuint>(loc), components, GL_FLOAT, GL_FALSE, 0, nullptr);
}

Stats MeshRenderer::render(const Mat4& view, const Mat4& proj, int viewW, int viewH,
                           const Color& background, const DebugToggles& debug) {
  Stats stats;
  stats.debug = debug;
  if (!inited_) return stats;

  // Element-array bindings are VAO state; keep ours bound for uploads too.
  glBindVertexArray(vao_);
  stats.uploadedBytesThisFrame = gpuBufs_.uploadDirty();
  stats.activeBuffers = gpuBufs_.activeBuffers();

  glViewport(0, 0, viewW, viewH);
  glClearColor(static_cast<float>(background.r), static_cast<float>(background.g),
               static_cast<float>(background.b), 1.0f);
  glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

  if (indexCount_ == 0) {
    glBindVertexArray(0);
    return stats;
  }

  GLuint posVbo = gpuBufs_.getGlBuffer(MeshBuffer::Positions);
  GLuint nrmVbo = gpuBufs_.getGlBuffer(MeshBuffer::Normals);
  GLuint colVbo = gpuBufs_.getGlBuffer(MeshBuffer::Colors);
  GLuint ebo = gpuBufs_.getGlBuffer(MeshBuffer::Indices);
  if (!posVbo || !nrmVbo || !colVbo || !ebo) {
    glBindVertexArray(0);
    return stats;
  }

  meshProg_.use();
  meshProg_.setUniformMat4(meshProg_.uniformLocation("u_view"), view.m);
  meshProg_.setUniformMat4(meshProg_.uniformLocation("u_proj"), proj.m);

  bindAttrib(meshProg_, "a_pos", posVbo, 3);
  bindAttrib(meshProg_, "a_normal", nrmVbo, 3);
  bindAttrib(meshProg_, "a_color", colVbo, 4);
  glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, ebo);

  glPolygonMode(GL_FRONT_AND_BACK, debug.wireframe ? GL_LINE : GL_FILL);
  glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(indexCount_), GL_UNSIGNED_INT, nullptr);
  glPolygonMode(GL_FRONT_AND_BACK, GL_FILL);
  stats.drawCalls++;
  stats.trianglesDrawn += indexCount_ / 3;

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return stats;
}

} // namespace fv
