#pragma once
#include "fv/color/ColorScale.hpp"
#include "fv/debug/Stats.hpp"
#include "fv/gl/GpuBufferManager.hpp"
#include "fv/gl/ShaderProgram.hpp"
#include "fv/math/Mat4.hpp"
#include "fv/mesh/MeshBuilder.hpp"
#include <glad/gl.h>
#include <vector>

namespace fv {

// Draws one RenderableMesh with per-vertex colors and a headlight.
class MeshRenderer {
public:
  MeshRenderer() = default;
  ~MeshRenderer();

  MeshRenderer(const MeshRenderer&) = delete;
  MeshRenderer& operator=(const MeshRenderer&) = delete;

  // Compile shaders, create VAO. Call once after GL context is current.
  bool init();

  // Stage geometry and colors (4 floats per point).
  void setMesh(const RenderableMesh& mesh, const std::vector<float>& colors);

  // Restage colors only, e.g. after the active component changed.
  void setColors(const std::vector<float>& colors);

  Stats render(const Mat4& view, const Mat4& proj, int viewW, int viewH,
               const Color& background, const DebugToggles& debug);

  // Delete every GL object. Must run while the context is current;
  // later calls are no-ops.
  void release();

  bool inited() const { return inited_; }

private:
  ShaderProgram meshProg_;
  GpuBufferManager gpuBufs_;
  GLuint vao_{0};
  std::uint32_t indexCount_{0};
  bool inited_{false};
};

} // namespace fv
