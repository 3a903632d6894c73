#pragma once
#include "fv/Error.hpp"
#include "fv/mesh/Mesh.hpp"
#include "fv/session/ViewerConfig.hpp"

#include <cstdint>
#include <vector>

namespace fv {

struct DisplayResult {
  bool ok{true};
  Error err{};
  std::uint32_t framesRendered{0};
};

// Show a mesh in an interactive window and block until the user quits.
//
// Right/Left step through the columns of vertexData, `q` or closing the
// window ends the session. Drag with the left button to rotate, middle
// (or shift + left) to pan, right button or wheel to zoom. `r` resets the
// view, `w` / `s` toggle wireframe.
//
// Mesh validation runs before any window is created.
DisplayResult displayMesh(const std::vector<Vec3>& vertices,
                          const std::vector<Triangle>& triangles,
                          const ScalarField* vertexData = nullptr,
                          const ViewerConfig& cfg = ViewerConfig{});

} // namespace fv
