#pragma once
#include "fv/Error.hpp"
#include "fv/color/ColorScale.hpp"
#include "fv/mesh/Mesh.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace fv {

// Anchor colors used when a scalar field is present.
struct ScaleColors {
  Color start{ColorScale::defaultStart()};
  Color middle{ColorScale::defaultMiddle()};
  Color end{ColorScale::defaultEnd()};
};

// Points + triangles + optional per-point field, ready to upload.
struct RenderableMesh {
  std::vector<float> positions;        // xyz per point
  std::vector<float> normals;          // xyz per point, unit length
  std::vector<std::uint32_t> indices;  // 3 per triangle
  Bounds bounds;

  ScalarField field;                   // columns == 0 when absent
  std::optional<ColorScale> scale;     // set iff field is present

  std::size_t pointCount() const { return positions.size() / 3; }
  std::size_t triangleCount() const { return indices.size() / 3; }
  bool hasField() const { return scale.has_value(); }
};

struct MeshBuildResult {
  bool ok{true};
  Error err{};
  RenderableMesh mesh;
};

// Validate and convert. With vertexData, the color scale spans
// [-m, +m] where m = max |vertexData| over finite values (1.0 when that
// is 0). Infinite values saturate to the end colors, NaN to the start.
// On failure nothing is built and `mesh` is left empty.
MeshBuildResult buildMesh(const std::vector<Vec3>& vertices,
                          const std::vector<Triangle>& triangles,
                          const ScalarField* vertexData = nullptr,
                          const ScaleColors& colors = ScaleColors{});

// Area-weighted vertex normals. Isolated vertices get +Z.
std::vector<float> computeVertexNormals(const std::vector<float>& positions,
                                        const std::vector<std::uint32_t>& indices);

} // namespace fv
