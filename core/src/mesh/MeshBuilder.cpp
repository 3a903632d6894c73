#include "fv/mesh/MeshBuilder.hpp"

#include <cmath>
#include <string>

namespace fv {

static MeshBuildResult fail(const char* code, const std::string& message) {
  MeshBuildResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

std::vector<float> computeVertexNormals(const std::vector<float>& positions,
                                        const std::vector<std::uint32_t>& indices) {
  std::size_t n = positions.size() / 3;
  std::vector<Vec3> acc(n);

  auto point = [&](std::uint32_t i) {
    return Vec3{positions[i * 3 + 0], positions[i * 3 + 1], positions[i * 3 + 2]};
  };

  // Unnormalized face normal has length 2 * area, which gives the weighting.
  for (std::size_t t = 0; t + 2 < indices.size(); t += 3) {
    std::uint32_t a = indices[t], b = indices[t + 1], c = indices[t + 2];
    Vec3 fn = cross(point(b) - point(a), point(c) - point(a));
    acc[a] = acc[a] + fn;
    acc[b] = acc[b] + fn;
    acc[c] = acc[c] + fn;
  }

  std::vector<float> normals(n * 3);
  for (std::size_t i = 0; i < n; i++) {
    Vec3 v = acc[i];
    if (length(v) < 1e-12) v = {0.0, 0.0, 1.0};
    else v = normalize(v);
    normals[i * 3 + 0] = static_cast<float>(v.x);
    normals[i * 3 + 1] = static_cast<float>(v.y);
    normals[i * 3 + 2] = static_cast<float>(v.z);
  }
  return normals;
}

MeshBuildResult buildMesh(const std::vector<Vec3>& vertices,
                          const std::vector<Triangle>& triangles,
                          const ScalarField* vertexData,
                          const ScaleColors& colors) {
  // ---- validate everything before producing output ----
  if (vertexData) {
    if (vertexData->rows != vertices.size()) {
      return fail(kErrShapeMismatch,
                  "vertex data has " + std::to_string(vertexData->rows) +
                  " rows, mesh has " + std::to_string(vertices.size()) + " vertices");
    }
    if (!vertexData->wellFormed()) {
      return fail(kErrShapeMismatch,
                  "vertex data must have >= 1 column and rows*columns values");
    }
  }

  const auto vertexCount = static_cast<std::int64_t>(vertices.size());
  for (std::size_t t = 0; t < triangles.size(); t++) {
    for (std::int64_t idx : triangles[t]) {
      if (idx < 0 || idx >= vertexCount) {
        return fail(kErrIndexOutOfRange,
                    "triangle " + std::to_string(t) + " references vertex " +
                    std::to_string(idx) + " (vertex count " +
                    std::to_string(vertexCount) + ")");
      }
    }
  }

  // ---- build ----
  MeshBuildResult r;
  RenderableMesh& m = r.mesh;

  m.positions.reserve(vertices.size() * 3);
  for (const Vec3& v : vertices) {
    m.positions.push_back(static_cast<float>(v.x));
    m.positions.push_back(static_cast<float>(v.y));
    m.positions.push_back(static_cast<float>(v.z));
    m.bounds.expand(v);
  }

  m.indices.reserve(triangles.size() * 3);
  for (const Triangle& tri : triangles) {
    m.indices.push_back(static_cast<std::uint32_t>(tri[0]));
    m.indices.push_back(static_cast<std::uint32_t>(tri[1]));
    m.indices.push_back(static_cast<std::uint32_t>(tri[2]));
  }

  m.normals = computeVertexNormals(m.positions, m.indices);

  if (vertexData) {
    m.field = *vertexData;
    double magnitude = vertexData->maxAbs();
    if (magnitude == 0.0) magnitude = 1.0;
    m.scale = ColorScale::build(-magnitude, magnitude,
                                colors.start, colors.middle, colors.end);
  }

  return r;
}

} // namespace fv
