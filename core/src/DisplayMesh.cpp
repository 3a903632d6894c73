#include "fv/DisplayMesh.hpp"
#include "fv/mesh/MeshBuilder.hpp"
#include "fv/session/RenderSession.hpp"

#ifdef FV_HAS_GLFW
#include "fv/gl/GlfwContext.hpp"
#endif

#include <cstdio>
#include <memory>
#include <utility>

namespace fv {

DisplayResult displayMesh(const std::vector<Vec3>& vertices,
                          const std::vector<Triangle>& triangles,
                          const ScalarField* vertexData,
                          const ViewerConfig& cfg) {
  DisplayResult r;

  MeshBuildResult built = buildMesh(vertices, triangles, vertexData, cfg.scale);
  if (!built.ok) {
    r.ok = false;
    r.err = built.err;
    return r;
  }

#ifdef FV_HAS_GLFW
  auto ctx = std::make_unique<GlfwContext>(cfg.title);
  if (!ctx->init(cfg.windowWidth, cfg.windowHeight)) {
    r.ok = false;
    r.err.code = kErrContextInitFailed;
    r.err.message = "could not open a GLFW window";
    return r;
  }

  RenderSession session(std::move(ctx), std::move(built.mesh), cfg);
  SessionResult sr = session.open();
  r.ok = sr.ok;
  r.err = sr.err;
  r.framesRendered = sr.framesRendered;
#else
  std::fprintf(stderr, "displayMesh: built without GLFW, no window available\n");
  r.ok = false;
  r.err.code = kErrContextInitFailed;
  r.err.message = "built without GLFW";
#endif
  return r;
}

} // namespace fv
