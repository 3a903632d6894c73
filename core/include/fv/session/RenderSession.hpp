#pragma once
#include "fv/Error.hpp"
#include "fv/debug/Stats.hpp"
#include "fv/gl/GlContext.hpp"
#include "fv/gl/MeshRenderer.hpp"
#include "fv/mesh/MeshBuilder.hpp"
#include "fv/session/InteractionController.hpp"
#include "fv/session/ViewerConfig.hpp"
#include "fv/viewport/InputState.hpp"
#include "fv/viewport/TrackballCamera.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace fv {

struct SessionResult {
  bool ok{true};
  Error err{};
  std::uint32_t framesRendered{0};
  int finalComponent{0};
};

// One interactive viewing session over one mesh.
//
// Owns the GL context, renderer, camera, controller and the mesh with its
// color scale. Everything runs on the thread that calls open(); the loop
// blocks on window events and redraws after each state-changing event.
// shutdown() runs once, whether reached through `q`, a closed window or
// destruction; GL objects are deleted before the context goes away.
class RenderSession {
public:
  // ctx must already be initialized (init() returned true).
  RenderSession(std::unique_ptr<GlContext> ctx, RenderableMesh mesh,
                const ViewerConfig& cfg = ViewerConfig{});
  ~RenderSession();

  RenderSession(const RenderSession&) = delete;
  RenderSession& operator=(const RenderSession&) = delete;

  // start() + event loop + shutdown(). Blocks until the user quits.
  SessionResult open();

  // Build GPU resources, frame the camera and draw the first frame.
  bool start();

  // Dispatch one polled snapshot: keys in order, then camera motion.
  // Returns false once the session has shut down.
  bool processInput(const InputState& in);

  // Route one key: controller first, camera-layer keys otherwise.
  KeyAction handleKey(KeyCode key);

  // Sync the mapped component with the controller and draw now.
  void repaint();

  // Release GL resources and the window. Idempotent.
  void shutdown();

  bool closed() const { return closed_; }
  int componentIndex() const { return controller_.componentIndex(); }
  int mappedComponent() const { return mappedComponent_; }
  const std::vector<float>& vertexColors() const { return colors_; }
  const RenderableMesh& mesh() const { return mesh_; }
  const TrackballCamera& camera() const { return camera_; }
  const Stats& lastStats() const { return lastStats_; }
  std::uint32_t framesRendered() const { return frames_; }
  bool wireframe() const { return debug_.wireframe; }
  GlContext* context() { return ctx_.get(); }

private:
  void refreshColors();

  std::unique_ptr<GlContext> ctx_;
  RenderableMesh mesh_;
  ViewerConfig config_;

  MeshRenderer renderer_;
  TrackballCamera camera_;
  InteractionController controller_;
  DebugToggles debug_{};

  std::vector<float> colors_;
  int mappedComponent_{0};
  Stats lastStats_{};
  std::uint32_t frames_{0};
  bool started_{false};
  bool closed_{false};
};

} // namespace fv
