#include "fv/session/RenderSession.hpp"
#include "fv/color/ColorMapping.hpp"

#include <cstdio>
#include <utility>

namespace fv {

RenderSession::RenderSession(std::unique_ptr<GlContext> ctx, RenderableMesh mesh,
                             const ViewerConfig& cfg)
  : ctx_(std::move(ctx)),
    mesh_(std::move(mesh)),
    config_(cfg),
    controller_(static_cast<int>(mesh_.hasField() ? mesh_.field.columns : 0)) {
  camera_.setConfig(config_.camera);
  refreshColors();
}

RenderSession::~RenderSession() {
  shutdown();
}

void RenderSession::refreshColors() {
  mappedComponent_ = controller_.componentIndex();
  if (mesh_.hasField()) {
    colors_ = mapComponent(mesh_.field, mappedComponent_, *mesh_.scale);
  } else {
    colors_ = uniformColors(mesh_.pointCount(), config_.surface);
  }
}

bool RenderSession::start() {
  if (started_ || closed_) return started_ && !closed_;
  if (!ctx_ || ctx_->finalized()) {
    std::fprintf(stderr, "RenderSession: no live GL context\n");
    return false;
  }
  if (!renderer_.init()) {
    std::fprintf(stderr, "RenderSession: renderer init failed\n");
    return false;
  }

  renderer_.setMesh(mesh_, colors_);
  camera_.resetToBounds(mesh_.bounds);
  started_ = true;
  repaint();
  return true;
}

void RenderSession::repaint() {
  if (!started_ || closed_) return;

  if (mappedComponent_ != controller_.componentIndex()) {
    refreshColors();
    renderer_.setColors(colors_);
  }

  int w = ctx_->width();
  int h = ctx_->height();
  double aspect = (h > 0) ? static_cast<double>(w) / static_cast<double>(h) : 1.0;
  lastStats_ = renderer_.render(camera_.viewMatrix(), camera_.projectionMatrix(aspect),
                                w, h, config_.background, debug_);
  ctx_->swapBuffers();
  frames_++;
}

KeyAction RenderSession::handleKey(KeyCode key) {
  if (closed_) return KeyAction::None;

  KeyAction action = controller_.processKey(key);
  switch (action) {
    case KeyAction::Repaint:
      repaint();
      break;
    case KeyAction::Quit:
      shutdown();
      break;
    case KeyAction::None:
      // Camera-layer keys.
      if (key == KeyCode::R) {
        camera_.resetToBounds(mesh_.bounds);
        repaint();
      } else if (key == KeyCode::W || key == KeyCode::S) {
        debug_.wireframe = (key == KeyCode::W);
        repaint();
      }
      break;
  }
  return action;
}

bool RenderSession::processInput(const InputState& in) {
  if (closed_) return false;
  if (in.shouldClose) {
    shutdown();
    return false;
  }

  for (KeyCode key : in.keys) {
    if (handleKey(key) == KeyAction::Quit) return false;
  }

  bool redraw = in.resized;
  if (in.hasCameraMotion() && camera_.processInput(in, ctx_->width(), ctx_->height()))
    redraw = true;
  if (redraw) repaint();
  return !closed_;
}

void RenderSession::shutdown() {
  if (closed_) return;
  closed_ = true;

  // GL objects first, while the context is still alive.
  if (ctx_ && !ctx_->finalized()) {
    renderer_.release();
    ctx_->finalize();
  }
}

SessionResult RenderSession::open() {
  SessionResult r;
  if (!ctx_ || ctx_->finalized()) {
    shutdown();
    r.ok = false;
    r.err.code = kErrContextInitFailed;
    r.err.message = "no live GL context";
    return r;
  }
  if (!start()) {
    shutdown();
    r.ok = false;
    r.err.code = kErrRendererInit;
    r.err.message = "could not create GPU resources for the mesh";
    return r;
  }

  while (!closed_) {
    InputState in = ctx_->pollInput(true);
    if (!processInput(in)) break;
  }
  shutdown();

  r.framesRendered = frames_;
  r.finalComponent = controller_.componentIndex();
  return r;
}

} // namespace fv
