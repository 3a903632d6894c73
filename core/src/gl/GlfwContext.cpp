#ifdef FV_HAS_GLFW

#include "fv/gl/GlfwContext.hpp"
#include <glad/gl.h>
#include <GLFW/glfw3.h>
#include <cstdio>
#include <utility>

namespace fv {

GlfwContext::GlfwContext(std::string title) : title_(std::move(title)) {}

GlfwContext::~GlfwContext() {
  finalize();
}

bool GlfwContext::init(int width, int height) {
  if (!glfwInit()) {
    std::fprintf(stderr, "GlfwContext: glfwInit failed\n");
    return false;
  }
  glfwUp_ = true;

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_DEPTH_BITS, 24);

  window_ = glfwCreateWindow(width, height, title_.c_str(), nullptr, nullptr);
  if (!window_) {
    std::fprintf(stderr, "GlfwContext: glfwCreateWindow failed\n");
    finalize();
    return false;
  }

  glfwMakeContextCurrent(window_);

  int version = gladLoadGL((GLADloadfunc)glfwGetProcAddress);
  if (!version) {
    std::fprintf(stderr, "GlfwContext: gladLoadGL failed\n");
    finalize();
    return false;
  }

  // Framebuffer may differ from the window size on HiDPI displays.
  glfwGetFramebufferSize(window_, &width_, &height_);

  // Install callbacks
  glfwSetWindowUserPointer(window_, this);
  glfwSetKeyCallback(window_, keyCallback);
  glfwSetScrollCallback(window_, scrollCallback);
  glfwSetCursorPosCallback(window_, cursorPosCallback);
  glfwSetMouseButtonCallback(window_, mouseButtonCallback);
  glfwSetFramebufferSizeCallback(window_, framebufferSizeCallback);

  // Initialize cursor position
  glfwGetCursorPos(window_, &lastCursorX_, &lastCursorY_);

  return true;
}

void GlfwContext::swapBuffers() {
  if (window_) {
    glfwSwapBuffers(window_);
  }
}

std::vector<std::uint8_t> GlfwContext::readPixels() const {
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width_) * height_ * 4);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool GlfwContext::shouldClose() const {
  return !window_ || glfwWindowShouldClose(window_);
}

void GlfwContext::finalize() {
  if (window_) {
    glfwSetWindowUserPointer(window_, nullptr);
    glfwDestroyWindow(window_);
    window_ = nullptr;
  }
  if (glfwUp_) {
    glfwTerminate();
    glfwUp_ = false;
  }
}

InputState GlfwContext::pollInput(bool wait) {
  if (!window_) {
    InputState closed;
    closed.shouldClose = true;
    return closed;
  }

  if (wait) glfwWaitEvents();
  else glfwPollEvents();

  InputState state = std::move(pending_);
  pending_ = InputState{};
  state.cursorX = lastCursorX_;
  state.cursorY = lastCursorY_;
  state.shouldClose = shouldClose();
  return state;
}

static KeyCode translateKey(int key) {
  switch (key) {
    case GLFW_KEY_LEFT:  return KeyCode::Left;
    case GLFW_KEY_RIGHT: return KeyCode::Right;
    case GLFW_KEY_Q:     return KeyCode::Q;
    case GLFW_KEY_R:     return KeyCode::R;
    case GLFW_KEY_W:     return KeyCode::W;
    case GLFW_KEY_S:     return KeyCode::S;
    default:             return KeyCode::Other;
  }
}

void GlfwContext::keyCallback(GLFWwindow* w, int key, int /*scancode*/, int action, int mods) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->shiftDown_ = (mods & GLFW_MOD_SHIFT) != 0;
  if (action == GLFW_PRESS || action == GLFW_REPEAT) {
    self->pending_.keys.push_back(translateKey(key));
  }
}

void GlfwContext::scrollCallback(GLFWwindow* w, double /*xoff*/, double yoff) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (self) self->pending_.scrollDelta += yoff;
}

void GlfwContext::cursorPosCallback(GLFWwindow* w, double x, double y) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  double dx = x - self->lastCursorX_;
  double dy = y - self->lastCursorY_;

  if (self->leftDown_ && !self->shiftDown_) {
    self->pending_.rotateDx += dx;
    self->pending_.rotateDy += dy;
  } else if (self->middleDown_ || (self->leftDown_ && self->shiftDown_)) {
    self->pending_.panDx += dx;
    self->pending_.panDy += dy;
  } else if (self->rightDown_) {
    // Dragging up (negative window dy) moves toward the focal point.
    self->pending_.dollyDy -= dy;
  }

  self->lastCursorX_ = x;
  self->lastCursorY_ = y;
}

void GlfwContext::mouseButtonCallback(GLFWwindow* w, int button, int action, int mods) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  bool down = (action == GLFW_PRESS);
  self->shiftDown_ = (mods & GLFW_MOD_SHIFT) != 0;
  if (button == GLFW_MOUSE_BUTTON_LEFT) self->leftDown_ = down;
  else if (button == GLFW_MOUSE_BUTTON_MIDDLE) self->middleDown_ = down;
  else if (button == GLFW_MOUSE_BUTTON_RIGHT) self->rightDown_ = down;
}

void GlfwContext::framebufferSizeCallback(GLFWwindow* w, int width, int height) {
  auto* self = static_cast<GlfwContext*>(glfwGetWindowUserPointer(w));
  if (!self) return;

  self->width_ = width;
  self->height_ = height;
  self->pending_.resized = true;
}

} // namespace fv

#endif // FV_HAS_GLFW
