#pragma once
#include "fv/gl/GlContext.hpp"
#include "fv/viewport/InputState.hpp"

#ifdef FV_HAS_GLFW

#include <string>

struct GLFWwindow;

namespace fv {

class GlfwContext : public GlContext {
public:
  explicit GlfwContext(std::string title = "FieldView");
  ~GlfwContext() override;

  GlfwContext(const GlfwContext&) = delete;
  GlfwContext& operator=(const GlfwContext&) = delete;

  bool init(int width, int height) override;
  void swapBuffers() override;

  int width() const override { return width_; }
  int height() const override { return height_; }

  std::vector<std::uint8_t> readPixels() const override;

  InputState pollInput(bool wait) override;

  void finalize() override;
  bool finalized() const override { return window_ == nullptr; }

  bool shouldClose() const;

private:
  std::string title_;
  GLFWwindow* window_{nullptr};
  bool glfwUp_{false};
  int width_{0};
  int height_{0};

  // Input accumulation (set via callbacks)
  InputState pending_;
  double lastCursorX_{0};
  double lastCursorY_{0};
  bool leftDown_{false};
  bool middleDown_{false};
  bool rightDown_{false};
  bool shiftDown_{false};

  static void keyCallback(GLFWwindow* w, int key, int scancode, int action, int mods);
  static void scrollCallback(GLFWwindow* w, double xoff, double yoff);
  static void cursorPosCallback(GLFWwindow* w, double x, double y);
  static void mouseButtonCallback(GLFWwindow* w, int button, int action, int mods);
  static void framebufferSizeCallback(GLFWwindow* w, int width, int height);
};

} // namespace fv

#endif // FV_HAS_GLFW
