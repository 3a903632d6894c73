#pragma once
#include <cstdint>
#include <vector>

namespace fv {

enum class KeyCode : std::uint8_t {
  None = 0,
  Left, Right,  // component stepping
  Q,            // quit
  R, W, S,      // camera layer: reset, wireframe, surface
  Other
};

// Generic input snapshot accumulated between two polls. NOT GLFW-specific.
struct InputState {
  double cursorX{0}, cursorY{0};   // pixels, 0=left/top
  double rotateDx{0}, rotateDy{0}; // left drag
  double panDx{0}, panDy{0};       // middle drag, or shift + left drag
  double dollyDy{0};               // right drag, positive = toward the focal point
  double scrollDelta{0};           // positive = zoom in
  std::vector<KeyCode> keys;       // in arrival order
  bool resized{false};
  bool shouldClose{false};

  bool hasCameraMotion() const {
    return rotateDx != 0 || rotateDy != 0 || panDx != 0 || panDy != 0 ||
           dollyDy != 0 || scrollDelta != 0;
  }
};

} // namespace fv
