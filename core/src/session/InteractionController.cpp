#include "fv/session/InteractionController.hpp"

namespace fv {

int InteractionController::clampIndex(int v) const {
  if (v < 0) return 0;
  if (v > columnCount_) return columnCount_;
  return v;
}

KeyAction InteractionController::processKey(KeyCode key) {
  if (terminated_) return KeyAction::None;

  switch (key) {
    case KeyCode::Right:
      componentIndex_ = clampIndex(componentIndex_ + 1);
      return KeyAction::Repaint;
    case KeyCode::Left:
      componentIndex_ = clampIndex(componentIndex_ - 1);
      return KeyAction::Repaint;
    case KeyCode::Q:
      terminated_ = true;
      return KeyAction::Quit;
    default:
      return KeyAction::None;
  }
}

} // namespace fv
