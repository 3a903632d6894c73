#pragma once
#include "fv/viewport/InputState.hpp"
#include <cstdint>

namespace fv {

enum class KeyAction : std::uint8_t {
  None = 0,  // not handled here; camera layer may use the key
  Repaint,   // active component may have changed, redraw now
  Quit       // terminal: release resources and leave the loop
};

// Key-driven state machine over the active field component.
//
// Right/Left step the component index, clamped to [0, columnCount].
// The upper bound is inclusive of columnCount, one past the last column;
// the color mapping stage reads the last column for that index.
// `q` terminates; once terminated every key returns None.
class InteractionController {
public:
  explicit InteractionController(int columnCount = 0) : columnCount_(columnCount) {}

  KeyAction processKey(KeyCode key);

  int componentIndex() const { return componentIndex_; }
  int columnCount() const { return columnCount_; }
  bool terminated() const { return terminated_; }

private:
  int clampIndex(int v) const;

  int componentIndex_{0};
  int columnCount_{0};
  bool terminated_{false};
};

} // namespace fv
