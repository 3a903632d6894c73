// D3.1: InteractionController: component stepping and termination
#include "fv/session/InteractionController.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: initial state ----
  {
    fv::InteractionController c(5);
    requireTrue(c.componentIndex() == 0, "starts at 0");
    requireTrue(c.columnCount() == 5, "column count");
    requireTrue(!c.terminated(), "not terminated");
    std::printf("  Test 1 (initial state): PASS\n");
  }

  // ---- Test 2: stepping ----
  {
    fv::InteractionController c(5);
    requireTrue(c.processKey(fv::KeyCode::Right) == fv::KeyAction::Repaint, "Right repaints");
    requireTrue(c.processKey(fv::KeyCode::Right) == fv::KeyAction::Repaint, "Right again");
    requireTrue(c.componentIndex() == 2, "index 2");
    requireTrue(c.processKey(fv::KeyCode::Left) == fv::KeyAction::Repaint, "Left repaints");
    requireTrue(c.componentIndex() == 1, "index 1");
    std::printf("  Test 2 (stepping): PASS\n");
  }

  // ---- Test 3: lower clamp ----
  {
    fv::InteractionController c(3);
    requireTrue(c.processKey(fv::KeyCode::Left) == fv::KeyAction::Repaint, "Left at 0 still repaints");
    requireTrue(c.componentIndex() == 0, "stays at 0");
    std::printf("  Test 3 (lower clamp): PASS\n");
  }

  // ---- Test 4: upper clamp is inclusive of the column count ----
  {
    fv::InteractionController c(3);
    c.processKey(fv::KeyCode::Right);
    c.processKey(fv::KeyCode::Right);
    requireTrue(c.componentIndex() == 2, "last column");
    c.processKey(fv::KeyCode::Right);
    requireTrue(c.componentIndex() == 3, "one past the last column");
    c.processKey(fv::KeyCode::Right);
    requireTrue(c.componentIndex() == 3, "clamped at column count");
    std::printf("  Test 4 (upper clamp): PASS\n");
  }

  // ---- Test 5: no field ----
  {
    fv::InteractionController c;
    requireTrue(c.processKey(fv::KeyCode::Right) == fv::KeyAction::Repaint, "still repaints");
    requireTrue(c.componentIndex() == 0, "index pinned at 0");
    std::printf("  Test 5 (no field): PASS\n");
  }

  // ---- Test 6: other keys ----
  {
    fv::InteractionController c(4);
    requireTrue(c.processKey(fv::KeyCode::R) == fv::KeyAction::None, "r not handled");
    requireTrue(c.processKey(fv::KeyCode::W) == fv::KeyAction::None, "w not handled");
    requireTrue(c.processKey(fv::KeyCode::Other) == fv::KeyAction::None, "other ignored");
    requireTrue(c.componentIndex() == 0, "index unchanged");
    std::printf("  Test 6 (other keys): PASS\n");
  }

  // ---- Test 7: quit is terminal ----
  {
    fv::InteractionController c(4);
    c.processKey(fv::KeyCode::Right);
    requireTrue(c.processKey(fv::KeyCode::Q) == fv::KeyAction::Quit, "q quits");
    requireTrue(c.terminated(), "terminated");
    requireTrue(c.processKey(fv::KeyCode::Right) == fv::KeyAction::None, "Right ignored");
    requireTrue(c.processKey(fv::KeyCode::Q) == fv::KeyAction::None, "second q harmless");
    requireTrue(c.componentIndex() == 1, "index frozen");
    std::printf("  Test 7 (quit): PASS\n");
  }

  std::printf("D3.1 interaction_controller: ALL PASS\n");
  return 0;
}
