#pragma once
#include <cstdint>

namespace fv {

struct DebugToggles {
  bool wireframe = false;
};

struct Stats {
  // Rendering
  std::uint32_t drawCalls = 0;
  std::uint32_t trianglesDrawn = 0;

  // Upload activity
  std::uint64_t uploadedBytesThisFrame = 0;

  // Resource counts
  std::uint32_t activeBuffers = 0;

  DebugToggles debug{};
};

} // namespace fv
