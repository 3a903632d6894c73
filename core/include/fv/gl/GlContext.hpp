#pragma once
#include "fv/viewport/InputState.hpp"
#include <cstdint>
#include <vector>

namespace fv {

class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;
  virtual void swapBuffers() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA pixels from the framebuffer, bottom row first.
  virtual std::vector<std::uint8_t> readPixels() const = 0;

  // Gather input since the last call. With wait = true, block until at
  // least one event arrives.
  virtual InputState pollInput(bool wait) = 0;

  // Destroy the window / context. Safe to call more than once.
  virtual void finalize() = 0;
  virtual bool finalized() const = 0;
};

} // namespace fv
