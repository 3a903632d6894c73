#pragma once
#include <glad/gl.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace fv {

enum class MeshBuffer : std::uint8_t {
  Positions = 0,
  Normals,
  Colors,
  Indices
};

// CPU staging + lazy upload of the mesh's GL buffers.
class GpuBufferManager {
public:
  ~GpuBufferManager();

  // Store CPU-side bytes for a slot. target is GL_ARRAY_BUFFER or
  // GL_ELEMENT_ARRAY_BUFFER.
  void setCpuData(MeshBuffer slot, GLenum target, const void* data, std::uint32_t bytes);

  // Upload any dirty buffers to GL. Returns total bytes uploaded.
  std::uint64_t uploadDirty();

  // Get the GL buffer name for a slot (0 if not uploaded yet).
  GLuint getGlBuffer(MeshBuffer slot) const;

  std::uint32_t activeBuffers() const;

  // Delete all GL buffers while the context is still current.
  void release();

private:
  struct Entry {
    std::vector<std::uint8_t> cpuData;
    GLenum target{GL_ARRAY_BUFFER};
    GLuint vbo{0};
    bool dirty{false};
  };
  std::unordered_map<MeshBuffer, Entry> entries_;
};

} // namespace fv
