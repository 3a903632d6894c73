#include "fv/gl/GpuBufferManager.hpp"
#include <cstring>

namespace fv {

GpuBufferManager::~GpuBufferManager() {
  release();
}

void GpuBufferManager::release() {
  for (auto& [slot, e] : entries_) {
    if (e.vbo) {
      glDeleteBuffers(1, &e.vbo);
    }
  }
  entries_.clear();
}

void GpuBufferManager::setCpuData(MeshBuffer slot, GLenum target,
                                  const void* data, std::uint32_t bytes) {
  auto& e = entries_[slot];
  e.target = target;
  e.cpuData.resize(bytes);
  if (bytes) std::memcpy(e.cpuData.data(), data, bytes);
  e.dirty = true;
}

std::uint64_t GpuBufferManager::uploadDirty() {
  std::uint64_t uploaded = 0;
  for (auto& [slot, e] : entries_) {
    if (!e.dirty) continue;
    if (!e.vbo) {
      glGenBuffers(1, &e.vbo);
    }
    glBindBuffer(e.target, e.vbo);
    glBufferData(e.target,
                 static_cast<GLsizeiptr>(e.cpuData.size()),
                 e.cpuData.empty() ? nullptr : e.cpuData.data(),
                 GL_DYNAMIC_DRAW);
    uploaded += e.cpuData.size();
    e.dirty = false;
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return uploaded;
}

GLuint GpuBufferManager::getGlBuffer(MeshBuffer slot) const {
  auto it = entries_.find(slot);
  if (it == entries_.end()) return 0;
  return it->second.vbo;
}

std::uint32_t GpuBufferManager::activeBuffers() const {
  std::uint32_t n = 0;
  for (const auto& [slot, e] : entries_) {
    if (e.vbo) n++;
  }
  return n;
}

} // namespace fv
