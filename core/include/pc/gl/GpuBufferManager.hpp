#pragma once
#include "pc/ids/Id.hpp"
#include <glad/gl.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace pc {

// CPU staging copies of scene buffers and their GL VBOs.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Store CPU-side bytes for a buffer ID and mark it dirty.
  void setCpuData(Id bufferId, const void* data, std::uint32_t bytes);

  // Upload any dirty buffers to GL VBOs. Returns total bytes uploaded.
  std::uint64_t uploadDirty();

  // Get the GL buffer name for a given ID (0 if not uploaded yet).
  GLuint getGlBuffer(Id bufferId) const;

  void release(Id bufferId);
  void releaseAll();

  std::uint32_t activeCount() const { return static_cast<std::uint32_t>(entries_.size()); }

private:
  struct Entry {
    std::vector<std::uint8_t> cpuData;
    GLuint vbo{0};
    bool dirty{false};
  };
  std::unordered_map<Id, Entry> entries_;
};

} // namespace pc
