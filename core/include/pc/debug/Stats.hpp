#pragma once
#include <cstdint>

namespace pc {

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint32_t drawCalls = 0;
  std::uint32_t maskedDrawCalls = 0; // draws gated by a stencil mask
  std::uint32_t skippedEmpty = 0;    // items with no vertices this frame

  // Upload activity
  std::uint64_t uploadedBytesThisFrame = 0;

  // Resource counts
  std::uint32_t activeBuffers = 0;
  std::uint32_t activeTextures = 0;
};

} // namespace pc
