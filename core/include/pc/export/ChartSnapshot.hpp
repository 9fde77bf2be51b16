#pragma once
#include <cstdint>
#include <string>

namespace pc {

// Binary PPM (P6) of RGBA pixels, alpha dropped. `bottomUp` takes rows in
// GL readback order (last row first) and writes them top row first.
bool writePPM(const std::string& path, const std::uint8_t* pixels,
              int width, int height, bool bottomUp = false);

} // namespace pc
