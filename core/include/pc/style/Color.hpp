#pragma once
#include <string>

namespace pc {

// Parse "#rgb", "#rrggbb" or "#rrggbbaa" (leading '#' optional) into RGBA
// floats in [0,1]. Leaves `out` untouched and returns false on bad input.
bool parseHexColor(const std::string& hex, float out[4]);

// Same as parseHexColor, but falls back to `fallback` and logs on bad input.
void resolveHexColor(const std::string& hex, const float fallback[4], float out[4]);

inline void setRgba(float out[4], float r, float g, float b, float a) {
  out[0] = r; out[1] = g; out[2] = b; out[3] = a;
}

} // namespace pc
