#include "pc/style/Color.hpp"
#include <cstdio>

namespace pc {

static int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& hex, float out[4]) {
  std::string s = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;

  if (s.size() == 3) {
    s = {s[0], s[0], s[1], s[1], s[2], s[2]};
  }
  if (s.size() != 6 && s.size() != 8) return false;

  float rgba[4] = {0, 0, 0, 1};
  for (std::size_t i = 0; i < s.size() / 2; i++) {
    int hi = hexNibble(s[i * 2]);
    int lo = hexNibble(s[i * 2 + 1]);
    if (hi < 0 || lo < 0) return false;
    rgba[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }

  for (int i = 0; i < 4; i++) out[i] = rgba[i];
  return true;
}

void resolveHexColor(const std::string& hex, const float fallback[4], float out[4]) {
  if (parseHexColor(hex, out)) return;
  std::fprintf(stderr, "resolveHexColor: invalid color '%s', using default\n", hex.c_str());
  for (int i = 0; i < 4; i++) out[i] = fallback[i];
}

} // namespace pc
