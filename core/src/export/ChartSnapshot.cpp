#include "pc/export/ChartSnapshot.hpp"
#include <cstdio>
#include <vector>

namespace pc {

bool writePPM(const std::string& path, const std::uint8_t* pixels,
              int width, int height, bool bottomUp) {
  if (!pixels || width <= 0 || height <= 0) {
    std::fprintf(stderr, "writePPM: empty image\n");
    return false;
  }

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "writePPM: cannot open %s\n", path.c_str());
    return false;
  }

  std::fprintf(f, "P6\n%d %d\n255\n", width, height);
  std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * 3);
  bool ok = true;
  for (int y = 0; y < height && ok; y++) {
    const int src = bottomUp ? height - 1 - y : y;
    const std::uint8_t* in = pixels + static_cast<std::size_t>(src) * width * 4;
    for (int x = 0; x < width; x++) {
      row[x * 3 + 0] = in[x * 4 + 0];
      row[x * 3 + 1] = in[x * 4 + 1];
      row[x * 3 + 2] = in[x * 4 + 2];
    }
    ok = std::fwrite(row.data(), 1, row.size(), f) == row.size();
  }

  if (std::fclose(f) != 0) ok = false;
  if (!ok) std::fprintf(stderr, "writePPM: write to %s failed\n", path.c_str());
  return ok;
}

} // namespace pc
