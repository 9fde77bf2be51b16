#include "pc/style/Theme.hpp"
#include "pc/style/Color.hpp"

namespace pc {

static void rgb8(float out[4], int r, int g, int b) {
  setRgba(out, r / 255.0f, g / 255.0f, b / 255.0f, 1.0f);
}

ChartTheme defaultChartTheme() {
  ChartTheme t;
  rgb8(t.lineColor, 0x09, 0x09, 0x0b);
  rgb8(t.gridColor, 0xf4, 0xf4, 0xf5);
  rgb8(t.crosshairColor, 0xa1, 0xa1, 0xaa);
  rgb8(t.markerUp, 0x22, 0xc5, 0x5e);
  rgb8(t.markerDown, 0xef, 0x44, 0x44);
  rgb8(t.labelColor, 0x71, 0x71, 0x7a);
  rgb8(t.valueColor, 0x09, 0x09, 0x0b);
  rgb8(t.tooltipBorder, 0xe5, 0xe5, 0xe5);
  rgb8(t.loadingInk, 0x52, 0x52, 0x52);
  return t;
}

} // namespace pc
