#pragma once

namespace pc {

// Fixed palette of the chart. Line, grid and crosshair colors are per-chart
// parameters (ChartConfig); these are their fallbacks.
struct ChartTheme {
  float backgroundColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};

  float lineColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float gridColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float crosshairColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  float markerUp[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  float markerDown[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  // Text
  float labelColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};   // axis labels, tooltip timestamp / mcap, placeholder
  float valueColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};   // tooltip price

  // Tooltip box
  float tooltipFill[4] = {1.0f, 1.0f, 1.0f, 0.97f};
  float tooltipBorder[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  // Loading overlay
  float loadingVeil[4] = {1.0f, 1.0f, 1.0f, 0.6f};
  float loadingPill[4] = {1.0f, 1.0f, 1.0f, 0.9f};
  float loadingInk[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  float highlightOuterAlpha{0.25f};
};

ChartTheme defaultChartTheme();

} // namespace pc
