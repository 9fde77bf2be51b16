#pragma once
#include <string>

namespace pc {

// Per-chart parameters supplied by the host. Colors are hex strings; a color
// that fails to parse falls back to the theme default.
struct ChartConfig {
  std::string name{"chart"};   // pane name, the host's styling hook

  std::string lineColor{"#09090b"};
  std::string gridColor{"#f4f4f5"};
  std::string crosshairColor{"#a1a1aa"};

  bool showAxisLabels{true};
  bool showGrid{true};
  bool isLoading{false};

  // Reference values for the tooltip's implied market cap.
  bool hasCurrentMcap{false};
  double currentMcap{0};
  bool hasCurrentPrice{false};
  double currentPrice{0};

  bool utcTimestamps{false};   // tooltip time in UTC instead of local time
  double longPressDelayMs{300};
};

// Overrides the fields present in `json`; absent or mistyped fields keep
// their current values. Returns false (and leaves `out` untouched) when the
// document is not a JSON object.
bool parseChartConfigJson(const std::string& json, ChartConfig& out);

std::string serializeChartConfigJson(const ChartConfig& config);

} // namespace pc
