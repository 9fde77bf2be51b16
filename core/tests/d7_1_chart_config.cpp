// D7.1 - Chart configuration JSON and color parsing

#include "pc/chart/ChartConfig.hpp"
#include "pc/style/Color.hpp"
#include "pc/style/Theme.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool near(float a, float b) {
  return std::fabs(a - b) < 1e-3f;
}

int main() {
  // --- hex colors ---
  {
    float c[4];
    requireTrue(pc::parseHexColor("#09090b", c), "#rrggbb");
    requireTrue(near(c[0], 9 / 255.0f) && near(c[2], 11 / 255.0f) && c[3] == 1.0f, "values");
    requireTrue(pc::parseHexColor("fff", c) && c[0] == 1.0f, "#rgb without hash");
    requireTrue(pc::parseHexColor("#ff000080", c) && near(c[3], 128 / 255.0f), "#rrggbbaa");

    float keep[4] = {0.1f, 0.2f, 0.3f, 0.4f};
    requireTrue(!pc::parseHexColor("#12345", keep), "bad length");
    requireTrue(!pc::parseHexColor("#zzzzzz", keep), "bad digits");
    requireTrue(keep[0] == 0.1f && keep[3] == 0.4f, "untouched on failure");

    const float fallback[4] = {0.5f, 0.5f, 0.5f, 1.0f};
    float out[4];
    pc::resolveHexColor("nope", fallback, out);
    requireTrue(out[0] == 0.5f, "fallback on bad input");
  }

  // --- defaults ---
  pc::ChartConfig def;
  requireTrue(def.lineColor == "#09090b" && def.gridColor == "#f4f4f5" &&
              def.crosshairColor == "#a1a1aa", "default colors");
  requireTrue(def.showAxisLabels && def.showGrid && !def.isLoading, "default flags");
  requireTrue(!def.hasCurrentMcap && !def.hasCurrentPrice, "no reference values");
  requireTrue(def.longPressDelayMs == 300, "300ms long-press");

  {
    pc::ChartTheme t = pc::defaultChartTheme();
    requireTrue(t.backgroundColor[0] == 1.0f && t.backgroundColor[3] == 1.0f,
                "white background");
    requireTrue(t.highlightOuterAlpha > 0.2f && t.highlightOuterAlpha < 0.3f,
                "translucent highlight ring");
  }

  // --- partial override ---
  pc::ChartConfig cfg;
  requireTrue(pc::parseChartConfigJson(
    R"({"lineColor":"#22c55e","showGrid":false,"currentMcap":2500000,"currentPrice":0.5,
        "name":"btc","longPressDelayMs":450,"utcTimestamps":true})", cfg), "parse");
  requireTrue(cfg.lineColor == "#22c55e" && !cfg.showGrid, "overrides applied");
  requireTrue(cfg.gridColor == "#f4f4f5" && cfg.showAxisLabels, "absent fields kept");
  requireTrue(cfg.hasCurrentMcap && cfg.currentMcap == 2500000, "mcap set");
  requireTrue(cfg.hasCurrentPrice && cfg.currentPrice == 0.5, "price set");
  requireTrue(cfg.name == "btc" && cfg.longPressDelayMs == 450 && cfg.utcTimestamps, "misc");

  // --- mistyped fields ignored, null clears optionals ---
  requireTrue(pc::parseChartConfigJson(
    R"({"showGrid":"yes","currentMcap":null,"lineColor":7})", cfg), "parse 2");
  requireTrue(!cfg.showGrid, "mistyped bool ignored");
  requireTrue(cfg.lineColor == "#22c55e", "mistyped string ignored");
  requireTrue(!cfg.hasCurrentMcap && cfg.hasCurrentPrice, "null clears only mcap");

  // --- not an object: rejected, untouched ---
  pc::ChartConfig before = cfg;
  requireTrue(!pc::parseChartConfigJson("[1,2]", cfg), "array rejected");
  requireTrue(!pc::parseChartConfigJson("{broken", cfg), "garbage rejected");
  requireTrue(cfg.lineColor == before.lineColor && cfg.name == before.name, "untouched");

  // --- serialize / parse back ---
  std::string json = pc::serializeChartConfigJson(cfg);
  requireTrue(json.find("\"currentMcap\":null") != std::string::npos, "null mcap serialized");
  pc::ChartConfig back;
  requireTrue(pc::parseChartConfigJson(json, back), "reparse");
  requireTrue(back.lineColor == cfg.lineColor && back.showGrid == cfg.showGrid &&
              back.hasCurrentMcap == cfg.hasCurrentMcap &&
              back.currentPrice == cfg.currentPrice &&
              back.longPressDelayMs == cfg.longPressDelayMs, "fields survive");

  std::printf("D7.1 chart config PASS\n");
  return 0;
}
