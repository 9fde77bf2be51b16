#include "pc/chart/ChartConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace pc {

namespace {

void readString(const rapidjson::Value& obj, const char* key, std::string& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsString()) out = it->value.GetString();
}

void readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsBool()) out = it->value.GetBool();
}

void readDouble(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it != obj.MemberEnd() && it->value.IsNumber()) out = it->value.GetDouble();
}

// Optional reference value: a number sets it, null clears it.
void readOptional(const rapidjson::Value& obj, const char* key, bool& has, double& value) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return;
  if (it->value.IsNumber()) {
    has = true;
    value = it->value.GetDouble();
  } else if (it->value.IsNull()) {
    has = false;
    value = 0;
  }
}

} // namespace

bool parseChartConfigJson(const std::string& json, ChartConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "parseChartConfigJson: not a JSON object\n");
    return false;
  }

  ChartConfig c = out;
  readString(doc, "name", c.name);
  readString(doc, "lineColor", c.lineColor);
  readString(doc, "gridColor", c.gridColor);
  readString(doc, "crosshairColor", c.crosshairColor);
  readBool(doc, "showAxisLabels", c.showAxisLabels);
  readBool(doc, "showGrid", c.showGrid);
  readBool(doc, "isLoading", c.isLoading);
  readOptional(doc, "currentMcap", c.hasCurrentMcap, c.currentMcap);
  readOptional(doc, "currentPrice", c.hasCurrentPrice, c.currentPrice);
  readBool(doc, "utcTimestamps", c.utcTimestamps);
  readDouble(doc, "longPressDelayMs", c.longPressDelayMs);

  out = c;
  return true;
}

std::string serializeChartConfigJson(const ChartConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("name", rapidjson::Value(config.name.c_str(), alloc), alloc);
  doc.AddMember("lineColor", rapidjson::Value(config.lineColor.c_str(), alloc), alloc);
  doc.AddMember("gridColor", rapidjson::Value(config.gridColor.c_str(), alloc), alloc);
  doc.AddMember("crosshairColor",
                rapidjson::Value(config.crosshairColor.c_str(), alloc), alloc);
  doc.AddMember("showAxisLabels", config.showAxisLabels, alloc);
  doc.AddMember("showGrid", config.showGrid, alloc);
  doc.AddMember("isLoading", config.isLoading, alloc);

  rapidjson::Value mcap;
  if (config.hasCurrentMcap) mcap.SetDouble(config.currentMcap);
  doc.AddMember("currentMcap", mcap, alloc);
  rapidjson::Value price;
  if (config.hasCurrentPrice) price.SetDouble(config.currentPrice);
  doc.AddMember("currentPrice", price, alloc);

  doc.AddMember("utcTimestamps", config.utcTimestamps, alloc);
  doc.AddMember("longPressDelayMs", config.longPressDelayMs, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

} // namespace pc
