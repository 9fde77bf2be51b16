#pragma once
#include "pc/scene/Scene.hpp"
#include "pc/scene/ResourceRegistry.hpp"
#include "pc/ids/Id.hpp"
#include "pc/pipelines/PipelineCatalog.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace pc {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// Applies JSON scene commands ({"cmd":"createPane",...}) to a Scene.
// Bad input never throws; it comes back as a CmdResult with ok=false.
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // Snapshot of registered ids per kind, plus frame counters.
  std::string listResourcesJson() const;

  bool inFrame() const { return inFrame_; }
  std::uint64_t frameCounter() const { return frameCounter_; }

private:
  Scene& scene_;
  ResourceRegistry& reg_;
  PipelineCatalog catalog_;

  bool inFrame_{false};
  std::uint64_t frameCounter_{0};

  // ---- handlers ----
  CmdResult cmdHello(const rapidjson::Value& obj);
  CmdResult cmdBeginFrame(const rapidjson::Value& obj);
  CmdResult cmdCommitFrame(const rapidjson::Value& obj);

  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);

  CmdResult cmdSetDrawItemColor(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemMask(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemTexture(const rapidjson::Value& obj);
  CmdResult cmdSetPaneClearColor(const rapidjson::Value& obj);

  CmdResult cmdCreateTransform(const rapidjson::Value& obj);
  CmdResult cmdSetTransform(const rapidjson::Value& obj);
  CmdResult cmdAttachTransform(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static float getFloatOr(const rapidjson::Value& obj, const char* key, float fallback);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(Id createdId = 0);

  Id takeId(const rapidjson::Value& obj, ResourceKind kind, bool& taken);
  DrawItem* requireDrawItem(const rapidjson::Value& obj, const char* cmd, CmdResult& err);
  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace pc
