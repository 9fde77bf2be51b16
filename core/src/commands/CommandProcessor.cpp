#include "pc/commands/CommandProcessor.hpp"

#include "pc/pipelines/PipelineCatalog.hpp"
#include "pc/scene/Geometry.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace pc {

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

CmdResult CommandProcessor::okResult(Id createdId) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (v && v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) {
    try {
      return parseIdString(v->GetString());
    } catch (const std::runtime_error&) {
      return 0;
    }
  }
  return 0;
}

float CommandProcessor::getFloatOr(const rapidjson::Value& obj, const char* key, float fallback) {
  const auto* v = getMember(obj, key);
  if (v && v->IsNumber()) return static_cast<float>(v->GetDouble());
  return fallback;
}

static std::string idDetails(const char* field, Id id) {
  return std::string(R"({")") + field + R"(":)" + std::to_string(id) + "}";
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "hello") return cmdHello(obj);
  if (cmd == "beginFrame") return cmdBeginFrame(obj);
  if (cmd == "commitFrame") return cmdCommitFrame(obj);

  if (cmd == "createPane") return cmdCreatePane(obj);
  if (cmd == "createLayer") return cmdCreateLayer(obj);
  if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
  if (cmd == "delete") return cmdDelete(obj);

  if (cmd == "createBuffer") return cmdCreateBuffer(obj);
  if (cmd == "createGeometry") return cmdCreateGeometry(obj);
  if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);
  if (cmd == "setGeometryVertexCount") return cmdSetGeometryVertexCount(obj);

  if (cmd == "setDrawItemColor") return cmdSetDrawItemColor(obj);
  if (cmd == "setDrawItemStyle") return cmdSetDrawItemStyle(obj);
  if (cmd == "setDrawItemMask") return cmdSetDrawItemMask(obj);
  if (cmd == "setDrawItemTexture") return cmdSetDrawItemTexture(obj);
  if (cmd == "setPaneClearColor") return cmdSetPaneClearColor(obj);

  if (cmd == "createTransform") return cmdCreateTransform(obj);
  if (cmd == "setTransform") return cmdSetTransform(obj);
  if (cmd == "attachTransform") return cmdAttachTransform(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

Id CommandProcessor::takeId(const rapidjson::Value& obj, ResourceKind kind, bool& taken) {
  taken = false;
  Id id = getIdOrZero(obj, "id");
  if (id != 0) {
    if (!reg_.reserve(id, kind)) {
      taken = true;
      return 0;
    }
    return id;
  }
  return reg_.allocate(kind);
}

DrawItem* CommandProcessor::requireDrawItem(const rapidjson::Value& obj, const char* cmd,
                                            CmdResult& err) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = drawItemId ? scene_.getDrawItemMutable(drawItemId) : nullptr;
  if (!di) {
    err = fail("MISSING_DRAWITEM",
               std::string(cmd) + ": drawItemId does not exist",
               idDetails("drawItemId", drawItemId));
  }
  return di;
}

// -------------------- frame --------------------

CmdResult CommandProcessor::cmdHello(const rapidjson::Value&) {
  return okResult();
}

CmdResult CommandProcessor::cmdBeginFrame(const rapidjson::Value&) {
  if (inFrame_) {
    return fail("BAD_COMMAND", "beginFrame: already in frame");
  }
  inFrame_ = true;
  frameCounter_++;
  return okResult();
}

CmdResult CommandProcessor::cmdCommitFrame(const rapidjson::Value&) {
  if (!inFrame_) {
    return fail("BAD_COMMAND", "commitFrame: not in frame");
  }
  inFrame_ = false;
  return okResult();
}

// -------------------- scene graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  bool taken = false;
  const Id id = takeId(obj, ResourceKind::Pane, taken);
  if (taken) return fail("ID_TAKEN", "createPane: id already exists");

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId", idDetails("paneId", paneId));
  }

  bool taken = false;
  const Id id = takeId(obj, ResourceKind::Layer, taken);
  if (taken) return fail("ID_TAKEN", "createLayer: id already exists");

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId", idDetails("layerId", layerId));
  }

  bool taken = false;
  const Id id = takeId(obj, ResourceKind::DrawItem, taken);
  if (taken) return fail("ID_TAKEN", "createDrawItem: id already exists");

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  // pipeline + geometry bindings are set by bindDrawItem
  scene_.addDrawItem(std::move(d));
  return okResult(id);
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  ResourceKind kind;
  if (!reg_.kindOf(id, kind)) {
    return fail("NOT_FOUND", "delete: id does not exist", idDetails("id", id));
  }

  std::vector<Id> deleted;
  switch (kind) {
    case ResourceKind::Pane:      deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:     deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem:  deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:    deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry:  deleted = scene_.deleteGeometry(id); break;
    case ResourceKind::Transform: deleted = scene_.deleteTransform(id); break;
  }

  if (deleted.empty()) {
    return fail("DELETE_FAILED", "delete: failed", idDetails("id", id));
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return okResult();
}

// -------------------- buffers / geometry --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  bool taken = false;
  const Id id = takeId(obj, ResourceKind::Buffer, taken);
  if (taken) return fail("ID_TAKEN", "createBuffer: id already exists");

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(std::move(b));
  return okResult(id);
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER",
                "createGeometry: invalid vertexBufferId", idDetails("vertexBufferId", vb));
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2_Clip;
  if (const auto* f = getMember(obj, "format"); f && f->IsString()) {
    if (!parseVertexFormat(f->GetString(), fmt)) {
      return fail("UNSUPPORTED_VERTEX_FORMAT",
                  "createGeometry: unknown format",
                  R"({"supported":["pos2_clip","rect4","glyph8","disc3"]})");
    }
  }

  bool taken = false;
  const Id id = takeId(obj, ResourceKind::Geometry, taken);
  if (taken) return fail("ID_TAKEN", "createGeometry: id already exists");

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(std::move(g));
  return okResult(id);
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = geomId ? scene_.getGeometryMutable(geomId) : nullptr;
  if (!g) {
    return fail("MISSING_GEOMETRY",
                "setGeometryVertexCount: geometryId does not exist",
                idDetails("geometryId", geomId));
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }
  const std::uint32_t count = vc->GetUint();

  // Every draw item bound to this geometry must still accept the count.
  for (Id diId : scene_.drawItemIds()) {
    const DrawItem* di = scene_.getDrawItem(diId);
    if (!di || di->geometryId != geomId) continue;
    const PipelineSpec* spec = catalog_.find(di->pipeline);
    if (spec && (count % spec->vertexMultiple) != 0u) {
      return fail("VALIDATION_BAD_VERTEX_COUNT",
                  "setGeometryVertexCount: count not a multiple required by pipeline",
                  std::string(R"({"pipeline":")") + di->pipeline +
                    R"(","vertexCount":)" + std::to_string(count) + "}");
    }
  }

  g->vertexCount = count;
  return okResult();
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "bindDrawItem", err);
  if (!di) return err;

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) {
    return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");
  }

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");
  }

  DrawItem candidate = *di;
  candidate.pipeline = pipeline;
  candidate.geometryId = geomId;

  CmdResult r = validateDrawItem(candidate);
  if (!r.ok) return r;

  di->pipeline = pipeline;
  di->geometryId = geomId;
  return r;
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = catalog_.find(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY",
                "drawItem geometryId does not exist", idDetails("geometryId", di.geometryId));
  }

  if (!scene_.getBuffer(g->vertexBufferId)) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                idDetails("vertexBufferId", g->vertexBufferId));
  }

  if (g->format != spec->requiredVertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->requiredVertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  if ((g->vertexCount % spec->vertexMultiple) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                "vertexCount not a multiple required by pipeline",
                std::string(R"({"vertexCount":)") + std::to_string(g->vertexCount) + "}");
  }

  return okResult();
}

// -------------------- draw item state --------------------

CmdResult CommandProcessor::cmdSetDrawItemColor(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "setDrawItemColor", err);
  if (!di) return err;

  di->color[0] = getFloatOr(obj, "r", di->color[0]);
  di->color[1] = getFloatOr(obj, "g", di->color[1]);
  di->color[2] = getFloatOr(obj, "b", di->color[2]);
  di->color[3] = getFloatOr(obj, "a", di->color[3]);
  return okResult();
}

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "setDrawItemStyle", err);
  if (!di) return err;

  const float lw = getFloatOr(obj, "lineWidth", di->lineWidth);
  if (lw <= 0.0f) {
    return fail("BAD_COMMAND", "setDrawItemStyle: lineWidth must be > 0");
  }
  di->lineWidth = lw;
  return okResult();
}

CmdResult CommandProcessor::cmdSetDrawItemMask(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "setDrawItemMask", err);
  if (!di) return err;

  const Id maskId = getIdOrZero(obj, "maskDrawItemId");
  if (maskId == 0) {
    di->maskDrawItemId = 0;
    return okResult();
  }
  if (maskId == di->id) {
    return fail("BAD_COMMAND", "setDrawItemMask: item cannot mask itself");
  }

  DrawItem* mask = scene_.getDrawItemMutable(maskId);
  if (!mask) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemMask: maskDrawItemId does not exist",
                idDetails("maskDrawItemId", maskId));
  }
  if (mask->pipeline != "triSolid@1") {
    return fail("VALIDATION_BAD_MASK",
                "setDrawItemMask: mask must use triSolid@1",
                std::string(R"({"pipeline":")") + mask->pipeline + R"("})");
  }

  mask->isMask = true;
  di->maskDrawItemId = maskId;
  return okResult();
}

CmdResult CommandProcessor::cmdSetDrawItemTexture(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "setDrawItemTexture", err);
  if (!di) return err;

  // 0 detaches; the texture id space belongs to the TextureStore.
  di->textureId = getIdOrZero(obj, "textureId");
  return okResult();
}

CmdResult CommandProcessor::cmdSetPaneClearColor(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  Pane* p = paneId ? scene_.getPaneMutable(paneId) : nullptr;
  if (!p) {
    return fail("MISSING_PANE", "setPaneClearColor: paneId does not exist",
                idDetails("paneId", paneId));
  }
  p->hasClearColor = true;
  p->clearColor[0] = getFloatOr(obj, "r", p->clearColor[0]);
  p->clearColor[1] = getFloatOr(obj, "g", p->clearColor[1]);
  p->clearColor[2] = getFloatOr(obj, "b", p->clearColor[2]);
  p->clearColor[3] = getFloatOr(obj, "a", p->clearColor[3]);
  return okResult();
}

// -------------------- transforms --------------------

CmdResult CommandProcessor::cmdCreateTransform(const rapidjson::Value& obj) {
  bool taken = false;
  const Id id = takeId(obj, ResourceKind::Transform, taken);
  if (taken) return fail("ID_TAKEN", "createTransform: id already exists");

  Transform t;
  t.id = id;
  t.params.tx = getFloatOr(obj, "tx", 0.0f);
  t.params.ty = getFloatOr(obj, "ty", 0.0f);
  t.params.sx = getFloatOr(obj, "sx", 1.0f);
  t.params.sy = getFloatOr(obj, "sy", 1.0f);
  t.recompute();
  scene_.addTransform(t);
  return okResult(id);
}

CmdResult CommandProcessor::cmdSetTransform(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  Transform* t = id ? scene_.getTransformMutable(id) : nullptr;
  if (!t) {
    return fail("MISSING_TRANSFORM", "setTransform: id does not exist", idDetails("id", id));
  }
  t->params.tx = getFloatOr(obj, "tx", t->params.tx);
  t->params.ty = getFloatOr(obj, "ty", t->params.ty);
  t->params.sx = getFloatOr(obj, "sx", t->params.sx);
  t->params.sy = getFloatOr(obj, "sy", t->params.sy);
  t->recompute();
  return okResult();
}

CmdResult CommandProcessor::cmdAttachTransform(const rapidjson::Value& obj) {
  CmdResult err;
  DrawItem* di = requireDrawItem(obj, "attachTransform", err);
  if (!di) return err;

  const Id tid = getIdOrZero(obj, "transformId");
  if (tid != 0 && !scene_.hasTransform(tid)) {
    return fail("MISSING_TRANSFORM", "attachTransform: transformId does not exist",
                idDetails("transformId", tid));
  }
  di->transformId = tid;
  return okResult();
}

// -------------------- query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeKind = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeKind("panes", ResourceKind::Pane);
  writeKind("layers", ResourceKind::Layer);
  writeKind("drawItems", ResourceKind::DrawItem);
  writeKind("buffers", ResourceKind::Buffer);
  writeKind("geometries", ResourceKind::Geometry);
  writeKind("transforms", ResourceKind::Transform);
  w.Key("frame");
  w.Uint64(frameCounter_);
  w.Key("inFrame");
  w.Bool(inFrame_);
  w.EndObject();

  return sb.GetString();
}

} // namespace pc
