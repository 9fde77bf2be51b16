#include "pc/scene/Scene.hpp"
#include <algorithm>

namespace pc {

template <typename Map>
static auto* findIn(Map& m, Id id) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

static void eraseOrdered(std::vector<Id>& order, Id id) {
  order.erase(std::remove(order.begin(), order.end(), id), order.end());
}

bool Scene::hasPane(Id id) const      { return panes_.count(id) != 0; }
bool Scene::hasLayer(Id id) const     { return layers_.count(id) != 0; }
bool Scene::hasDrawItem(Id id) const  { return drawItems_.count(id) != 0; }
bool Scene::hasBuffer(Id id) const    { return buffers_.count(id) != 0; }
bool Scene::hasGeometry(Id id) const  { return geometries_.count(id) != 0; }
bool Scene::hasTransform(Id id) const { return transforms_.count(id) != 0; }

const Pane* Scene::getPane(Id id) const           { return findIn(panes_, id); }
const Layer* Scene::getLayer(Id id) const         { return findIn(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const   { return findIn(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const       { return findIn(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const   { return findIn(geometries_, id); }
const Transform* Scene::getTransform(Id id) const { return findIn(transforms_, id); }

Pane* Scene::getPaneMutable(Id id)           { return findIn(panes_, id); }
DrawItem* Scene::getDrawItemMutable(Id id)   { return findIn(drawItems_, id); }
Geometry* Scene::getGeometryMutable(Id id)   { return findIn(geometries_, id); }
Transform* Scene::getTransformMutable(Id id) { return findIn(transforms_, id); }

void Scene::addPane(Pane p) {
  if (!hasPane(p.id)) paneOrder_.push_back(p.id);
  panes_[p.id] = std::move(p);
}
void Scene::addLayer(Layer l) {
  if (!hasLayer(l.id)) layerOrder_.push_back(l.id);
  layers_[l.id] = std::move(l);
}
void Scene::addDrawItem(DrawItem d) {
  if (!hasDrawItem(d.id)) drawItemOrder_.push_back(d.id);
  drawItems_[d.id] = std::move(d);
}
void Scene::addBuffer(Buffer b)       { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g)   { geometries_[g.id] = std::move(g); }
void Scene::addTransform(Transform t) { transforms_[t.id] = std::move(t); }

std::vector<Id> Scene::deleteDrawItem(Id drawItemId) {
  if (drawItems_.erase(drawItemId) == 0) return {};
  eraseOrdered(drawItemOrder_, drawItemId);

  // Drop dangling mask references.
  for (auto& kv : drawItems_) {
    if (kv.second.maskDrawItemId == drawItemId) kv.second.maskDrawItemId = 0;
  }
  return {drawItemId};
}

std::vector<Id> Scene::deleteLayer(Id layerId) {
  if (!hasLayer(layerId)) return {};

  std::vector<Id> deleted;
  deleted.push_back(layerId);

  std::vector<Id> toDelete;
  for (Id id : drawItemOrder_) {
    if (drawItems_[id].layerId == layerId) toDelete.push_back(id);
  }
  for (Id id : toDelete) {
    auto sub = deleteDrawItem(id);
    deleted.insert(deleted.end(), sub.begin(), sub.end());
  }

  layers_.erase(layerId);
  eraseOrdered(layerOrder_, layerId);
  return deleted;
}

std::vector<Id> Scene::deletePane(Id paneId) {
  if (!hasPane(paneId)) return {};

  std::vector<Id> deleted;
  deleted.push_back(paneId);

  std::vector<Id> layersToDelete;
  for (Id lid : layerOrder_) {
    if (layers_[lid].paneId == paneId) layersToDelete.push_back(lid);
  }
  for (Id lid : layersToDelete) {
    auto sub = deleteLayer(lid);
    deleted.insert(deleted.end(), sub.begin(), sub.end());
  }

  panes_.erase(paneId);
  eraseOrdered(paneOrder_, paneId);
  return deleted;
}

std::vector<Id> Scene::deleteBuffer(Id bufferId) {
  if (buffers_.erase(bufferId) == 0) return {};
  return {bufferId};
}

std::vector<Id> Scene::deleteGeometry(Id geometryId) {
  if (geometries_.erase(geometryId) == 0) return {};
  return {geometryId};
}

std::vector<Id> Scene::deleteTransform(Id transformId) {
  if (transforms_.erase(transformId) == 0) return {};
  for (auto& kv : drawItems_) {
    if (kv.second.transformId == transformId) kv.second.transformId = 0;
  }
  return {transformId};
}

std::vector<Id> Scene::bufferIds() const {
  std::vector<Id> out;
  out.reserve(buffers_.size());
  for (auto& kv : buffers_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Id> Scene::geometryIds() const {
  std::vector<Id> out;
  out.reserve(geometries_.size());
  for (auto& kv : geometries_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace pc
