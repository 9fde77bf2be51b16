#include "pc/scene/ResourceRegistry.hpp"
#include <algorithm>

namespace pc {

Id ResourceRegistry::allocate(ResourceKind kind) {
  for (;;) {
    Id id = next_++;
    if (id == kInvalidId) continue;
    if (kinds_.count(id)) continue;
    kinds_[id] = kind;
    return id;
  }
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  auto [it, inserted] = kinds_.emplace(id, kind);
  return inserted;
}

bool ResourceRegistry::exists(Id id) const {
  return kinds_.count(id) != 0;
}

bool ResourceRegistry::kindOf(Id id, ResourceKind& out) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return false;
  out = it->second;
  return true;
}

bool ResourceRegistry::release(Id id) {
  return kinds_.erase(id) > 0;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  for (auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace pc
