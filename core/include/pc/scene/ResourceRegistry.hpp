#pragma once
#include "pc/scene/Types.hpp"
#include <unordered_map>
#include <vector>

namespace pc {

// Tracks existence + kind for IDs (and generates IDs if the client doesn't provide one).
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);               // auto-id
  bool reserve(Id id, ResourceKind kind);       // client-provided id (fails if taken)

  bool exists(Id id) const;
  bool kindOf(Id id, ResourceKind& out) const;

  bool release(Id id);

  std::vector<Id> list(ResourceKind kind) const;

private:
  Id next_{1};
  std::unordered_map<Id, ResourceKind> kinds_;
};

} // namespace pc
