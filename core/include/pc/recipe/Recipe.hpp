#pragma once
#include "pc/ids/Id.hpp"
#include "pc/scene/Geometry.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pc {

// A single JSON command string to be applied via CommandProcessor.
using CmdString = std::string;

// Result of building a recipe: the commands to create and dispose it.
struct RecipeBuildResult {
  std::vector<CmdString> createCommands;
  std::vector<CmdString> disposeCommands;
};

// One buffer -> geometry -> drawItem chain.
struct DrawSlot {
  Id bufferId{0};
  Id geometryId{0};
  Id drawItemId{0};
  VertexFormat format{VertexFormat::Pos2_Clip};
};

// Per-frame contents of one slot: packed floats and the vertex (or
// instance) count they hold.
struct VertexData {
  std::vector<float> values;
  std::uint32_t count{0};

  void clear() { values.clear(); count = 0; }
};

// Base class for all recipes. A recipe translates a declarative description
// into engine commands using deterministic ID allocation (idBase + offset),
// and computes the vertex data of its slots each frame.
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual RecipeBuildResult build() const = 0;

  virtual std::vector<DrawSlot> slots() const = 0;

  std::vector<Id> drawItemIds() const;

protected:
  Id idBase_;

  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }

  // Slot occupying offsets [first, first+2].
  DrawSlot slotAt(std::uint32_t first, VertexFormat format) const {
    return {rid(first), rid(first + 1), rid(first + 2), format};
  }

  static void addSlot(RecipeBuildResult& out, const DrawSlot& slot, Id layerId,
                      const std::string& name, const char* pipeline, Id transformId);
  static void addDispose(RecipeBuildResult& out, const std::vector<DrawSlot>& slots);

public:
  static CmdString colorCommand(Id drawItemId, const float rgba[4]);
  static CmdString lineWidthCommand(Id drawItemId, float lineWidth);
  static CmdString vertexCountCommand(Id geometryId, std::uint32_t count);
};

} // namespace pc
