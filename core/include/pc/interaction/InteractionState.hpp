#pragma once

namespace pc {

// Pointer-driven chart state. -1 means "none" for every coordinate and index.
struct InteractionState {
  bool isLongPress{false};
  double crosshairX{-1};
  double crosshairY{-1};
  int selectedIndex{-1};

  bool hasSelection() const { return crosshairX >= 0 && selectedIndex >= 0; }

  void clearSelection() {
    crosshairX = -1;
    crosshairY = -1;
    selectedIndex = -1;
  }
};

} // namespace pc
