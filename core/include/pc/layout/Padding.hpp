#pragma once

namespace pc {

// Insets of the plot area inside the viewport, in pixels.
struct Padding {
  double top{0};
  double right{0};
  double bottom{0};
  double left{0};
};

// Room for the right-hand price labels when they are shown.
inline Padding paddingFor(bool showAxisLabels) {
  if (showAxisLabels) return Padding{20, 60, 30, 10};
  return Padding{10, 10, 10, 10};
}

} // namespace pc
