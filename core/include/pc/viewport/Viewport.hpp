#pragma once
#include "pc/layout/Padding.hpp"
#include "pc/scene/Types.hpp"
#include <cstddef>

namespace pc {

// Maps (index, price) to pixels for a series laid out at equal spacing
// across the padded plot area. Pixel origin is top-left, Y grows downward.
class Viewport {
public:
  void setSize(double width, double height);
  void setPadding(const Padding& padding) { padding_ = padding; }
  void setPointCount(std::size_t n) { pointCount_ = n; }
  void setAxis(double axisMin, double axisMax);

  double width() const { return width_; }
  double height() const { return height_; }
  bool hasArea() const { return width_ > 0 && height_ > 0; }

  const Padding& padding() const { return padding_; }
  std::size_t pointCount() const { return pointCount_; }
  double axisMin() const { return axisMin_; }
  double axisMax() const { return axisMax_; }
  // Collapsed or inverted axes map with a unit range.
  double axisRange() const;

  double chartWidth() const { return width_ - padding_.left - padding_.right; }
  double chartHeight() const { return height_ - padding_.top - padding_.bottom; }
  double chartRight() const { return width_ - padding_.right; }
  double chartBottom() const { return height_ - padding_.bottom; }

  double pointSpacing() const;
  double indexToX(double index) const;
  double priceToY(double price) const;

  // Nearest data index to a cursor X, clamped to [0, n-1]; -1 with no data.
  int nearestIndex(double x) const;

  // Engine integration: pixel space -> clip space.
  TransformParams computeTransformParams() const;

private:
  double width_{0};
  double height_{0};
  Padding padding_{};
  std::size_t pointCount_{0};
  double axisMin_{0};
  double axisMax_{1};
};

} // namespace pc
