#include "pc/viewport/Viewport.hpp"
#include <algorithm>
#include <cmath>

namespace pc {

void Viewport::setSize(double width, double height) {
  width_ = width;
  height_ = height;
}

void Viewport::setAxis(double axisMin, double axisMax) {
  axisMin_ = axisMin;
  axisMax_ = axisMax;
}

double Viewport::axisRange() const {
  const double range = axisMax_ - axisMin_;
  return range > 0.0 ? range : 1.0;
}

double Viewport::pointSpacing() const {
  if (pointCount_ <= 1) return 0.0;
  return chartWidth() / static_cast<double>(pointCount_ - 1);
}

double Viewport::indexToX(double index) const {
  return padding_.left + index * pointSpacing();
}

double Viewport::priceToY(double price) const {
  const double h = chartHeight();
  return padding_.top + h - (price - axisMin_) * (h / axisRange());
}

int Viewport::nearestIndex(double x) const {
  if (pointCount_ == 0) return -1;
  const double spacing = pointSpacing();
  if (spacing <= 0.0) return 0;

  const double raw = std::floor((x - padding_.left) / spacing + 0.5);
  const double last = static_cast<double>(pointCount_ - 1);
  return static_cast<int>(std::min(std::max(raw, 0.0), last));
}

TransformParams Viewport::computeTransformParams() const {
  TransformParams tp;
  if (!hasArea()) return tp;
  tp.sx = static_cast<float>(2.0 / width_);
  tp.sy = static_cast<float>(-2.0 / height_);
  tp.tx = -1.0f;
  tp.ty = 1.0f;
  return tp;
}

} // namespace pc
