// Implementation of the luminance gradient field.

#include "image/edge_field.h"

#include <cmath>

namespace shapesound {

EdgeField::EdgeField(const PixelBuffer& buffer) {
  if (!buffer.isValid()) return;

  width_ = buffer.width;
  height_ = buffer.height;
  size_t count = static_cast<size_t>(width_) * static_cast<size_t>(height_);
  magnitude_.assign(count, 0.0f);
  direction_.assign(count, 0.0f);

  for (int y = 1; y < height_ - 1; ++y) {
    for (int x = 1; x < width_ - 1; ++x) {
      float center = buffer.luminance(x, y);
      float grad_x = center - buffer.luminance(x + 1, y);
      float grad_y = center - buffer.luminance(x, y + 1);
      size_t idx = index(x, y);
      magnitude_[idx] = std::sqrt(grad_x * grad_x + grad_y * grad_y);
      direction_[idx] = std::atan2(grad_y, grad_x);
    }
  }
}

}  // namespace shapesound
