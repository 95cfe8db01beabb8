// Brightness gradient field (magnitude and direction) over a pixel buffer.

#ifndef SHAPESOUND_IMAGE_EDGE_FIELD_H
#define SHAPESOUND_IMAGE_EDGE_FIELD_H

#include <cstddef>
#include <vector>

#include "image/pixel_buffer.h"

namespace shapesound {

/// @brief Per-pixel forward-difference gradient of luminance.
///
/// Only interior pixels (1 <= x < width-1, 1 <= y < height-1) are valid;
/// border pixels hold magnitude 0 and must be skipped by every consumer.
class EdgeField {
 public:
  EdgeField() = default;

  /// @brief Build the gradient field of `buffer`.
  ///
  /// gx = L(x,y) - L(x+1,y), gy = L(x,y) - L(x,y+1),
  /// magnitude = sqrt(gx^2 + gy^2), direction = atan2(gy, gx).
  /// Buffers smaller than 3x3 produce a field with no valid pixel.
  explicit EdgeField(const PixelBuffer& buffer);

  int width() const { return width_; }
  int height() const { return height_; }

  /// @brief True for interior pixels.
  bool isValid(int x, int y) const {
    return x >= 1 && y >= 1 && x < width_ - 1 && y < height_ - 1;
  }

  float magnitude(int x, int y) const { return magnitude_[index(x, y)]; }

  /// @brief Gradient direction in radians (-pi..pi).
  float direction(int x, int y) const { return direction_[index(x, y)]; }

  /// @brief True if (x, y) is valid and its magnitude exceeds `threshold`.
  bool isEdge(int x, int y, float threshold) const {
    return isValid(x, y) && magnitude_[index(x, y)] > threshold;
  }

 private:
  size_t index(int x, int y) const {
    return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
  }

  int width_ = 0;
  int height_ = 0;
  std::vector<float> magnitude_;
  std::vector<float> direction_;
};

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_EDGE_FIELD_H
