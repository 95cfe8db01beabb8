// RGBA pixel buffer and the luminance/downsampling primitives built on it.

#ifndef SHAPESOUND_IMAGE_PIXEL_BUFFER_H
#define SHAPESOUND_IMAGE_PIXEL_BUFFER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shapesound {

/// @brief Flat row-major RGBA image (4 bytes per pixel).
struct PixelBuffer {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  /// @brief True when dimensions are positive and data holds width*height*4 bytes.
  bool isValid() const;

  /// @brief Byte offset of pixel (x, y).
  size_t offset(int x, int y) const {
    return (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
  }

  uint8_t red(int x, int y) const { return data[offset(x, y)]; }
  uint8_t green(int x, int y) const { return data[offset(x, y) + 1]; }
  uint8_t blue(int x, int y) const { return data[offset(x, y) + 2]; }

  /// @brief Mean of R, G and B at (x, y), in 0..255.
  float luminance(int x, int y) const;
};

/// @brief Create a buffer filled with one opaque color.
PixelBuffer makeSolidBuffer(int width, int height, uint8_t red, uint8_t green, uint8_t blue);

/// @brief Box-downsample by an integer factor.
///
/// Output size is floor(size / factor) per axis. Each output pixel is the
/// average of the source pixels in its cell; cells clipped by the source
/// border average only the pixels that exist.
///
/// @param source Valid source buffer.
/// @param factor Downsampling factor (>= 1; 1 returns a copy).
/// @return Downsampled buffer; empty when either output dimension is 0.
PixelBuffer downsample(const PixelBuffer& source, int factor);

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_PIXEL_BUFFER_H
