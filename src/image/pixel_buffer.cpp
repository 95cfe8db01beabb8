// Implementation of the RGBA pixel buffer helpers.

#include "image/pixel_buffer.h"

namespace shapesound {

bool PixelBuffer::isValid() const {
  if (width <= 0 || height <= 0) return false;
  return data.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
}

float PixelBuffer::luminance(int x, int y) const {
  size_t idx = offset(x, y);
  return (static_cast<float>(data[idx]) + static_cast<float>(data[idx + 1]) +
          static_cast<float>(data[idx + 2])) / 3.0f;
}

PixelBuffer makeSolidBuffer(int width, int height, uint8_t red, uint8_t green, uint8_t blue) {
  PixelBuffer buffer;
  buffer.width = width;
  buffer.height = height;
  buffer.data.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);
  for (size_t idx = 0; idx < buffer.data.size(); idx += 4) {
    buffer.data[idx] = red;
    buffer.data[idx + 1] = green;
    buffer.data[idx + 2] = blue;
    buffer.data[idx + 3] = 255;
  }
  return buffer;
}

PixelBuffer downsample(const PixelBuffer& source, int factor) {
  if (factor <= 1) return source;

  PixelBuffer result;
  int out_width = source.width / factor;
  int out_height = source.height / factor;
  if (out_width <= 0 || out_height <= 0) return result;

  result.width = out_width;
  result.height = out_height;
  result.data.assign(static_cast<size_t>(out_width) * static_cast<size_t>(out_height) * 4, 0);

  for (int out_y = 0; out_y < out_height; ++out_y) {
    for (int out_x = 0; out_x < out_width; ++out_x) {
      uint32_t sum[4] = {0, 0, 0, 0};
      uint32_t count = 0;

      for (int dy = 0; dy < factor; ++dy) {
        int src_y = out_y * factor + dy;
        if (src_y >= source.height) break;
        for (int dx = 0; dx < factor; ++dx) {
          int src_x = out_x * factor + dx;
          if (src_x >= source.width) break;
          size_t src_idx = source.offset(src_x, src_y);
          for (int channel = 0; channel < 4; ++channel) {
            sum[channel] += source.data[src_idx + static_cast<size_t>(channel)];
          }
          ++count;
        }
      }

      if (count == 0) continue;
      // Rounded to nearest, as an 8-bit clamped store does.
      size_t dst_idx = result.offset(out_x, out_y);
      for (int channel = 0; channel < 4; ++channel) {
        result.data[dst_idx + static_cast<size_t>(channel)] =
            static_cast<uint8_t>((sum[channel] + count / 2) / count);
      }
    }
  }

  return result;
}

}  // namespace shapesound
