// Implementation of the PPM/PGM decoder.

#include "image/ppm_reader.h"

#include <cctype>
#include <cstdio>

namespace shapesound {

namespace {

constexpr int kMaxDimension = 16384;

/// @brief Read one whitespace-delimited unsigned header field.
/// @return -1 on malformed or missing input.
int readHeaderInt(const std::vector<uint8_t>& bytes, size_t& pos) {
  while (pos < bytes.size()) {
    if (bytes[pos] == '#') {
      while (pos < bytes.size() && bytes[pos] != '\n') ++pos;
    } else if (std::isspace(bytes[pos])) {
      ++pos;
    } else {
      break;
    }
  }

  int value = 0;
  size_t start = pos;
  while (pos < bytes.size() && std::isdigit(bytes[pos])) {
    value = value * 10 + (bytes[pos] - '0');
    if (value > 1000000) return -1;
    ++pos;
  }
  return pos == start ? -1 : value;
}

}  // namespace

PpmReadResult decodePpm(const std::vector<uint8_t>& bytes) {
  PpmReadResult result;
  if (bytes.size() < 2 || bytes[0] != 'P' || (bytes[1] != '6' && bytes[1] != '5')) {
    result.error_message = "Not a binary PPM (P6) or PGM (P5) image";
    return result;
  }
  bool is_color = bytes[1] == '6';

  size_t pos = 2;
  int width = readHeaderInt(bytes, pos);
  int height = readHeaderInt(bytes, pos);
  int maxval = readHeaderInt(bytes, pos);
  if (width <= 0 || height <= 0 || width > kMaxDimension || height > kMaxDimension) {
    result.error_message = "Invalid image dimensions";
    return result;
  }
  if (maxval <= 0 || maxval > 255) {
    result.error_message = "Unsupported maxval (only 8-bit samples are supported)";
    return result;
  }
  // Exactly one whitespace byte separates the header from the raster.
  ++pos;

  size_t channels = is_color ? 3 : 1;
  size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);
  if (pos > bytes.size() || bytes.size() - pos < pixel_count * channels) {
    result.error_message = "Truncated raster data";
    return result;
  }

  PixelBuffer& buffer = result.buffer;
  buffer.width = width;
  buffer.height = height;
  buffer.data.resize(pixel_count * 4);

  for (size_t idx = 0; idx < pixel_count; ++idx) {
    for (size_t channel = 0; channel < 3; ++channel) {
      uint32_t sample = bytes[pos + idx * channels + (is_color ? channel : 0)];
      if (maxval < 255) sample = (sample * 255 + static_cast<uint32_t>(maxval) / 2) /
                                 static_cast<uint32_t>(maxval);
      buffer.data[idx * 4 + channel] = static_cast<uint8_t>(sample > 255 ? 255 : sample);
    }
    buffer.data[idx * 4 + 3] = 255;
  }

  result.success = true;
  return result;
}

PpmReadResult readPpmFile(const std::string& path) {
  PpmReadResult result;
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) {
    result.error_message = "Cannot open " + path;
    return result;
  }

  std::vector<uint8_t> bytes;
  uint8_t chunk[4096];
  size_t read_count = 0;
  while ((read_count = std::fread(chunk, 1, sizeof(chunk), file)) > 0) {
    bytes.insert(bytes.end(), chunk, chunk + read_count);
  }
  bool read_error = std::ferror(file) != 0;
  std::fclose(file);

  if (read_error) {
    result.error_message = "Failed to read " + path;
    return result;
  }
  return decodePpm(bytes);
}

}  // namespace shapesound
