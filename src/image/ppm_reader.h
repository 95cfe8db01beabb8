// Binary PPM (P6) / PGM (P5) decoding into an RGBA pixel buffer.

#ifndef SHAPESOUND_IMAGE_PPM_READER_H
#define SHAPESOUND_IMAGE_PPM_READER_H

#include <cstdint>
#include <string>
#include <vector>

#include "image/pixel_buffer.h"

namespace shapesound {

/// @brief Result of decoding a PPM/PGM image.
struct PpmReadResult {
  PixelBuffer buffer;
  bool success = false;
  std::string error_message;
};

/// @brief Decode P6 (RGB) or P5 (grayscale) bytes with maxval <= 255.
///
/// Header comments ('#' to end of line) are skipped. Samples are rescaled
/// to 0..255 when maxval < 255; alpha is set to 255.
PpmReadResult decodePpm(const std::vector<uint8_t>& bytes);

/// @brief Read and decode a PPM/PGM file.
PpmReadResult readPpmFile(const std::string& path);

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_PPM_READER_H
