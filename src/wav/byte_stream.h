// Helpers for reading/writing little-endian integers in RIFF data.

#ifndef SHAPESOUND_WAV_BYTE_STREAM_H
#define SHAPESOUND_WAV_BYTE_STREAM_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shapesound {

/// @brief Append a 4-character chunk tag (e.g. "RIFF").
void writeTag(std::vector<uint8_t>& buf, const char* tag);

/// @brief Write a little-endian uint16 to a byte buffer.
/// @param buf Destination buffer (2 bytes appended).
/// @param value The 16-bit value.
void writeLE16(std::vector<uint8_t>& buf, uint16_t value);

/// @brief Write a little-endian uint32 to a byte buffer.
/// @param buf Destination buffer (4 bytes appended).
/// @param value The 32-bit value.
void writeLE32(std::vector<uint8_t>& buf, uint32_t value);

/// @brief Read a little-endian uint16 from raw data at a given offset.
uint16_t readLE16(const uint8_t* data, size_t offset);

/// @brief Read a little-endian uint32 from raw data at a given offset.
uint32_t readLE32(const uint8_t* data, size_t offset);

}  // namespace shapesound

#endif  // SHAPESOUND_WAV_BYTE_STREAM_H
