// RIFF/WAVE writer: 16-bit PCM from interleaved float samples.

#ifndef SHAPESOUND_WAV_WAV_WRITER_H
#define SHAPESOUND_WAV_WAV_WRITER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace shapesound {

/// Size of the canonical PCM WAV header.
constexpr size_t kWavHeaderSize = 44;

/// Largest data chunk a RIFF size field can describe.
constexpr uint64_t kMaxWavDataBytes = 0xFFFFFFFFull - (kWavHeaderSize - 8);

/// @brief Writer producing canonical 44-byte-header PCM WAV data.
class WavWriter {
 public:
  WavWriter() = default;

  /// @brief Build WAV data from interleaved samples.
  ///
  /// Samples are clamped to [-1, 1]; negative values scale by 0x8000 and
  /// positive values by 0x7FFF, truncated toward zero.
  ///
  /// @param samples Interleaved float samples (frames * channels).
  /// @param channels Channel count.
  /// @param sample_rate Sample rate in Hz.
  /// @return False (and no data) when the PCM data exceeds kMaxWavDataBytes.
  bool build(const std::vector<float>& samples, uint16_t channels, uint32_t sample_rate);

  /// @brief Get the binary WAV data after build().
  std::vector<uint8_t> toBytes() const { return data_; }

  /// @brief Write built WAV data to a file.
  /// @return True if the file was written successfully.
  bool writeToFile(const std::string& path) const;

 private:
  std::vector<uint8_t> data_;

  /// Write the RIFF, fmt and data chunk headers.
  void writeHeader(uint32_t data_size, uint16_t channels, uint32_t sample_rate);
};

/// @brief Convert one float sample to signed 16-bit PCM.
int16_t floatToPcm16(float sample);

}  // namespace shapesound

#endif  // SHAPESOUND_WAV_WAV_WRITER_H
