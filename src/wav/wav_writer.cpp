// Implementation of the PCM WAV writer.

#include "wav/wav_writer.h"

#include <cmath>
#include <cstdio>

#include "wav/byte_stream.h"

namespace shapesound {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kBitsPerSample = 16;
constexpr uint32_t kFmtChunkSize = 16;

}  // namespace

int16_t floatToPcm16(float sample) {
  if (std::isnan(sample)) return 0;
  float clamped = sample < -1.0f ? -1.0f : (sample > 1.0f ? 1.0f : sample);
  float scaled = clamped < 0.0f ? clamped * 32768.0f : clamped * 32767.0f;
  return static_cast<int16_t>(scaled);
}

void WavWriter::writeHeader(uint32_t data_size, uint16_t channels, uint32_t sample_rate) {
  uint16_t block_align = static_cast<uint16_t>(channels * (kBitsPerSample / 8));

  writeTag(data_, "RIFF");
  writeLE32(data_, 36 + data_size);
  writeTag(data_, "WAVE");

  writeTag(data_, "fmt ");
  writeLE32(data_, kFmtChunkSize);
  writeLE16(data_, kFormatPcm);
  writeLE16(data_, channels);
  writeLE32(data_, sample_rate);
  writeLE32(data_, sample_rate * block_align);
  writeLE16(data_, block_align);
  writeLE16(data_, kBitsPerSample);

  writeTag(data_, "data");
  writeLE32(data_, data_size);
}

bool WavWriter::build(const std::vector<float>& samples, uint16_t channels,
                      uint32_t sample_rate) {
  data_.clear();
  uint64_t byte_count = static_cast<uint64_t>(samples.size()) * (kBitsPerSample / 8);
  if (byte_count > kMaxWavDataBytes) return false;
  uint32_t data_size = static_cast<uint32_t>(byte_count);
  data_.reserve(kWavHeaderSize + data_size);

  writeHeader(data_size, channels, sample_rate);
  for (float sample : samples) {
    writeLE16(data_, static_cast<uint16_t>(floatToPcm16(sample)));
  }
  return true;
}

bool WavWriter::writeToFile(const std::string& path) const {
  FILE* file = std::fopen(path.c_str(), "wb");
  if (!file) {
    return false;
  }
  size_t written = std::fwrite(data_.data(), 1, data_.size(), file);
  std::fclose(file);
  return written == data_.size();
}

}  // namespace shapesound
