// Unified generator: image analysis, parameter mapping and scheduling in one call.

#ifndef SHAPESOUND_GENERATOR_H
#define SHAPESOUND_GENERATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "image/feature_extractor.h"
#include "image/pixel_buffer.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// @brief Unified configuration for one generate action.
struct GeneratorConfig {
  SamplingMethod sampling = SamplingMethod::Brightness;
  SynthMode mode = SynthMode::V2;
  double duration = 5.0;   ///< Session length in seconds.
  float volume = 0.5f;     ///< Master volume, clamped to [0,1].
  uint32_t seed = 0;       ///< 0 = auto (random).
  uint32_t sample_rate = kDefaultSampleRate;
  uint16_t channels = kDefaultChannels;
};

/// @brief Result from unified generation.
struct GeneratorResult {
  AnalysisRecord record;
  SynthesisSession session;
  bool success = false;
  uint32_t seed_used = 0;
  std::string error_message;
};

/// @brief Analyze `pixels` and schedule the matching performance.
///
/// The seed (auto-selected when config.seed is 0) drives both the edges
/// sampling padding and every noise layer of the session.
///
/// @param pixels RGBA image.
/// @param config Generation configuration.
/// @return GeneratorResult with the analysis record and the session.
GeneratorResult generate(const PixelBuffer& pixels, const GeneratorConfig& config);

/// @brief WAV bytes rendered from a generated session.
struct WavExportResult {
  std::vector<uint8_t> bytes;
  bool success = false;
  std::string error_message;
};

/// @brief Render the session offline and encode it as 16-bit PCM WAV.
/// @param result A successful GeneratorResult.
/// @param config Configuration supplying sample rate and channel count.
WavExportResult exportWav(const GeneratorResult& result, const GeneratorConfig& config);

/// @brief Build events JSON from GeneratorResult.
/// @param result Generation result with the session.
/// @param config Generator configuration used for generation.
/// @return JSON string with session settings and every event.
std::string buildEventsJson(const GeneratorResult& result, const GeneratorConfig& config);

/// @brief Build analysis JSON (scalars, segments, histograms, angularity metrics).
std::string buildAnalysisJson(const AnalysisRecord& record);

}  // namespace shapesound

#endif  // SHAPESOUND_GENERATOR_H
