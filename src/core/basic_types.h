// Basic types shared by the image analysis and synthesis halves.

#ifndef SHAPESOUND_CORE_BASIC_TYPES_H
#define SHAPESOUND_CORE_BASIC_TYPES_H

#include <cstdint>
#include <optional>
#include <string>

namespace shapesound {

/// Default rendering sample rate (Hz).
constexpr uint32_t kDefaultSampleRate = 44100;

/// Default output channel count (stereo).
constexpr uint16_t kDefaultChannels = 2;

/// Number of spatial samples every sampling strategy produces.
constexpr int kSegmentCount = 16;

/// Angularity midpoint separating Bouba (<=) from Kiki (>).
constexpr float kModeMidpoint = 0.5f;

// ---------------------------------------------------------------------------
// Selectors
// ---------------------------------------------------------------------------

/// @brief Spatial sampling strategy used to build segment data.
enum class SamplingMethod : uint8_t {
  Brightness = 0,  ///< Greedy brightness pathfinding.
  Edges = 1,       ///< Strongest-gradient picks.
  Scattered = 2,   ///< Fixed hand-authored 16-point pattern.
  Regions = 3      ///< 4x4 grid cell averages.
};

/// @brief Parameter mapping design.
enum class SynthMode : uint8_t {
  Legacy = 0,  ///< Discrete: hard switch at angularity 0.5.
  V2 = 1       ///< Continuous: parameters interpolated by intensity.
};

/// @brief Performance chosen from angularity.
enum class PerformanceMode : uint8_t {
  Bouba = 0,  ///< Sustained, round.
  Kiki = 1    ///< Percussive, angular.
};

// ---------------------------------------------------------------------------
// Synthesis vocabulary
// ---------------------------------------------------------------------------

/// @brief Oscillator waveform.
enum class Waveform : uint8_t { Sine, Square, Sawtooth, Triangle };

/// @brief Biquad filter type (None bypasses the filter stage).
enum class FilterType : uint8_t { None, Lowpass, Highpass };

/// @brief How an automation breakpoint is approached from the previous one.
enum class RampType : uint8_t {
  Set,         ///< Jump to the value at the breakpoint time.
  Linear,      ///< Linear ramp from the previous breakpoint.
  Exponential  ///< Exponential ramp from the previous breakpoint.
};

/// @brief Sound source of a synthesis event.
enum class EventKind : uint8_t {
  Oscillator,  ///< Single periodic oscillator.
  NoiseBurst,  ///< Shaped white-noise burst.
  FmPair       ///< Carrier with a frequency-modulating partner.
};

/// @brief Scheduler phase that emitted an event. Emission order follows
/// the enumerator order.
enum class SynthPhase : uint8_t { Bass, Melody, Percussion, Pad };

// ---------------------------------------------------------------------------
// Enum <-> string conversion
// ---------------------------------------------------------------------------

const char* samplingMethodToString(SamplingMethod method);
const char* synthModeToString(SynthMode mode);
const char* performanceModeToString(PerformanceMode mode);
const char* waveformToString(Waveform waveform);
const char* filterTypeToString(FilterType type);
const char* rampTypeToString(RampType ramp);
const char* eventKindToString(EventKind kind);
const char* synthPhaseToString(SynthPhase phase);

/// @brief Parse a sampling method name.
/// @param str "brightness", "edges", "scattered" (alias "random") or "regions".
/// @return Parsed method, or std::nullopt for an unknown name.
std::optional<SamplingMethod> samplingMethodFromString(const std::string& str);

/// @brief Parse a synthesis mode name.
/// @param str "legacy" (alias "discrete") or "v2" (alias "continuous").
/// @return Parsed mode, or std::nullopt for an unknown name.
std::optional<SynthMode> synthModeFromString(const std::string& str);

}  // namespace shapesound

#endif  // SHAPESOUND_CORE_BASIC_TYPES_H
