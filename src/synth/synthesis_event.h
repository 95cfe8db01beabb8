// Timed synthesis events: the complete, pre-computed output of the scheduler.

#ifndef SHAPESOUND_SYNTH_SYNTHESIS_EVENT_H
#define SHAPESOUND_SYNTH_SYNTHESIS_EVENT_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace shapesound {

/// @brief One automation breakpoint. `offset` is seconds from event start.
struct AutomationPoint {
  double offset = 0.0;
  float value = 0.0f;
  RampType ramp = RampType::Set;
};

/// @brief Breakpoint automation of one parameter.
///
/// The parameter starts at `initial` and follows `points` in order. Ramps
/// run from the previous breakpoint (or from offset 0 and `initial`) to the
/// breakpoint. An exponential ramp whose ends are not both positive holds
/// the previous value until the breakpoint. The last value holds afterwards.
struct AutomationProgram {
  float initial = 0.0f;
  std::vector<AutomationPoint> points;

  /// @brief Constant program.
  static AutomationProgram constant(float value);

  AutomationProgram& setAt(double offset, float value);
  AutomationProgram& linearTo(double offset, float value);
  AutomationProgram& exponentialTo(double offset, float value);

  /// @brief Parameter value at `offset` seconds after event start.
  float valueAt(double offset) const;

  /// @brief Offset of the last breakpoint (0 when there is none).
  double lastOffset() const;
};

/// @brief Low-frequency sine modulation added to a voice's frequency.
struct VibratoSpec {
  bool enabled = false;
  float rate = 0.0f;          ///< Hz.
  AutomationProgram depth;    ///< Peak deviation in Hz.
};

/// @brief Frequency-modulating partner of an FM pair.
///
/// The modulator runs at base * ratio, where base is the carrier's
/// initial frequency; its deviation is base * index Hz.
struct FmSpec {
  float ratio = 1.0f;
  float index = 0.0f;
};

/// @brief Biquad filter applied to the voice source (not to its noise layer).
struct FilterSpec {
  FilterType type = FilterType::None;
  float cutoff = 1000.0f;
  float q = 1.0f;
};

/// @brief Seeded white noise mixed into a voice ahead of its envelope.
///
/// Samples are uniform in [-1, 1] scaled by amount * 0.5, then by `gain`.
struct NoiseLayer {
  bool enabled = false;
  float amount = 0.0f;
  float gain = 0.0f;
  double duration = 0.0;
  uint32_t seed = 0;
};

/// @brief Exponentially shaped white-noise burst (percussion source).
struct NoiseBurstSpec {
  double length = 0.0;   ///< Seconds.
  float decay = 0.05f;   ///< Fraction of the burst length per e-fold.
  uint32_t seed = 0;
};

/// @brief One scheduled sound. Immutable once placed in a session.
struct SynthesisEvent {
  EventKind kind = EventKind::Oscillator;
  SynthPhase phase = SynthPhase::Melody;
  double start_time = 0.0;
  double duration = 0.0;       ///< Source stops at start_time + duration.
  Waveform waveform = Waveform::Sine;
  AutomationProgram frequency;
  VibratoSpec vibrato;
  FmSpec fm;                   ///< Used when kind == FmPair.
  NoiseBurstSpec burst;        ///< Used when kind == NoiseBurst.
  AutomationProgram envelope;  ///< Voice gain.
  FilterSpec filter;
  NoiseLayer noise;
};

/// @brief Ordered events of one performance plus its global settings.
struct SynthesisSession {
  std::vector<SynthesisEvent> events;
  double total_duration = 0.0;
  float master_volume = 0.5f;
  PerformanceMode performance = PerformanceMode::Bouba;
  SynthMode mode = SynthMode::V2;
  float intensity = 0.0f;
  uint32_t seed = 0;
};

}  // namespace shapesound

#endif  // SHAPESOUND_SYNTH_SYNTHESIS_EVENT_H
