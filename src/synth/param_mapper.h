// Mapping from image features to concrete synthesis parameters.
//
// Two strategies share one scheduler: the legacy mapper switches hard at
// angularity 0.5, the continuous (v2) mapper interpolates every parameter
// between a mild and an extreme setting by intensity.

#ifndef SHAPESOUND_SYNTH_PARAM_MAPPER_H
#define SHAPESOUND_SYNTH_PARAM_MAPPER_H

#include <memory>
#include <vector>

#include "core/basic_types.h"
#include "image/feature_extractor.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// @brief Record values clamped to their documented ranges.
struct MappedFeatures {
  float brightness = 0.0f;
  float angularity = 0.5f;
  float complexity = 0.0f;
  float rhythm = 0.0f;
  float warmth = 0.0f;
  float saturation = 0.0f;
  float texture = 0.0f;
};

/// @brief Clamp every scalar of `record` into range.
MappedFeatures clampFeatures(const AnalysisRecord& record);

/// @brief Kiki iff angularity > 0.5.
PerformanceMode performanceFor(float angularity);

/// @brief Distance of angularity from the midpoint, in [0,1].
///
/// Legacy mode has no intensity and returns 1. Continuous mode returns
/// (a - 0.5) / 0.5 for Kiki and (0.5 - a) / 0.5 for Bouba.
float computeIntensity(float angularity, SynthMode mode);

/// @brief Gain shape of a percussive voice: optional linear attack from 0
/// (attack 0 starts at the peak), then an exponential decay to `floor`.
struct PercussiveEnvelope {
  float attack = 0.0f;
  float peak = 0.0f;
  float floor = 0.01f;
};

/// @brief Repeating filtered bass notes on the beat (Kiki).
struct BassLineParams {
  Waveform waveform = Waveform::Sawtooth;
  float cutoff = 1000.0f;
  float q = 1.0f;
  float note_length = 0.1f;   ///< Seconds to the end of the decay.
  float tail = 0.0f;          ///< Extra source time after the decay.
  PercussiveEnvelope envelope;
  float noise_amount = 0.0f;
};

/// @brief Short melody notes (Kiki).
struct StaccatoMelodyParams {
  int note_count = 0;
  float spacing = 0.0f;
  float octave = 2.0f;          ///< Multiplier on the base frequency.
  float length_base = 0.05f;    ///< Note length = base + (1 - angularity) * per_roundness.
  float length_per_roundness = 0.15f;
  float tail = 0.0f;
  Waveform waveform = Waveform::Triangle;
  bool use_fm = false;
  float fm_ratio = 1.0f;
  float fm_index = 0.0f;
  float cutoff = 1000.0f;
  float q = 1.0f;
  PercussiveEnvelope envelope;      ///< Plain oscillator.
  PercussiveEnvelope fm_envelope;   ///< FM pair.
  float noise_amount = 0.0f;
};

/// @brief Pitch-swept sine kick on the beat.
struct KickParams {
  bool enabled = false;
  float start_frequency = 150.0f;
  float end_frequency = 40.0f;
  float sweep_time = 0.05f;
  float volume = 0.35f;
  float decay_time = 0.15f;
  float length = 0.15f;
  float noise_amount = 0.0f;   ///< 0 disables the noise layer.
};

/// @brief High-passed noise-burst hi-hat.
struct HiHatParams {
  bool enabled = false;
  float interval = 0.0f;
  float cutoff = 8000.0f;
  float volume = 0.08f;
  float burst_length = 0.03f;
  float burst_decay = 0.05f;
};

/// @brief Whole-session sustained tone with linear fades (drone, sub bass).
struct SustainedToneParams {
  bool enabled = false;
  float frequency_ratio = 0.5f;   ///< Multiplier on the base frequency.
  float level = 0.0f;
  float fade_in = 1.0f;
  float fade_out = 1.0f;
  float hold_gap = 0.0f;          ///< Minimum hold between fade in and fade out.
  FilterSpec filter;
  bool lfo = false;
  float lfo_rate = 0.0f;
  float lfo_depth = 0.0f;
  float noise_amount = 0.0f;
};

/// @brief Gliding legato melody (Bouba).
struct LegatoMelodyParams {
  int note_count = 0;
  float spacing = 0.0f;
  float octave = 1.0f;
  Waveform waveform = Waveform::Sine;
  bool glide_wraps = true;       ///< Last note glides to the first segment.
  float glide_fraction = 0.5f;   ///< Glide end as a fraction of spacing.
  bool vibrato = false;
  float vibrato_rate = 0.0f;
  float vibrato_depth = 0.0f;
  float vibrato_fade = 0.0f;
  bool use_fm = false;
  float fm_ratio = 1.0f;
  float fm_index = 0.0f;
  float cutoff = 1000.0f;
  float q = 1.0f;
  float attack = 0.1f;
  float decay = 0.1f;
  float hold_gap = 0.0f;   ///< Minimum sustain after the attack.
  float peak = 0.15f;
  float sustain = 0.12f;
  float tail = 0.0f;
  float noise_amount = 0.0f;
};

/// @brief Sustained sine chord.
struct PadParams {
  bool enabled = false;
  std::vector<int> degrees;
  float level = 0.04f;
  float fade_in = 1.5f;
  float fade_out = 1.5f;
  float hold_gap = 0.0f;
  float vibrato_rate = 5.0f;
  float vibrato_depth = 3.0f;
  float cutoff = 1000.0f;
  float noise_amount = 0.0f;
};

/// @brief Everything the scheduler needs to emit a performance.
struct PerformanceParams {
  PerformanceMode performance = PerformanceMode::Bouba;
  SynthMode mode = SynthMode::V2;
  float intensity = 0.0f;
  float base_frequency = 220.0f;
  float beat_length = 0.25f;

  // Kiki voices
  BassLineParams bass;
  StaccatoMelodyParams staccato;
  KickParams kick;
  HiHatParams hihat;

  // Bouba voices
  SustainedToneParams drone;
  LegatoMelodyParams legato;
  PadParams pad;
  SustainedToneParams sub_bass;
};

/// @brief Strategy turning an analysis record into performance parameters.
class ParamMapper {
 public:
  virtual ~ParamMapper() = default;

  /// @brief Map a record for a session of `total_duration` seconds.
  virtual PerformanceParams map(const AnalysisRecord& record, float total_duration) const = 0;

  virtual SynthMode mode() const = 0;
};

/// @brief Discrete mapping: fixed Kiki/Bouba recipes, hard switch at 0.5.
class LegacyParamMapper : public ParamMapper {
 public:
  PerformanceParams map(const AnalysisRecord& record, float total_duration) const override;
  SynthMode mode() const override { return SynthMode::Legacy; }
};

/// @brief Continuous mapping: parameters interpolated by intensity.
class ContinuousParamMapper : public ParamMapper {
 public:
  PerformanceParams map(const AnalysisRecord& record, float total_duration) const override;
  SynthMode mode() const override { return SynthMode::V2; }
};

/// @brief Create the mapper for `mode`.
std::unique_ptr<ParamMapper> createParamMapper(SynthMode mode);

}  // namespace shapesound

#endif  // SHAPESOUND_SYNTH_PARAM_MAPPER_H
