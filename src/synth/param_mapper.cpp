// Implementation of the legacy and continuous parameter mappers.

#include "synth/param_mapper.h"

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"
#include "synth/musical_scale.h"

namespace shapesound {

namespace {

constexpr float kTempoBase = 60.0f;
constexpr float kTempoRange = 240.0f;

/// Beat length in seconds (sixteenth notes) for a tempo in BPM.
float beatLengthFor(float bpm) { return 60.0f / bpm / 4.0f; }

/// Continuous-mode melody waveform: sine, then triangle, then square/sawtooth.
Waveform continuousWaveform(float intensity, float warmth) {
  if (intensity < 0.33f) return Waveform::Sine;
  if (intensity < 0.66f) return warmth > 0.0f ? Waveform::Triangle : Waveform::Sine;
  return warmth > 0.0f ? Waveform::Square : Waveform::Sawtooth;
}

/// Clamp into [low, high]; NaN maps to `fallback`.
float clampFeature(float value, float low, float high, float fallback) {
  if (std::isnan(value)) return fallback;
  return std::clamp(value, low, high);
}

int notesThatFit(float total_duration, float spacing) {
  if (spacing <= 0.0f) return 0;
  return static_cast<int>(std::floor(total_duration / spacing));
}

// ---------------------------------------------------------------------------
// Legacy recipes
// ---------------------------------------------------------------------------

void mapLegacyKiki(const MappedFeatures& feat, float total_duration, PerformanceParams& params) {
  float bpm = kTempoBase + feat.rhythm * kTempoRange;
  params.beat_length = beatLengthFor(bpm);
  float cutoff = 500.0f + (feat.warmth + 1.0f) * 2000.0f;

  BassLineParams& bass = params.bass;
  bass.waveform = feat.warmth > 0.0f ? Waveform::Square : Waveform::Sawtooth;
  bass.cutoff = cutoff;
  bass.q = 1.0f + feat.saturation * 10.0f;
  bass.note_length = params.beat_length * (0.3f + feat.complexity * 0.4f);
  bass.envelope = {0.0f, 0.25f, 0.01f};
  bass.noise_amount = feat.texture;

  StaccatoMelodyParams& melody = params.staccato;
  melody.note_count = kSegmentCount;
  melody.spacing = total_duration / static_cast<float>(kSegmentCount);
  melody.octave = 2.0f;
  melody.length_base = 0.05f;
  melody.length_per_roundness = 0.15f;
  melody.waveform = feat.saturation > 0.5f ? Waveform::Sawtooth : Waveform::Triangle;
  melody.use_fm = feat.complexity > 0.6f;
  melody.fm_ratio = 1.0f + feat.complexity * 3.0f;
  melody.fm_index = feat.saturation * 5.0f;
  melody.cutoff = cutoff * 1.5f;
  melody.envelope = {0.0f, 0.18f, 0.01f};
  melody.fm_envelope = {0.0f, 0.15f, 0.01f};
  melody.noise_amount = feat.texture;

  KickParams& kick = params.kick;
  kick.enabled = true;
  kick.start_frequency = 150.0f;
  kick.volume = 0.35f;
  kick.length = 0.15f;
  kick.noise_amount = feat.texture > 0.3f ? feat.texture : 0.0f;

  HiHatParams& hihat = params.hihat;
  hihat.enabled = true;
  hihat.interval = params.beat_length / 2.0f;
  hihat.cutoff = 8000.0f;
  hihat.volume = 0.08f;
}

void mapLegacyBouba(const MappedFeatures& feat, float total_duration, PerformanceParams& params) {
  float cutoff = 500.0f + (feat.warmth + 1.0f) * 2000.0f;
  float note_length = total_duration / static_cast<float>(kSegmentCount);

  SustainedToneParams& drone = params.drone;
  drone.enabled = true;
  drone.frequency_ratio = 0.5f;
  drone.level = 0.2f;
  drone.fade_in = std::min(1.0f, total_duration * 0.2f);
  drone.fade_out = 1.0f;
  drone.filter = {FilterType::Lowpass, cutoff * 0.8f, 1.0f + feat.saturation * 5.0f};
  drone.noise_amount = feat.texture;

  LegatoMelodyParams& melody = params.legato;
  melody.note_count = kSegmentCount;
  melody.spacing = note_length;
  melody.octave = 1.0f;
  melody.waveform = feat.warmth > 0.0f ? Waveform::Triangle : Waveform::Sine;
  melody.glide_wraps = false;
  melody.glide_fraction = 0.5f + (1.0f - feat.complexity) * 0.3f;
  melody.use_fm = feat.complexity > 0.6f;
  melody.fm_ratio = 1.0f + feat.complexity * 3.0f;
  melody.fm_index = feat.saturation * 5.0f;
  float envelope_time = 0.2f + (1.0f - feat.complexity) * 0.3f;
  melody.attack = std::min(envelope_time, note_length * 0.3f);
  melody.decay = std::min(envelope_time, note_length * 0.3f);
  melody.hold_gap = 0.01f;
  if (melody.use_fm) {
    melody.cutoff = cutoff * 0.9f;
    melody.peak = 0.12f;
    melody.sustain = 0.1f;
  } else {
    melody.cutoff = cutoff;
    melody.peak = 0.15f;
    melody.sustain = 0.12f;
  }
  melody.noise_amount = feat.texture;

  PadParams& pad = params.pad;
  pad.enabled = true;
  pad.degrees = {0, 3, 5, 7};
  pad.level = 0.04f;
  pad.fade_in = std::min(1.5f, total_duration * 0.3f);
  pad.fade_out = 1.5f;
  pad.hold_gap = 0.01f;
  pad.vibrato_rate = 5.0f;
  pad.vibrato_depth = 3.0f + feat.saturation * 5.0f;
  pad.cutoff = cutoff * 1.2f;
  pad.noise_amount = feat.texture > 0.2f ? feat.texture : 0.0f;
}

// ---------------------------------------------------------------------------
// Continuous recipes
// ---------------------------------------------------------------------------

void mapContinuousKiki(const MappedFeatures& feat, float total_duration, float intensity,
                       PerformanceParams& params) {
  float bpm = lerp(80.0f, kTempoBase + feat.rhythm * kTempoRange, intensity);
  params.beat_length = beatLengthFor(bpm);
  float cutoff = lerp(800.0f, 500.0f + (feat.warmth + 1.0f) * 2500.0f, intensity);
  float q = lerp(1.0f, 1.0f + feat.saturation * 15.0f, intensity);
  float attack = lerp(0.05f, 0.005f, intensity);
  float decay_mult = lerp(0.7f, 0.3f, intensity);

  BassLineParams& bass = params.bass;
  if (intensity > 0.5f) {
    bass.waveform = feat.warmth > 0.0f ? Waveform::Square : Waveform::Sawtooth;
  } else {
    bass.waveform = Waveform::Triangle;
  }
  bass.cutoff = cutoff * 0.8f;
  bass.q = q;
  bass.note_length = params.beat_length * decay_mult;
  bass.tail = 0.01f;
  bass.envelope = {attack, 0.25f, 0.01f};
  bass.noise_amount = feat.texture * intensity;

  StaccatoMelodyParams& melody = params.staccato;
  melody.spacing = lerp(0.35f, 0.15f, intensity);
  melody.note_count = notesThatFit(total_duration, melody.spacing);
  melody.octave = 2.0f;
  melody.length_base = lerp(0.25f, 0.03f, intensity);
  melody.length_per_roundness = 0.1f;
  melody.tail = 0.01f;
  melody.waveform = continuousWaveform(intensity, feat.warmth);
  melody.use_fm = feat.complexity > 0.6f || intensity > 0.7f;
  melody.fm_ratio = lerp(1.0f, 4.0f, intensity);
  melody.fm_index = lerp(1.0f, 5.0f, intensity) * feat.saturation;
  melody.cutoff = cutoff * 1.5f;
  melody.q = q * 0.5f;
  melody.envelope = {attack, 0.18f, 0.01f};
  melody.fm_envelope = {attack, 0.15f, 0.01f};
  melody.noise_amount = feat.texture * intensity;

  KickParams& kick = params.kick;
  kick.enabled = intensity > 0.3f;
  kick.start_frequency = lerp(100.0f, 180.0f, intensity);
  kick.volume = lerp(0.15f, 0.4f, intensity);
  kick.length = 0.2f;
  kick.noise_amount = feat.texture > 0.3f ? feat.texture : 0.0f;

  HiHatParams& hihat = params.hihat;
  hihat.enabled = intensity > 0.4f;
  hihat.interval = intensity > 0.7f ? params.beat_length / 2.0f : params.beat_length;
  hihat.cutoff = lerp(6000.0f, 10000.0f, intensity);
  hihat.volume = lerp(0.02f, 0.1f, intensity);
}

void mapContinuousBouba(const MappedFeatures& feat, float total_duration, float intensity,
                        PerformanceParams& params) {
  float cutoff = lerp(2000.0f, 500.0f, intensity) + (feat.warmth + 1.0f) * 500.0f;
  float q = lerp(0.5f, 2.0f + feat.saturation * 3.0f, intensity);

  float segment_length = total_duration / static_cast<float>(kSegmentCount);
  float max_envelope = segment_length * lerp(0.4f, 0.8f, intensity);
  float attack = std::min(lerp(0.05f, 0.3f, intensity), max_envelope * 0.6f);
  float decay = std::min(lerp(0.05f, 0.25f, intensity), max_envelope * 0.4f);

  float vibrato_depth = lerp(2.0f, 8.0f, intensity) + feat.saturation * 4.0f;
  float vibrato_rate = lerp(6.0f, 4.0f, intensity);
  float fade = std::min(lerp(0.5f, 1.5f, intensity), total_duration * 0.5f);

  SustainedToneParams& drone = params.drone;
  drone.enabled = true;
  drone.frequency_ratio = 0.5f;
  drone.level = lerp(0.15f, 0.25f, intensity);
  drone.fade_in = fade;
  drone.fade_out = fade;
  drone.filter = {FilterType::Lowpass, cutoff * 0.6f, q};
  drone.lfo = intensity > 0.5f;
  drone.lfo_rate = 0.5f;
  drone.lfo_depth = params.base_frequency * 0.02f * intensity;
  drone.noise_amount = feat.texture * 0.5f;

  LegatoMelodyParams& melody = params.legato;
  melody.spacing = lerp(0.4f, 0.6f, intensity);
  melody.note_count = notesThatFit(total_duration, melody.spacing);
  melody.octave = 1.0f;
  if (intensity > 0.5f) {
    melody.waveform = Waveform::Sine;
  } else {
    melody.waveform = feat.warmth > 0.0f ? Waveform::Triangle : Waveform::Sine;
  }
  melody.glide_wraps = true;
  melody.glide_fraction = lerp(0.3f, 0.9f, intensity);
  melody.vibrato = true;
  melody.vibrato_rate = vibrato_rate;
  melody.vibrato_depth = vibrato_depth;
  melody.vibrato_fade = std::min(attack * 1.5f, melody.spacing * 0.5f);
  melody.cutoff = cutoff;
  melody.q = q * 0.5f;
  melody.attack = std::min(attack, melody.spacing * 0.4f);
  melody.decay = std::min(decay, melody.spacing * 0.3f);
  melody.peak = 0.15f;
  melody.sustain = 0.12f;
  melody.tail = 0.1f;
  melody.noise_amount = feat.texture * 0.3f;

  PadParams& pad = params.pad;
  pad.enabled = true;
  pad.degrees = {0, 3, 5, 7};
  if (intensity > 0.6f) {
    pad.degrees.push_back(10);
    pad.degrees.push_back(12);
  }
  pad.level = lerp(0.02f, 0.06f, intensity);
  float pad_fade = std::min(lerp(1.0f, 2.0f, intensity), total_duration * 0.5f);
  pad.fade_in = pad_fade;
  pad.fade_out = pad_fade;
  pad.vibrato_rate = vibrato_rate * 0.8f;
  pad.vibrato_depth = vibrato_depth * 0.5f;
  pad.cutoff = cutoff * 0.8f;
  pad.noise_amount = feat.texture > 0.2f ? feat.texture * 0.2f : 0.0f;

  SustainedToneParams& sub = params.sub_bass;
  sub.enabled = intensity > 0.6f;
  sub.frequency_ratio = 0.25f;
  sub.level = lerp(0.0f, 0.15f, (intensity - 0.6f) / 0.4f);
  sub.fade_in = fade;
  sub.fade_out = fade;
}

PerformanceParams baseParams(const MappedFeatures& feat, SynthMode mode) {
  PerformanceParams params;
  params.mode = mode;
  params.performance = performanceFor(feat.angularity);
  params.intensity = computeIntensity(feat.angularity, mode);
  params.base_frequency = baseFrequency(feat.brightness);
  return params;
}

}  // namespace

MappedFeatures clampFeatures(const AnalysisRecord& record) {
  MappedFeatures feat;
  feat.brightness = clampFeature(record.brightness, 0.0f, 1.0f, 0.0f);
  feat.angularity = clampFeature(record.angularity, 0.0f, 1.0f, kModeMidpoint);
  feat.complexity = clampFeature(record.complexity, 0.0f, 1.0f, 0.0f);
  feat.rhythm = clampFeature(record.rhythm, 0.0f, 1.0f, 0.0f);
  feat.warmth = clampFeature(record.warmth, -1.0f, 1.0f, 0.0f);
  feat.saturation = clampFeature(record.saturation, 0.0f, 1.0f, 0.0f);
  feat.texture = clampFeature(record.texture, 0.0f, 1.0f, 0.0f);
  return feat;
}

PerformanceMode performanceFor(float angularity) {
  return angularity > kModeMidpoint ? PerformanceMode::Kiki : PerformanceMode::Bouba;
}

float computeIntensity(float angularity, SynthMode mode) {
  if (mode == SynthMode::Legacy) return 1.0f;
  float clamped = clamp01(angularity);
  if (clamped > kModeMidpoint) return clamp01((clamped - kModeMidpoint) / kModeMidpoint);
  return clamp01((kModeMidpoint - clamped) / kModeMidpoint);
}

PerformanceParams LegacyParamMapper::map(const AnalysisRecord& record,
                                         float total_duration) const {
  MappedFeatures feat = clampFeatures(record);
  PerformanceParams params = baseParams(feat, SynthMode::Legacy);
  if (params.performance == PerformanceMode::Kiki) {
    mapLegacyKiki(feat, total_duration, params);
  } else {
    mapLegacyBouba(feat, total_duration, params);
  }
  return params;
}

PerformanceParams ContinuousParamMapper::map(const AnalysisRecord& record,
                                             float total_duration) const {
  MappedFeatures feat = clampFeatures(record);
  PerformanceParams params = baseParams(feat, SynthMode::V2);
  if (params.performance == PerformanceMode::Kiki) {
    mapContinuousKiki(feat, total_duration, params.intensity, params);
  } else {
    mapContinuousBouba(feat, total_duration, params.intensity, params);
  }
  return params;
}

std::unique_ptr<ParamMapper> createParamMapper(SynthMode mode) {
  if (mode == SynthMode::Legacy) return std::make_unique<LegacyParamMapper>();
  return std::make_unique<ContinuousParamMapper>();
}

}  // namespace shapesound
