// Implementation of enum-to-string and string-to-enum conversions.

#include "core/basic_types.h"

namespace shapesound {

const char* samplingMethodToString(SamplingMethod method) {
  switch (method) {
    case SamplingMethod::Brightness: return "brightness";
    case SamplingMethod::Edges:      return "edges";
    case SamplingMethod::Scattered:  return "scattered";
    case SamplingMethod::Regions:    return "regions";
  }
  return "unknown";
}

const char* synthModeToString(SynthMode mode) {
  switch (mode) {
    case SynthMode::Legacy: return "legacy";
    case SynthMode::V2:     return "v2";
  }
  return "unknown";
}

const char* performanceModeToString(PerformanceMode mode) {
  switch (mode) {
    case PerformanceMode::Bouba: return "bouba";
    case PerformanceMode::Kiki:  return "kiki";
  }
  return "unknown";
}

const char* waveformToString(Waveform waveform) {
  switch (waveform) {
    case Waveform::Sine:     return "sine";
    case Waveform::Square:   return "square";
    case Waveform::Sawtooth: return "sawtooth";
    case Waveform::Triangle: return "triangle";
  }
  return "unknown";
}

const char* filterTypeToString(FilterType type) {
  switch (type) {
    case FilterType::None:     return "none";
    case FilterType::Lowpass:  return "lowpass";
    case FilterType::Highpass: return "highpass";
  }
  return "unknown";
}

const char* rampTypeToString(RampType ramp) {
  switch (ramp) {
    case RampType::Set:         return "set";
    case RampType::Linear:      return "linear";
    case RampType::Exponential: return "exponential";
  }
  return "unknown";
}

const char* eventKindToString(EventKind kind) {
  switch (kind) {
    case EventKind::Oscillator: return "oscillator";
    case EventKind::NoiseBurst: return "noise_burst";
    case EventKind::FmPair:     return "fm_pair";
  }
  return "unknown";
}

const char* synthPhaseToString(SynthPhase phase) {
  switch (phase) {
    case SynthPhase::Bass:       return "bass";
    case SynthPhase::Melody:     return "melody";
    case SynthPhase::Percussion: return "percussion";
    case SynthPhase::Pad:        return "pad";
  }
  return "unknown";
}

std::optional<SamplingMethod> samplingMethodFromString(const std::string& str) {
  if (str == "brightness") return SamplingMethod::Brightness;
  if (str == "edges") return SamplingMethod::Edges;
  if (str == "scattered" || str == "random") return SamplingMethod::Scattered;
  if (str == "regions") return SamplingMethod::Regions;
  return std::nullopt;
}

std::optional<SynthMode> synthModeFromString(const std::string& str) {
  if (str == "legacy" || str == "discrete") return SynthMode::Legacy;
  if (str == "v2" || str == "continuous") return SynthMode::V2;
  return std::nullopt;
}

}  // namespace shapesound
