// RBJ-cookbook biquad filter (direct form I).

#ifndef SHAPESOUND_RENDER_BIQUAD_H
#define SHAPESOUND_RENDER_BIQUAD_H

#include "core/basic_types.h"

namespace shapesound {

/// @brief Second-order IIR filter with lowpass/highpass designs.
///
/// FilterType::None passes input through unchanged.
class Biquad {
 public:
  Biquad() = default;

  /// @brief Design the filter. Cutoff is clamped to [10 Hz, 0.49 * rate],
  /// Q to at least 0.05.
  void configure(FilterType type, float cutoff, float q, float sample_rate);

  /// @brief Filter one sample.
  float process(float input) {
    if (type_ == FilterType::None) return input;
    float output = b0_ * input + b1_ * x1_ + b2_ * x2_ - a1_ * y1_ - a2_ * y2_;
    x2_ = x1_;
    x1_ = input;
    y2_ = y1_;
    y1_ = output;
    return output;
  }

  /// @brief Clear the delay line.
  void reset() { x1_ = x2_ = y1_ = y2_ = 0.0f; }

  FilterType type() const { return type_; }

 private:
  FilterType type_ = FilterType::None;
  float b0_ = 1.0f;
  float b1_ = 0.0f;
  float b2_ = 0.0f;
  float a1_ = 0.0f;
  float a2_ = 0.0f;
  float x1_ = 0.0f;
  float x2_ = 0.0f;
  float y1_ = 0.0f;
  float y2_ = 0.0f;
};

}  // namespace shapesound

#endif  // SHAPESOUND_RENDER_BIQUAD_H
