// Biquad coefficient design.

#include "render/biquad.h"

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"

namespace shapesound {

namespace {

constexpr float kMinCutoff = 10.0f;
constexpr float kMaxCutoffRatio = 0.49f;
constexpr float kMinQ = 0.05f;

}  // namespace

void Biquad::configure(FilterType type, float cutoff, float q, float sample_rate) {
  type_ = type;
  reset();
  if (type == FilterType::None || sample_rate <= 0.0f) {
    type_ = FilterType::None;
    return;
  }

  float freq = std::clamp(cutoff, kMinCutoff, sample_rate * kMaxCutoffRatio);
  float omega = kTwoPi * freq / sample_rate;
  float sin_omega = std::sin(omega);
  float cos_omega = std::cos(omega);
  float alpha = sin_omega / (2.0f * std::max(q, kMinQ));
  float a0 = 1.0f + alpha;

  if (type == FilterType::Lowpass) {
    b0_ = ((1.0f - cos_omega) / 2.0f) / a0;
    b1_ = (1.0f - cos_omega) / a0;
  } else {
    b0_ = ((1.0f + cos_omega) / 2.0f) / a0;
    b1_ = -(1.0f + cos_omega) / a0;
  }
  b2_ = b0_;
  a1_ = (-2.0f * cos_omega) / a0;
  a2_ = (1.0f - alpha) / a0;
}

}  // namespace shapesound
