// Tests for render/biquad.h -- RBJ lowpass/highpass designs.

#include "render/biquad.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"

namespace shapesound {
namespace {

constexpr float kRate = 44100.0f;

/// Peak magnitude of the filter's response to a sine, measured after a
/// settling period.
float steadyStatePeak(Biquad& filter, float freq) {
  float peak = 0.0f;
  for (int idx = 0; idx < 8820; ++idx) {
    float input = std::sin(kTwoPi * freq * static_cast<float>(idx) / kRate);
    float output = filter.process(input);
    if (idx >= 4410) peak = std::max(peak, std::fabs(output));
  }
  return peak;
}

float settleDc(Biquad& filter) {
  float output = 0.0f;
  for (int idx = 0; idx < 4410; ++idx) output = filter.process(1.0f);
  return output;
}

TEST(BiquadTest, DefaultPassesThrough) {
  Biquad filter;
  EXPECT_EQ(filter.type(), FilterType::None);
  EXPECT_FLOAT_EQ(filter.process(0.25f), 0.25f);
  EXPECT_FLOAT_EQ(filter.process(-0.75f), -0.75f);
}

TEST(BiquadTest, NoneTypeIgnoresCoefficients) {
  Biquad filter;
  filter.configure(FilterType::None, 500.0f, 2.0f, kRate);
  EXPECT_FLOAT_EQ(filter.process(0.5f), 0.5f);
}

TEST(BiquadTest, ZeroSampleRateBypasses) {
  Biquad filter;
  filter.configure(FilterType::Lowpass, 500.0f, 1.0f, 0.0f);
  EXPECT_EQ(filter.type(), FilterType::None);
  EXPECT_FLOAT_EQ(filter.process(0.5f), 0.5f);
}

// ---------------------------------------------------------------------------
// Lowpass
// ---------------------------------------------------------------------------

TEST(BiquadTest, LowpassPassesDc) {
  Biquad filter;
  filter.configure(FilterType::Lowpass, 800.0f, 0.707f, kRate);
  EXPECT_NEAR(settleDc(filter), 1.0f, 1e-3f);
}

TEST(BiquadTest, LowpassAttenuatesHighFrequencies) {
  Biquad filter;
  filter.configure(FilterType::Lowpass, 200.0f, 0.707f, kRate);
  EXPECT_LT(steadyStatePeak(filter, 8000.0f), 0.01f);

  filter.configure(FilterType::Lowpass, 200.0f, 0.707f, kRate);
  EXPECT_GT(steadyStatePeak(filter, 50.0f), 0.9f);
}

// ---------------------------------------------------------------------------
// Highpass
// ---------------------------------------------------------------------------

TEST(BiquadTest, HighpassBlocksDc) {
  Biquad filter;
  filter.configure(FilterType::Highpass, 200.0f, 0.707f, kRate);
  EXPECT_NEAR(settleDc(filter), 0.0f, 1e-3f);
}

TEST(BiquadTest, HighpassPassesHighFrequencies) {
  Biquad filter;
  filter.configure(FilterType::Highpass, 200.0f, 0.707f, kRate);
  EXPECT_GT(steadyStatePeak(filter, 5000.0f), 0.95f);
}

TEST(BiquadTest, ReconfigureClearsState) {
  Biquad filter;
  filter.configure(FilterType::Lowpass, 300.0f, 1.0f, kRate);
  settleDc(filter);
  filter.configure(FilterType::Lowpass, 300.0f, 1.0f, kRate);
  Biquad fresh;
  fresh.configure(FilterType::Lowpass, 300.0f, 1.0f, kRate);
  EXPECT_FLOAT_EQ(filter.process(0.5f), fresh.process(0.5f));
}

TEST(BiquadTest, ExtremeCutoffStaysStable) {
  Biquad filter;
  filter.configure(FilterType::Lowpass, 1.0e6f, 0.0f, kRate);
  float peak = steadyStatePeak(filter, 1000.0f);
  EXPECT_TRUE(std::isfinite(peak));
  EXPECT_LT(peak, 100.0f);
}

}  // namespace
}  // namespace shapesound
