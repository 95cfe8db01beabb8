// Tests for image/sampling.h -- the four spatial sampling strategies.

#include "image/sampling.h"

#include <gtest/gtest.h>

#include <cmath>

#include "test_helpers.h"

namespace shapesound {
namespace {

constexpr SamplingMethod kAllMethods[] = {SamplingMethod::Brightness, SamplingMethod::Edges,
                                          SamplingMethod::Scattered, SamplingMethod::Regions};

// ---------------------------------------------------------------------------
// samplePoint
// ---------------------------------------------------------------------------

TEST(SamplingTest, SamplePointOnUniformImage) {
  PixelBuffer buffer = makeSolidBuffer(10, 10, 51, 51, 51);
  Sample sample = samplePoint(buffer, 5, 5);
  EXPECT_FLOAT_EQ(sample.brightness, 0.2f);
  EXPECT_FLOAT_EQ(sample.angularity, 0.0f);
  EXPECT_EQ(sample.x, 5);
  EXPECT_EQ(sample.y, 5);
}

TEST(SamplingTest, SamplePointOutOfBoundsIsZero) {
  PixelBuffer buffer = makeSolidBuffer(10, 10, 255, 255, 255);
  Sample sample = samplePoint(buffer, 10, 3);
  EXPECT_FLOAT_EQ(sample.brightness, 0.0f);
  EXPECT_FLOAT_EQ(sample.angularity, 0.0f);
}

TEST(SamplingTest, SamplePointLocalAngularityCaps) {
  PixelBuffer buffer = test_helpers::makeCheckerboard(20, 20, 1);
  Sample sample = samplePoint(buffer, 10, 10);
  EXPECT_GT(sample.angularity, 0.0f);
  EXPECT_LE(sample.angularity, 1.0f);
}

// ---------------------------------------------------------------------------
// Segment count
// ---------------------------------------------------------------------------

TEST(SamplingTest, SixteenSamplesForEveryMethodAndSize) {
  for (int size : {8, 9, 33, 200}) {
    PixelBuffer buffer = test_helpers::makeCheckerboard(size, size, 3);
    for (SamplingMethod method : kAllMethods) {
      std::mt19937 rng(5);
      EXPECT_EQ(collectSamples(buffer, method, rng).size(), 16u)
          << samplingMethodToString(method) << " at " << size;
    }
  }
}

TEST(SamplingTest, SamplesStayInsideTheImage) {
  PixelBuffer buffer = test_helpers::makeHorizontalGradient(64, 48);
  for (SamplingMethod method : kAllMethods) {
    std::mt19937 rng(11);
    for (const Sample& sample : collectSamples(buffer, method, rng)) {
      EXPECT_GE(sample.x, 0);
      EXPECT_GE(sample.y, 0);
      EXPECT_LT(sample.x, 64);
      EXPECT_LT(sample.y, 48);
      EXPECT_GE(sample.brightness, 0.0f);
      EXPECT_LE(sample.brightness, 1.0f);
    }
  }
}

// ---------------------------------------------------------------------------
// Strategy details
// ---------------------------------------------------------------------------

TEST(SamplingTest, BrightnessPathStartsAtBrightestPixel) {
  PixelBuffer buffer = makeSolidBuffer(100, 100, 10, 10, 10);
  test_helpers::setGray(buffer, 37, 61, 250);
  std::vector<Sample> samples = sampleBrightnessPath(buffer);
  EXPECT_EQ(samples[0].x, 37);
  EXPECT_EQ(samples[0].y, 61);
}

TEST(SamplingTest, BrightnessPathKeepsMinimumSpacing) {
  std::vector<Sample> samples = sampleBrightnessPath(test_helpers::makeHorizontalGradient(200, 200));
  for (size_t lhs = 0; lhs < samples.size(); ++lhs) {
    for (size_t rhs = lhs + 1; rhs < samples.size(); ++rhs) {
      float dist = std::hypot(static_cast<float>(samples[lhs].x - samples[rhs].x),
                              static_cast<float>(samples[lhs].y - samples[rhs].y));
      EXPECT_GE(dist, 20.0f);
    }
  }
}

TEST(SamplingTest, BrightnessPathFallsBackToOrigin) {
  // No stride-4 grid point of an 8x8 image is 20 px from (0,0).
  std::vector<Sample> samples = sampleBrightnessPath(makeSolidBuffer(8, 8, 100, 100, 100));
  for (const Sample& sample : samples) {
    EXPECT_EQ(sample.x, 0);
    EXPECT_EQ(sample.y, 0);
  }
}

TEST(SamplingTest, ScatteredFollowsFixedPattern) {
  std::vector<Sample> samples = sampleScattered(makeSolidBuffer(200, 100, 0, 0, 0));
  EXPECT_EQ(samples[0].x, 20);
  EXPECT_EQ(samples[0].y, 10);
  EXPECT_EQ(samples[1].x, 60);
  EXPECT_EQ(samples[1].y, 20);
  EXPECT_EQ(samples[3].x, 180);
  EXPECT_EQ(samples[3].y, 25);
  EXPECT_EQ(samples[15].x, 90);
  EXPECT_EQ(samples[15].y, 50);
}

TEST(SamplingTest, RegionsUseCellCenters) {
  PixelBuffer buffer = test_helpers::makeHorizontalGradient(80, 40);
  std::vector<Sample> samples = sampleRegions(buffer);
  EXPECT_EQ(samples[0].x, 10);
  EXPECT_EQ(samples[0].y, 5);
  EXPECT_EQ(samples[5].x, 30);
  EXPECT_EQ(samples[5].y, 15);
  // Left cells of a left-to-right ramp are darker than right cells.
  EXPECT_LT(samples[0].brightness, samples[3].brightness);
}

TEST(SamplingTest, RegionsOfTinyImageSampleZero) {
  std::vector<Sample> samples = sampleRegions(makeSolidBuffer(3, 3, 255, 255, 255));
  ASSERT_EQ(samples.size(), 16u);
  EXPECT_FLOAT_EQ(samples[0].brightness, 0.0f);
}

TEST(SamplingTest, EdgesPickStrongGradients) {
  std::mt19937 rng(3);
  std::vector<Sample> samples = sampleEdges(test_helpers::makeCheckerboard(64, 64, 8), rng);
  int on_edges = 0;
  for (const Sample& sample : samples) {
    if (sample.angularity > 0.0f) ++on_edges;
  }
  EXPECT_EQ(on_edges, 16);
}

TEST(SamplingTest, EdgesPaddingIsSeeded) {
  PixelBuffer buffer = makeSolidBuffer(50, 50, 90, 90, 90);
  std::mt19937 rng_a(77);
  std::mt19937 rng_b(77);
  std::vector<Sample> first = sampleEdges(buffer, rng_a);
  std::vector<Sample> second = sampleEdges(buffer, rng_b);
  ASSERT_EQ(first.size(), second.size());
  for (size_t idx = 0; idx < first.size(); ++idx) {
    EXPECT_EQ(first[idx].x, second[idx].x);
    EXPECT_EQ(first[idx].y, second[idx].y);
  }
}

TEST(SamplingTest, DeterministicStrategiesIgnoreRng) {
  PixelBuffer buffer = test_helpers::makeCheckerboard(60, 60, 6);
  for (SamplingMethod method : {SamplingMethod::Scattered, SamplingMethod::Regions,
                                SamplingMethod::Brightness}) {
    std::mt19937 rng_a(1);
    std::mt19937 rng_b(999);
    std::vector<Sample> first = collectSamples(buffer, method, rng_a);
    std::vector<Sample> second = collectSamples(buffer, method, rng_b);
    for (size_t idx = 0; idx < first.size(); ++idx) {
      EXPECT_EQ(first[idx].x, second[idx].x);
      EXPECT_FLOAT_EQ(first[idx].brightness, second[idx].brightness);
    }
  }
}

}  // namespace
}  // namespace shapesound
