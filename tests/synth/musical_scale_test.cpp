// Tests for synth/musical_scale.h -- base frequency and scale degrees.

#include "synth/musical_scale.h"

#include <gtest/gtest.h>

namespace shapesound {
namespace {

TEST(MusicalScaleTest, BaseFrequencySpansOneOctave) {
  EXPECT_FLOAT_EQ(baseFrequency(0.0f), 220.0f);
  EXPECT_FLOAT_EQ(baseFrequency(0.5f), 330.0f);
  EXPECT_FLOAT_EQ(baseFrequency(1.0f), 440.0f);
}

TEST(MusicalScaleTest, SegmentDegreeFloorsAndClamps) {
  EXPECT_EQ(segmentDegree(0.0f), 0);
  EXPECT_EQ(segmentDegree(0.5f), 7);
  EXPECT_EQ(segmentDegree(1.0f), 15);
  EXPECT_EQ(segmentDegree(-0.3f), 0);
  EXPECT_EQ(segmentDegree(2.0f), 15);
}

TEST(MusicalScaleTest, DegreeFrequencyFollowsMinorScale) {
  EXPECT_FLOAT_EQ(degreeFrequency(220.0f, 0), 220.0f);
  // Degree 7 is the octave.
  EXPECT_NEAR(degreeFrequency(220.0f, 7), 440.0f, 1e-3f);
  // Degree 14 is two octaves up.
  EXPECT_NEAR(degreeFrequency(220.0f, 14), 880.0f, 1e-2f);
  // Degree 2 is a minor third.
  EXPECT_NEAR(degreeFrequency(220.0f, 2), 220.0f * 1.189207f, 1e-2f);
}

TEST(MusicalScaleTest, DegreeFrequencyClampsDegree) {
  EXPECT_FLOAT_EQ(degreeFrequency(100.0f, -4), 100.0f);
  EXPECT_FLOAT_EQ(degreeFrequency(100.0f, 99), degreeFrequency(100.0f, 15));
}

TEST(MusicalScaleTest, ScaleIsAscending) {
  for (size_t idx = 1; idx < kExpandedMinorScale.size(); ++idx) {
    EXPECT_GT(kExpandedMinorScale[idx], kExpandedMinorScale[idx - 1]);
  }
}

}  // namespace
}  // namespace shapesound
