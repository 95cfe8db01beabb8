// Implementation of scale and pitch helpers.

#include "synth/musical_scale.h"

#include <algorithm>
#include <cmath>

namespace shapesound {

float baseFrequency(float brightness) { return 220.0f + brightness * 220.0f; }

int segmentDegree(float brightness) {
  int degree = static_cast<int>(std::floor(brightness * 15.0f));
  return std::clamp(degree, 0, kScaleDegreeCount - 1);
}

float degreeFrequency(float base, int degree) {
  int clamped = std::clamp(degree, 0, kScaleDegreeCount - 1);
  float semitones = static_cast<float>(kExpandedMinorScale[static_cast<size_t>(clamped)]);
  return base * std::pow(2.0f, semitones / 12.0f);
}

}  // namespace shapesound
