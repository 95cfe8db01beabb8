// Expanded natural-minor scale and pitch helpers.

#ifndef SHAPESOUND_SYNTH_MUSICAL_SCALE_H
#define SHAPESOUND_SYNTH_MUSICAL_SCALE_H

#include <array>

namespace shapesound {

constexpr int kScaleDegreeCount = 16;

/// Two octaves of natural minor, in semitones above the base frequency.
constexpr std::array<int, kScaleDegreeCount> kExpandedMinorScale = {
    0, 2, 3, 5, 7, 8, 10, 12, 14, 15, 17, 19, 20, 22, 24, 26};

/// @brief Base frequency of a performance: 220 Hz plus 220 Hz per unit brightness.
float baseFrequency(float brightness);

/// @brief Scale degree index for a normalized segment brightness: floor(b * 15),
/// clamped to the scale.
int segmentDegree(float brightness);

/// @brief Frequency of scale degree `degree` above `base` (degree clamped to 0..15).
float degreeFrequency(float base, int degree);

}  // namespace shapesound

#endif  // SHAPESOUND_SYNTH_MUSICAL_SCALE_H
