// Small numeric helpers shared by analysis and synthesis.

#ifndef SHAPESOUND_CORE_MATH_UTILS_H
#define SHAPESOUND_CORE_MATH_UTILS_H

#include <algorithm>

namespace shapesound {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kTwoPi = 2.0f * kPi;

/// @brief Linear interpolation: t=0 gives `from`, t=1 gives `to`.
inline float lerp(float from, float to, float t) { return from + (to - from) * t; }

/// @brief Clamp to the unit interval.
inline float clamp01(float value) { return std::clamp(value, 0.0f, 1.0f); }

}  // namespace shapesound

#endif  // SHAPESOUND_CORE_MATH_UTILS_H
