// Spatial sampling strategies producing the 16-point segment sequence.

#ifndef SHAPESOUND_IMAGE_SAMPLING_H
#define SHAPESOUND_IMAGE_SAMPLING_H

#include <random>
#include <vector>

#include "core/basic_types.h"
#include "image/pixel_buffer.h"

namespace shapesound {

/// @brief One sampled point: brightness and local angularity, both in [0,1].
struct Sample {
  float brightness = 0.0f;
  float angularity = 0.0f;
  int x = 0;
  int y = 0;
};

/// @brief Sample brightness and local angularity at (x, y).
///
/// Local angularity is the mean absolute luminance difference between the
/// point and its in-bounds 5x5 neighborhood (center included), divided by
/// 30 and capped at 1. Out-of-bounds points sample as zeros.
Sample samplePoint(const PixelBuffer& buffer, int x, int y);

/// @brief Greedy brightness path: the brightest pixel, then repeatedly the
/// brightest stride-4 grid pixel at least 20 px from every chosen point.
/// When no grid pixel qualifies, (0, 0) is taken.
std::vector<Sample> sampleBrightnessPath(const PixelBuffer& buffer);

/// @brief Evenly spaced picks from the strongest gradients (> 30), padded
/// with uniformly random points drawn from `rng`.
std::vector<Sample> sampleEdges(const PixelBuffer& buffer, std::mt19937& rng);

/// @brief The fixed 16-point normalized scatter pattern.
std::vector<Sample> sampleScattered(const PixelBuffer& buffer);

/// @brief Averages over a 4x4 grid of cells, positioned at each cell center.
std::vector<Sample> sampleRegions(const PixelBuffer& buffer);

/// @brief Dispatch to the strategy selected by `method`.
/// @param rng Used only by the edges strategy.
std::vector<Sample> collectSamples(const PixelBuffer& buffer, SamplingMethod method,
                                   std::mt19937& rng);

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_SAMPLING_H
