// Image feature extraction: global scalars, segment sequence and histograms.

#ifndef SHAPESOUND_IMAGE_FEATURE_EXTRACTOR_H
#define SHAPESOUND_IMAGE_FEATURE_EXTRACTOR_H

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "image/angularity_scorer.h"
#include "image/pixel_buffer.h"
#include "image/sampling.h"

namespace shapesound {

constexpr int kBrightnessHistogramBins = 32;
constexpr int kColorHistogramBins = 16;

/// @brief Per-channel color histograms, each normalized to its own maximum.
struct ColorHistogram {
  std::array<float, kColorHistogramBins> red{};
  std::array<float, kColorHistogramBins> green{};
  std::array<float, kColorHistogramBins> blue{};
};

/// @brief Everything the synthesis side knows about an image.
struct AnalysisRecord {
  float brightness = 0.0f;   ///< Mean luminance, 0..1.
  float angularity = 0.5f;   ///< Multi-scale angularity, 0..1.
  float complexity = 0.0f;   ///< Spread of segment values, 0..1.
  float rhythm = 0.0f;       ///< Mean brightness step between segments, 0..1.
  float warmth = 0.0f;       ///< Mean red minus mean blue, -1..1.
  float saturation = 0.0f;   ///< Spread of channel means, 0..1.
  float texture = 0.0f;      ///< High-frequency detail, 0..1.
  SamplingMethod sampling_method = SamplingMethod::Brightness;

  /// Sixteen samples; brightness min-max normalized when its range > 0.01.
  std::vector<Sample> segments;
  /// Sampling coordinates, parallel to `segments`.
  std::vector<std::pair<int, int>> sampling_points;

  std::array<float, kBrightnessHistogramBins> histogram{};
  ColorHistogram color_histogram;
  AngularityResult angularity_metrics;
};

/// @brief Result of analyze().
struct AnalysisResult {
  AnalysisRecord record;
  bool success = false;
  std::string error_message;
};

/// @brief Analyze an RGBA image.
///
/// @param buffer Pixel buffer; must be valid (see PixelBuffer::isValid).
/// @param method Spatial sampling strategy.
/// @param seed Seed for the edges strategy's padding points.
/// @return AnalysisResult; success is false for an empty or malformed buffer.
AnalysisResult analyze(const PixelBuffer& buffer, SamplingMethod method, uint32_t seed);

/// @brief Mean 8-neighbor luminance variation over a stride-2 grid,
/// divided by 30 and capped at 1. Returns 0 when the grid is empty.
float computeTexture(const PixelBuffer& buffer);

/// @brief 32-bin luminance histogram normalized to max = 1.
std::array<float, kBrightnessHistogramBins> computeBrightnessHistogram(const PixelBuffer& buffer);

/// @brief 16-bin per-channel histograms normalized to max = 1.
ColorHistogram computeColorHistogram(const PixelBuffer& buffer);

/// @brief Min-max normalize segment brightness when its range exceeds 0.01.
void normalizeSegmentBrightness(std::vector<Sample>& segments);

/// @brief Mean absolute brightness change between consecutive segments.
float computeRhythm(const std::vector<Sample>& segments);

/// @brief 3 * (stddev of brightness + stddev of angularity), capped at 1.
float computeComplexity(const std::vector<Sample>& segments);

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_FEATURE_EXTRACTOR_H
