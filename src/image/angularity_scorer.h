// Multi-scale angularity scoring (Bouba/Kiki shape axis).

#ifndef SHAPESOUND_IMAGE_ANGULARITY_SCORER_H
#define SHAPESOUND_IMAGE_ANGULARITY_SCORER_H

#include "image/edge_field.h"
#include "image/pixel_buffer.h"

namespace shapesound {

/// Gradient magnitude an edge pixel must strictly exceed.
constexpr float kEdgeThreshold = 15.0f;

/// Below this many edges (or neighbor comparisons) a metric is neutral.
constexpr int kMinEdgeSamples = 30;

/// Metric value reported when there is not enough edge signal.
constexpr float kNeutralMetric = 0.5f;

/// Images narrower or shorter than this are scored at native scale only.
constexpr int kMultiScaleMinSize = 100;

/// @brief The three directional metrics at one analysis scale, each in [0,1].
struct ScaleMetrics {
  float direction_clustering = kNeutralMetric;
  float edge_contrast = kNeutralMetric;
  float direction_change_sharpness = kNeutralMetric;
};

/// @brief Blend weights of the fine, medium and coarse scales.
struct ScaleWeights {
  float fine = 1.0f;
  float medium = 0.0f;
  float coarse = 0.0f;
};

/// @brief Result of angularity scoring.
struct AngularityResult {
  float angularity = kNeutralMetric;
  /// Scale-blended metrics.
  ScaleMetrics blended;
  /// Raw metrics per scale (medium/coarse stay neutral for single-scale runs).
  ScaleMetrics fine;
  ScaleMetrics medium;
  ScaleMetrics coarse;
  bool multi_scale = false;
  /// Scale weights of direction clustering and sharpness.
  ScaleWeights direction_weights;
  /// Scale weights of edge contrast.
  ScaleWeights contrast_weights;
};

/// @brief Concentration of edge orientations into the two fullest of 8 bins.
///
/// Opposite gradient signs share a bin, so a horizontal edge counts the
/// same whichever side is brighter. ratio = top2 / total, mapped
/// 0.25 -> 0 and 1.0 -> 1.
float computeDirectionClustering(const EdgeField& field, float threshold);

/// @brief Mean super-threshold magnitude mapped 20 -> 0 and 80 -> 1.
float computeEdgeContrast(const EdgeField& field, float threshold);

/// @brief Share of 4-neighbor edge pairs whose direction differs by more
/// than 45 degrees, scaled so a ratio of 0.35 saturates at 1.
float computeDirectionChangeSharpness(const EdgeField& field, float threshold);

/// @brief All three metrics of one buffer at threshold kEdgeThreshold.
ScaleMetrics computeScaleMetrics(const PixelBuffer& buffer);

/// @brief Score the angularity of an image.
///
/// Images of at least 100x100 are analyzed at native, 1/2 and 1/4
/// resolution; smaller images use the native scale only. The result is
/// always in [0,1] and falls back to 0.5 when there is not enough edge
/// signal.
///
/// @param buffer Valid RGBA buffer.
/// @return Angularity and the metric breakdown.
AngularityResult scoreAngularity(const PixelBuffer& buffer);

}  // namespace shapesound

#endif  // SHAPESOUND_IMAGE_ANGULARITY_SCORER_H
