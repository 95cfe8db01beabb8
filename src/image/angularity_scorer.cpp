// Implementation of multi-scale angularity scoring.

#include "image/angularity_scorer.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>

#include "core/math_utils.h"
#include "core/trace_log.h"

namespace shapesound {

namespace {

constexpr int kDirectionBins = 8;
constexpr float kSharpTurn = kPi / 4.0f;
constexpr float kSharpRatioCeiling = 0.35f;

// Single-scale combination weights.
constexpr float kSingleClusteringWeight = 0.30f;
constexpr float kSingleContrastWeight = 0.35f;
constexpr float kSingleSharpnessWeight = 0.35f;

// Final combination weights of the blended metrics.
constexpr float kClusteringWeight = 0.25f;
constexpr float kContrastWeight = 0.50f;
constexpr float kSharpnessWeight = 0.25f;

// Direction metrics lean on coarse scales (form); contrast on the fine scale.
constexpr ScaleWeights kDirectionScaleWeights = {0.20f, 0.35f, 0.45f};
constexpr ScaleWeights kContrastScaleWeights = {0.80f, 0.15f, 0.05f};

float blend(float fine, float medium, float coarse, const ScaleWeights& weights) {
  return fine * weights.fine + medium * weights.medium + coarse * weights.coarse;
}

void traceMetrics(const char* label, const ScaleMetrics& metrics) {
  trace("Angularity", "%-8s clustering=%.1f%% contrast=%.1f%% sharpness=%.1f%%", label,
        metrics.direction_clustering * 100.0f, metrics.edge_contrast * 100.0f,
        metrics.direction_change_sharpness * 100.0f);
}

}  // namespace

float computeDirectionClustering(const EdgeField& field, float threshold) {
  std::array<int, kDirectionBins> bins{};
  int total = 0;

  for (int y = 1; y < field.height() - 1; ++y) {
    for (int x = 1; x < field.width() - 1; ++x) {
      if (!field.isEdge(x, y, threshold)) continue;
      float orientation = std::fmod(field.direction(x, y) + kPi, kPi);
      int bin = static_cast<int>(orientation / kPi * kDirectionBins) % kDirectionBins;
      ++bins[static_cast<size_t>(bin)];
      ++total;
    }
  }

  if (total < kMinEdgeSamples) return kNeutralMetric;

  std::sort(bins.begin(), bins.end(), std::greater<int>());
  float ratio = static_cast<float>(bins[0] + bins[1]) / static_cast<float>(total);
  return clamp01((ratio - 0.25f) / 0.75f);
}

float computeEdgeContrast(const EdgeField& field, float threshold) {
  double total_magnitude = 0.0;
  int count = 0;

  for (int y = 1; y < field.height() - 1; ++y) {
    for (int x = 1; x < field.width() - 1; ++x) {
      if (!field.isEdge(x, y, threshold)) continue;
      total_magnitude += field.magnitude(x, y);
      ++count;
    }
  }

  if (count < kMinEdgeSamples) return kNeutralMetric;

  float mean = static_cast<float>(total_magnitude / count);
  return clamp01((mean - 20.0f) / 60.0f);
}

float computeDirectionChangeSharpness(const EdgeField& field, float threshold) {
  static constexpr int kNeighborDx[4] = {0, 0, -1, 1};
  static constexpr int kNeighborDy[4] = {-1, 1, 0, 0};

  int checked = 0;
  int sharp = 0;

  for (int y = 2; y < field.height() - 2; ++y) {
    for (int x = 2; x < field.width() - 2; ++x) {
      if (!field.isEdge(x, y, threshold)) continue;
      float current = field.direction(x, y);

      for (int nbr = 0; nbr < 4; ++nbr) {
        int nx = x + kNeighborDx[nbr];
        int ny = y + kNeighborDy[nbr];
        if (!field.isEdge(nx, ny, threshold)) continue;

        float diff = std::fabs(current - field.direction(nx, ny));
        if (diff > kPi) diff = kTwoPi - diff;
        ++checked;
        if (diff > kSharpTurn) ++sharp;
      }
    }
  }

  if (checked < kMinEdgeSamples) return kNeutralMetric;

  float ratio = static_cast<float>(sharp) / static_cast<float>(checked);
  return std::min(ratio / kSharpRatioCeiling, 1.0f);
}

ScaleMetrics computeScaleMetrics(const PixelBuffer& buffer) {
  EdgeField field(buffer);
  ScaleMetrics metrics;
  metrics.direction_clustering = computeDirectionClustering(field, kEdgeThreshold);
  metrics.edge_contrast = computeEdgeContrast(field, kEdgeThreshold);
  metrics.direction_change_sharpness = computeDirectionChangeSharpness(field, kEdgeThreshold);
  return metrics;
}

AngularityResult scoreAngularity(const PixelBuffer& buffer) {
  AngularityResult result;

  if (buffer.width < kMultiScaleMinSize || buffer.height < kMultiScaleMinSize) {
    result.fine = computeScaleMetrics(buffer);
    result.blended = result.fine;
    result.direction_weights = ScaleWeights{1.0f, 0.0f, 0.0f};
    result.contrast_weights = ScaleWeights{1.0f, 0.0f, 0.0f};
    result.angularity = clamp01(result.fine.direction_clustering * kSingleClusteringWeight +
                                result.fine.edge_contrast * kSingleContrastWeight +
                                result.fine.direction_change_sharpness * kSingleSharpnessWeight);
    traceMetrics("single", result.fine);
    trace("Angularity", "score=%.3f (single scale %dx%d)", result.angularity, buffer.width,
          buffer.height);
    return result;
  }

  result.multi_scale = true;
  result.direction_weights = kDirectionScaleWeights;
  result.contrast_weights = kContrastScaleWeights;
  result.fine = computeScaleMetrics(buffer);
  result.medium = computeScaleMetrics(downsample(buffer, 2));
  result.coarse = computeScaleMetrics(downsample(buffer, 4));

  result.blended.direction_clustering =
      blend(result.fine.direction_clustering, result.medium.direction_clustering,
            result.coarse.direction_clustering, kDirectionScaleWeights);
  result.blended.edge_contrast = blend(result.fine.edge_contrast, result.medium.edge_contrast,
                                       result.coarse.edge_contrast, kContrastScaleWeights);
  result.blended.direction_change_sharpness =
      blend(result.fine.direction_change_sharpness, result.medium.direction_change_sharpness,
            result.coarse.direction_change_sharpness, kDirectionScaleWeights);

  result.angularity = clamp01(result.blended.direction_clustering * kClusteringWeight +
                              result.blended.edge_contrast * kContrastWeight +
                              result.blended.direction_change_sharpness * kSharpnessWeight);

  traceMetrics("fine", result.fine);
  traceMetrics("medium", result.medium);
  traceMetrics("coarse", result.coarse);
  traceMetrics("blended", result.blended);
  trace("Angularity", "score=%.3f", result.angularity);
  return result;
}

}  // namespace shapesound
