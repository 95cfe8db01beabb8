// Implementation of image feature extraction.

#include "image/feature_extractor.h"

#include <algorithm>
#include <cmath>
#include <random>

#include "core/trace_log.h"

namespace shapesound {

namespace {

constexpr float kNormalizeMinRange = 0.01f;

template <size_t N>
void normalizeToMax(std::array<float, N>& bins) {
  float max_val = *std::max_element(bins.begin(), bins.end());
  if (max_val <= 0.0f) return;
  for (auto& bin : bins) bin /= max_val;
}

int binIndex(float value, int bins) {
  return std::min(static_cast<int>(std::floor(value / 255.0f * static_cast<float>(bins))),
                  bins - 1);
}

}  // namespace

float computeTexture(const PixelBuffer& buffer) {
  double detail = 0.0;
  int count = 0;

  for (int y = 2; y < buffer.height - 2; y += 2) {
    for (int x = 2; x < buffer.width - 2; x += 2) {
      float center = buffer.luminance(x, y);
      float variation = 0.0f;
      for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
          if (dx == 0 && dy == 0) continue;
          variation += std::fabs(center - buffer.luminance(x + dx, y + dy));
        }
      }
      detail += variation / 8.0f;
      ++count;
    }
  }

  if (count == 0) return 0.0f;
  return std::min(static_cast<float>(detail / count) / 30.0f, 1.0f);
}

std::array<float, kBrightnessHistogramBins> computeBrightnessHistogram(const PixelBuffer& buffer) {
  std::array<float, kBrightnessHistogramBins> histogram{};
  for (int y = 0; y < buffer.height; ++y) {
    for (int x = 0; x < buffer.width; ++x) {
      int bin = binIndex(buffer.luminance(x, y), kBrightnessHistogramBins);
      histogram[static_cast<size_t>(bin)] += 1.0f;
    }
  }
  normalizeToMax(histogram);
  return histogram;
}

ColorHistogram computeColorHistogram(const PixelBuffer& buffer) {
  ColorHistogram result;
  for (int y = 0; y < buffer.height; ++y) {
    for (int x = 0; x < buffer.width; ++x) {
      result.red[static_cast<size_t>(binIndex(buffer.red(x, y), kColorHistogramBins))] += 1.0f;
      result.green[static_cast<size_t>(binIndex(buffer.green(x, y), kColorHistogramBins))] += 1.0f;
      result.blue[static_cast<size_t>(binIndex(buffer.blue(x, y), kColorHistogramBins))] += 1.0f;
    }
  }
  normalizeToMax(result.red);
  normalizeToMax(result.green);
  normalizeToMax(result.blue);
  return result;
}

void normalizeSegmentBrightness(std::vector<Sample>& segments) {
  if (segments.empty()) return;
  auto [min_it, max_it] = std::minmax_element(
      segments.begin(), segments.end(),
      [](const Sample& lhs, const Sample& rhs) { return lhs.brightness < rhs.brightness; });
  float min_bright = min_it->brightness;
  float range = max_it->brightness - min_bright;
  if (range <= kNormalizeMinRange) return;
  for (auto& segment : segments) {
    segment.brightness = (segment.brightness - min_bright) / range;
  }
}

float computeRhythm(const std::vector<Sample>& segments) {
  if (segments.size() < 2) return 0.0f;
  float variation = 0.0f;
  for (size_t idx = 1; idx < segments.size(); ++idx) {
    variation += std::fabs(segments[idx].brightness - segments[idx - 1].brightness);
  }
  return variation / static_cast<float>(segments.size() - 1);
}

float computeComplexity(const std::vector<Sample>& segments) {
  if (segments.empty()) return 0.0f;
  double count = static_cast<double>(segments.size());

  double mean_bright = 0.0;
  double mean_ang = 0.0;
  for (const auto& segment : segments) {
    mean_bright += segment.brightness;
    mean_ang += segment.angularity;
  }
  mean_bright /= count;
  mean_ang /= count;

  double var_bright = 0.0;
  double var_ang = 0.0;
  for (const auto& segment : segments) {
    var_bright += (segment.brightness - mean_bright) * (segment.brightness - mean_bright);
    var_ang += (segment.angularity - mean_ang) * (segment.angularity - mean_ang);
  }
  double spread = std::sqrt(var_bright / count) + std::sqrt(var_ang / count);
  return static_cast<float>(std::min(spread * 3.0, 1.0));
}

AnalysisResult analyze(const PixelBuffer& buffer, SamplingMethod method, uint32_t seed) {
  AnalysisResult result;
  if (buffer.width <= 0 || buffer.height <= 0) {
    result.error_message = "Image has zero width or height";
    return result;
  }
  if (!buffer.isValid()) {
    result.error_message = "Pixel data size does not match width*height*4";
    return result;
  }

  AnalysisRecord& record = result.record;
  record.sampling_method = method;

  double sum_red = 0.0;
  double sum_green = 0.0;
  double sum_blue = 0.0;
  for (int y = 0; y < buffer.height; ++y) {
    for (int x = 0; x < buffer.width; ++x) {
      sum_red += buffer.red(x, y);
      sum_green += buffer.green(x, y);
      sum_blue += buffer.blue(x, y);
    }
  }
  double pixel_count = static_cast<double>(buffer.width) * static_cast<double>(buffer.height);
  float mean_red = static_cast<float>(sum_red / pixel_count / 255.0);
  float mean_green = static_cast<float>(sum_green / pixel_count / 255.0);
  float mean_blue = static_cast<float>(sum_blue / pixel_count / 255.0);

  record.brightness = (mean_red + mean_green + mean_blue) / 3.0f;
  record.warmth = mean_red - mean_blue;
  record.saturation = std::max({mean_red, mean_green, mean_blue}) -
                      std::min({mean_red, mean_green, mean_blue});
  record.texture = computeTexture(buffer);

  record.angularity_metrics = scoreAngularity(buffer);
  record.angularity = record.angularity_metrics.angularity;

  std::mt19937 rng(seed);
  std::vector<Sample> samples = collectSamples(buffer, method, rng);
  for (const auto& sample : samples) record.sampling_points.emplace_back(sample.x, sample.y);

  normalizeSegmentBrightness(samples);
  record.rhythm = computeRhythm(samples);
  record.complexity = computeComplexity(samples);
  record.segments = std::move(samples);

  record.histogram = computeBrightnessHistogram(buffer);
  record.color_histogram = computeColorHistogram(buffer);

  trace("Analysis",
        "%dx%d sampling=%s brightness=%.3f angularity=%.3f complexity=%.3f rhythm=%.3f "
        "warmth=%.3f saturation=%.3f texture=%.3f",
        buffer.width, buffer.height, samplingMethodToString(method), record.brightness,
        record.angularity, record.complexity, record.rhythm, record.warmth, record.saturation,
        record.texture);

  result.success = true;
  return result;
}

}  // namespace shapesound
