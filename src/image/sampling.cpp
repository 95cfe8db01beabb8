// Implementation of the spatial sampling strategies.

#include "image/sampling.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "core/rng_util.h"

namespace shapesound {

namespace {

constexpr int kBrightnessGridStride = 4;
constexpr float kBrightnessMinSpacing = 20.0f;
constexpr float kEdgeSampleThreshold = 30.0f;
constexpr int kRegionGrid = 4;
constexpr size_t kSegmentSlots = static_cast<size_t>(kSegmentCount);

constexpr double kScatterPattern[kSegmentCount][2] = {
    {0.10, 0.10}, {0.30, 0.20}, {0.60, 0.15}, {0.90, 0.25},
    {0.20, 0.40}, {0.50, 0.35}, {0.80, 0.45}, {0.15, 0.60},
    {0.40, 0.55}, {0.70, 0.65}, {0.25, 0.75}, {0.55, 0.80},
    {0.85, 0.75}, {0.35, 0.90}, {0.65, 0.95}, {0.45, 0.50}};

struct EdgeCandidate {
  int x;
  int y;
  float strength;
};

}  // namespace

Sample samplePoint(const PixelBuffer& buffer, int x, int y) {
  Sample sample;
  sample.x = x;
  sample.y = y;
  if (x < 0 || y < 0 || x >= buffer.width || y >= buffer.height) return sample;

  float center = buffer.luminance(x, y);
  sample.brightness = center / 255.0f;

  float local_edge = 0.0f;
  int count = 0;
  for (int dy = -2; dy <= 2; ++dy) {
    for (int dx = -2; dx <= 2; ++dx) {
      int nx = x + dx;
      int ny = y + dy;
      if (nx < 0 || ny < 0 || nx >= buffer.width || ny >= buffer.height) continue;
      local_edge += std::fabs(center - buffer.luminance(nx, ny));
      ++count;
    }
  }
  sample.angularity = std::min(local_edge / static_cast<float>(count) / 30.0f, 1.0f);
  return sample;
}

std::vector<Sample> sampleBrightnessPath(const PixelBuffer& buffer) {
  std::vector<Sample> samples;
  samples.reserve(kSegmentCount);

  float max_bright = -1.0f;
  int start_x = 0;
  int start_y = 0;
  for (int y = 0; y < buffer.height; ++y) {
    for (int x = 0; x < buffer.width; ++x) {
      float bright = buffer.luminance(x, y);
      if (bright > max_bright) {
        max_bright = bright;
        start_x = x;
        start_y = y;
      }
    }
  }
  samples.push_back(samplePoint(buffer, start_x, start_y));

  while (static_cast<int>(samples.size()) < kSegmentCount) {
    float next_bright = -1.0f;
    int next_x = 0;
    int next_y = 0;

    for (int y = 0; y < buffer.height; y += kBrightnessGridStride) {
      for (int x = 0; x < buffer.width; x += kBrightnessGridStride) {
        bool too_close = false;
        for (const auto& chosen : samples) {
          float dist_x = static_cast<float>(x - chosen.x);
          float dist_y = static_cast<float>(y - chosen.y);
          if (std::sqrt(dist_x * dist_x + dist_y * dist_y) < kBrightnessMinSpacing) {
            too_close = true;
            break;
          }
        }
        if (too_close) continue;

        float bright = buffer.luminance(x, y);
        if (bright > next_bright) {
          next_bright = bright;
          next_x = x;
          next_y = y;
        }
      }
    }

    samples.push_back(samplePoint(buffer, next_x, next_y));
  }

  return samples;
}

std::vector<Sample> sampleEdges(const PixelBuffer& buffer, std::mt19937& rng) {
  std::vector<EdgeCandidate> candidates;
  for (int y = 1; y < buffer.height - 1; y += 2) {
    for (int x = 1; x < buffer.width - 1; x += 2) {
      float center = buffer.luminance(x, y);
      float gradient = std::fabs(center - buffer.luminance(x + 1, y)) +
                       std::fabs(center - buffer.luminance(x, y + 1));
      if (gradient > kEdgeSampleThreshold) candidates.push_back({x, y, gradient});
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const EdgeCandidate& lhs, const EdgeCandidate& rhs) {
                     return lhs.strength > rhs.strength;
                   });

  std::vector<Sample> samples;
  samples.reserve(kSegmentCount);
  size_t step = std::max<size_t>(1, candidates.size() / kSegmentSlots);
  for (size_t idx = 0; samples.size() < kSegmentSlots && idx * step < candidates.size(); ++idx) {
    const auto& pick = candidates[idx * step];
    samples.push_back(samplePoint(buffer, pick.x, pick.y));
  }

  while (samples.size() < kSegmentSlots) {
    int x = rng::rollRange(rng, 0, buffer.width - 1);
    int y = rng::rollRange(rng, 0, buffer.height - 1);
    samples.push_back(samplePoint(buffer, x, y));
  }

  return samples;
}

std::vector<Sample> sampleScattered(const PixelBuffer& buffer) {
  std::vector<Sample> samples;
  samples.reserve(kSegmentCount);
  for (const auto& point : kScatterPattern) {
    int x = static_cast<int>(std::floor(point[0] * buffer.width));
    int y = static_cast<int>(std::floor(point[1] * buffer.height));
    samples.push_back(samplePoint(buffer, x, y));
  }
  return samples;
}

std::vector<Sample> sampleRegions(const PixelBuffer& buffer) {
  std::vector<Sample> samples;
  samples.reserve(kSegmentCount);

  int cell_width = buffer.width / kRegionGrid;
  int cell_height = buffer.height / kRegionGrid;

  for (int grid_y = 0; grid_y < kRegionGrid; ++grid_y) {
    for (int grid_x = 0; grid_x < kRegionGrid; ++grid_x) {
      int start_x = grid_x * cell_width;
      int start_y = grid_y * cell_height;
      int end_x = std::min((grid_x + 1) * cell_width, buffer.width);
      int end_y = std::min((grid_y + 1) * cell_height, buffer.height);

      float sum_brightness = 0.0f;
      float sum_angularity = 0.0f;
      int count = 0;
      for (int y = start_y; y < end_y; y += 2) {
        for (int x = start_x; x < end_x; x += 2) {
          Sample point = samplePoint(buffer, x, y);
          sum_brightness += point.brightness;
          sum_angularity += point.angularity;
          ++count;
        }
      }

      Sample cell;
      cell.x = start_x + (end_x - start_x) / 2;
      cell.y = start_y + (end_y - start_y) / 2;
      // Cells of an image narrower than the grid are empty and sample as zero.
      if (count > 0) {
        cell.brightness = sum_brightness / static_cast<float>(count);
        cell.angularity = sum_angularity / static_cast<float>(count);
      }
      samples.push_back(cell);
    }
  }

  return samples;
}

std::vector<Sample> collectSamples(const PixelBuffer& buffer, SamplingMethod method,
                                   std::mt19937& rng) {
  switch (method) {
    case SamplingMethod::Brightness: return sampleBrightnessPath(buffer);
    case SamplingMethod::Edges:      return sampleEdges(buffer, rng);
    case SamplingMethod::Scattered:  return sampleScattered(buffer);
    case SamplingMethod::Regions:    return sampleRegions(buffer);
  }
  return sampleBrightnessPath(buffer);
}

}  // namespace shapesound
