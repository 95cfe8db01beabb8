// Offline rendering of a whole session into an interleaved float buffer.

#ifndef SHAPESOUND_RENDER_OFFLINE_RENDERER_H
#define SHAPESOUND_RENDER_OFFLINE_RENDERER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// Largest buffer renderOffline() produces: 10 minutes at 192 kHz.
constexpr uint64_t kMaxRenderFrames = 600ull * 192000ull;

/// Largest interleaved sample count: kMaxRenderFrames in stereo.
constexpr uint64_t kMaxRenderSamples = kMaxRenderFrames * 2ull;

/// Highest supported sample rate (Hz).
constexpr uint32_t kMaxSampleRate = 192000;

/// Highest supported output channel count.
constexpr uint16_t kMaxChannels = 8;

/// @brief Output format of an offline render.
struct RenderConfig {
  uint32_t sample_rate = kDefaultSampleRate;
  uint16_t channels = kDefaultChannels;
  /// Frames per renderBlock() call.
  size_t block_frames = 1024;
};

/// @brief Result of renderOffline().
struct RenderResult {
  std::vector<float> samples;  ///< Interleaved, frames * channels.
  uint16_t channels = 0;
  uint32_t sample_rate = 0;
  bool success = false;
  std::string error_message;

  uint64_t frameCount() const { return channels == 0 ? 0 : samples.size() / channels; }
};

/// @brief Render `session` to exactly floor(total_duration * sample_rate) frames.
///
/// Events that run past the end are truncated.
///
/// @return RenderResult; success is false for a zero or out-of-range sample
///         rate or channel count, a length above kMaxRenderFrames or
///         kMaxRenderSamples, or a buffer that cannot be allocated.
RenderResult renderOffline(const SynthesisSession& session, const RenderConfig& config = {});

}  // namespace shapesound

#endif  // SHAPESOUND_RENDER_OFFLINE_RENDERER_H
