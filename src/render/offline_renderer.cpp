// Implementation of offline rendering.

#include "render/offline_renderer.h"

#include <algorithm>
#include <cmath>
#include <new>

#include "core/trace_log.h"
#include "render/voice_renderer.h"

namespace shapesound {

RenderResult renderOffline(const SynthesisSession& session, const RenderConfig& config) {
  RenderResult result;
  if (config.sample_rate == 0) {
    result.error_message = "Sample rate must be positive";
    return result;
  }
  if (config.sample_rate > kMaxSampleRate) {
    result.error_message = "Sample rate exceeds the supported maximum";
    return result;
  }
  if (config.channels == 0) {
    result.error_message = "Channel count must be positive";
    return result;
  }
  if (config.channels > kMaxChannels) {
    result.error_message = "Channel count exceeds the supported maximum";
    return result;
  }
  if (!(session.total_duration > 0.0)) {
    result.error_message = "Session has no duration";
    return result;
  }

  double frames_exact = std::floor(session.total_duration * config.sample_rate);
  if (frames_exact > static_cast<double>(kMaxRenderFrames) ||
      frames_exact * config.channels > static_cast<double>(kMaxRenderSamples)) {
    result.error_message = "Render length exceeds the supported maximum";
    return result;
  }

  VoiceRenderer renderer(session, config.sample_rate, config.channels);
  uint64_t total = renderer.totalFrames();
  try {
    result.samples.assign(static_cast<size_t>(total) * config.channels, 0.0f);
  } catch (const std::bad_alloc&) {
    result.error_message = "Out of memory allocating the render buffer";
    return result;
  }
  result.channels = config.channels;
  result.sample_rate = config.sample_rate;

  size_t block = std::max<size_t>(1, config.block_frames);
  uint64_t done = 0;
  while (done < total) {
    size_t frames = static_cast<size_t>(std::min<uint64_t>(block, total - done));
    renderer.renderBlock(result.samples.data() + done * config.channels, frames);
    done += frames;
  }

  trace("Render", "offline %llu frames at %u Hz, %u channels",
        static_cast<unsigned long long>(total), config.sample_rate,
        static_cast<unsigned>(config.channels));
  result.success = true;
  return result;
}

}  // namespace shapesound
