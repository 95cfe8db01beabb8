// Real-time playback of a session through the default PortAudio output device.

#ifndef SHAPESOUND_RENDER_LIVE_RENDERER_H
#define SHAPESOUND_RENDER_LIVE_RENDERER_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <portaudio.h>

#include "core/basic_types.h"
#include "render/voice_renderer.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// @brief Session-scoped audio device owner.
///
/// start() acquires PortAudio and opens the default output stream; the
/// stream callback pulls blocks from a VoiceRenderer until the session
/// length has played, then flags completion. cancel() and the destructor
/// stop and release the device. The audio thread owns the renderer while
/// the stream runs; the control thread only reads the completion flag.
class LiveRenderer {
 public:
  /// @param session Session to play; must outlive the renderer.
  LiveRenderer(const SynthesisSession& session, uint32_t sample_rate = kDefaultSampleRate,
               uint16_t channels = kDefaultChannels);
  ~LiveRenderer();

  LiveRenderer(const LiveRenderer&) = delete;
  LiveRenderer& operator=(const LiveRenderer&) = delete;

  /// @brief Open the device and start playback.
  /// @return False on failure; see errorMessage().
  bool start();

  /// @brief Stop playback and release the device. Safe to call repeatedly.
  void cancel();

  /// @brief True once the whole session has been delivered to the device.
  bool isFinished() const { return finished_.load(std::memory_order_acquire); }

  /// @brief Block until playback finishes, polling every `poll_ms` milliseconds.
  void waitUntilFinished(int poll_ms = 20) const;

  const std::string& errorMessage() const { return error_message_; }

 private:
  static int streamCallback(const void* input, void* output, unsigned long frames,
                            const PaStreamCallbackTimeInfo* time_info,
                            PaStreamCallbackFlags status_flags, void* user_data);

  const SynthesisSession& session_;
  uint32_t sample_rate_;
  uint16_t channels_;
  std::unique_ptr<VoiceRenderer> renderer_;
  PaStream* stream_ = nullptr;
  bool initialized_ = false;
  std::atomic<bool> finished_{false};
  std::string error_message_;
};

}  // namespace shapesound

#endif  // SHAPESOUND_RENDER_LIVE_RENDERER_H
