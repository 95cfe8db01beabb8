// Sample-accurate realization of a synthesis session in fixed-size blocks.

#ifndef SHAPESOUND_RENDER_VOICE_RENDERER_H
#define SHAPESOUND_RENDER_VOICE_RENDERER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "render/biquad.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// @brief Renders a SynthesisSession sample by sample.
///
/// Both the live and the offline back-end drive this class. Each voice keeps
/// its own oscillator phases, filter state and noise generators, and voices
/// are mixed in event order, so the output does not depend on how the
/// session is split into blocks.
///
/// The session must outlive the renderer.
class VoiceRenderer {
 public:
  /// @param session Session to realize.
  /// @param sample_rate Output rate in Hz (> 0).
  /// @param channels Interleaved output channels (> 0); all carry the same signal.
  VoiceRenderer(const SynthesisSession& session, uint32_t sample_rate, uint16_t channels);

  /// @brief Render the next `frames` frames into `interleaved`
  /// (frames * channels floats). Frames past the session end are silent.
  void renderBlock(float* interleaved, size_t frames);

  /// @brief Session length in frames: floor(total_duration * sample_rate).
  uint64_t totalFrames() const { return total_frames_; }

  /// @brief Frames rendered so far.
  uint64_t position() const { return position_; }

  bool finished() const { return position_ >= total_frames_; }

  uint32_t sampleRate() const { return sample_rate_; }
  uint16_t channels() const { return channels_; }

 private:
  struct Voice {
    const SynthesisEvent* event = nullptr;
    uint64_t start_frame = 0;
    uint64_t end_frame = 0;
    double phase = 0.0;
    double mod_phase = 0.0;
    double vibrato_phase = 0.0;
    uint64_t burst_frames = 0;
    uint64_t noise_frames = 0;
    Biquad filter;
  };

  /// @brief Add `frames` frames of `voice`, starting at absolute frame `first`, into `mix`.
  void renderVoice(Voice& voice, uint64_t first, size_t frames, float* mix);

  const SynthesisSession& session_;
  uint32_t sample_rate_;
  uint16_t channels_;
  uint64_t total_frames_ = 0;
  uint64_t position_ = 0;

  std::vector<Voice> voices_;        // In event order (sorted by start frame).
  size_t next_voice_ = 0;            // First voice not yet activated.
  std::vector<size_t> active_;       // Ascending voice indices.
  std::vector<float> mix_;
};

/// @brief Uniform white noise in [-1, 1] for sample `index` of the stream `seed`.
///
/// Stateless, so a voice's noise depends only on its seed and frame.
float whiteNoise(uint32_t seed, uint64_t index);

/// @brief One period of `waveform` at normalized phase [0, 1).
float oscillatorSample(Waveform waveform, double phase);

}  // namespace shapesound

#endif  // SHAPESOUND_RENDER_VOICE_RENDERER_H
