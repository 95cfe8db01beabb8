// Implementation of the block-based voice renderer.

#include "render/voice_renderer.h"

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"
#include "core/rng_util.h"

namespace shapesound {

namespace {

uint64_t secondsToFrames(double seconds, uint32_t sample_rate) {
  if (!(seconds > 0.0)) return 0;
  return static_cast<uint64_t>(std::llround(seconds * static_cast<double>(sample_rate)));
}

double wrapPhase(double phase) {
  phase -= std::floor(phase);
  return phase;
}

}  // namespace

float whiteNoise(uint32_t seed, uint64_t index) {
  uint32_t mixed = rng::splitmix32(seed ^ static_cast<uint32_t>(index >> 32),
                                   static_cast<uint32_t>(index));
  return static_cast<float>(static_cast<double>(mixed) / 4294967295.0 * 2.0 - 1.0);
}

float oscillatorSample(Waveform waveform, double phase) {
  switch (waveform) {
    case Waveform::Sine:
      return static_cast<float>(std::sin(2.0 * static_cast<double>(kPi) * phase));
    case Waveform::Square:
      return phase < 0.5 ? 1.0f : -1.0f;
    case Waveform::Sawtooth:
      return static_cast<float>(2.0 * phase - 1.0);
    case Waveform::Triangle:
      if (phase < 0.25) return static_cast<float>(4.0 * phase);
      if (phase < 0.75) return static_cast<float>(2.0 - 4.0 * phase);
      return static_cast<float>(4.0 * phase - 4.0);
  }
  return 0.0f;
}

VoiceRenderer::VoiceRenderer(const SynthesisSession& session, uint32_t sample_rate,
                             uint16_t channels)
    : session_(session), sample_rate_(sample_rate), channels_(channels) {
  if (sample_rate_ == 0 || channels_ == 0) return;

  total_frames_ = static_cast<uint64_t>(
      std::floor(session.total_duration * static_cast<double>(sample_rate_)));

  voices_.reserve(session.events.size());
  for (const auto& event : session.events) {
    Voice voice;
    voice.event = &event;
    voice.start_frame = secondsToFrames(event.start_time, sample_rate_);
    voice.end_frame = voice.start_frame + secondsToFrames(event.duration, sample_rate_);
    voice.filter.configure(event.filter.type, event.filter.cutoff, event.filter.q,
                           static_cast<float>(sample_rate_));
    if (event.kind == EventKind::NoiseBurst) {
      voice.burst_frames = static_cast<uint64_t>(
          std::floor(event.burst.length * static_cast<double>(sample_rate_)));
    }
    if (event.noise.enabled) {
      voice.noise_frames = secondsToFrames(event.noise.duration, sample_rate_);
    }
    voices_.push_back(std::move(voice));
  }

  // Activation walks voices by start frame.
  std::stable_sort(voices_.begin(), voices_.end(), [](const Voice& lhs, const Voice& rhs) {
    return lhs.start_frame < rhs.start_frame;
  });
}

void VoiceRenderer::renderBlock(float* interleaved, size_t frames) {
  if (interleaved == nullptr || frames == 0 || channels_ == 0) return;

  mix_.assign(frames, 0.0f);
  uint64_t block_start = position_;
  uint64_t block_end = std::min(position_ + frames, std::max(total_frames_, position_));

  while (next_voice_ < voices_.size() && voices_[next_voice_].start_frame < block_end) {
    active_.push_back(next_voice_++);
  }

  for (size_t slot = 0; slot < active_.size();) {
    Voice& voice = voices_[active_[slot]];
    uint64_t first = std::max(voice.start_frame, block_start);
    uint64_t last = std::min(voice.end_frame, block_end);
    if (first < last) {
      renderVoice(voice, first, static_cast<size_t>(last - first),
                  mix_.data() + (first - block_start));
    }
    if (voice.end_frame <= block_end) {
      active_.erase(active_.begin() + static_cast<std::ptrdiff_t>(slot));
    } else {
      ++slot;
    }
  }

  float master = session_.master_volume;
  for (size_t frame = 0; frame < frames; ++frame) {
    float sample = mix_[frame] * master;
    for (uint16_t channel = 0; channel < channels_; ++channel) {
      interleaved[frame * channels_ + channel] = sample;
    }
  }

  position_ += frames;
}

void VoiceRenderer::renderVoice(Voice& voice, uint64_t first, size_t frames, float* mix) {
  const SynthesisEvent& event = *voice.event;
  const double rate = static_cast<double>(sample_rate_);
  const double base_freq = event.frequency.initial;

  for (size_t idx = 0; idx < frames; ++idx) {
    uint64_t local = first + idx - voice.start_frame;
    double offset = static_cast<double>(local) / rate;

    float source = 0.0f;
    if (event.kind == EventKind::NoiseBurst) {
      if (local < voice.burst_frames) {
        double shape = std::exp(-static_cast<double>(local) /
                                (static_cast<double>(voice.burst_frames) * event.burst.decay));
        source = whiteNoise(event.burst.seed, local) * static_cast<float>(shape);
      }
    } else {
      double freq = event.frequency.valueAt(offset);
      if (event.vibrato.enabled) {
        freq += event.vibrato.depth.valueAt(offset) *
                std::sin(2.0 * static_cast<double>(kPi) * voice.vibrato_phase);
        voice.vibrato_phase = wrapPhase(voice.vibrato_phase + event.vibrato.rate / rate);
      }
      if (event.kind == EventKind::FmPair) {
        freq += base_freq * event.fm.index *
                std::sin(2.0 * static_cast<double>(kPi) * voice.mod_phase);
        voice.mod_phase = wrapPhase(voice.mod_phase + base_freq * event.fm.ratio / rate);
      }
      Waveform waveform = event.kind == EventKind::FmPair ? Waveform::Sine : event.waveform;
      source = oscillatorSample(waveform, voice.phase);
      voice.phase = wrapPhase(voice.phase + freq / rate);
    }

    float signal = voice.filter.process(source);
    if (event.noise.enabled && local < voice.noise_frames) {
      signal += whiteNoise(event.noise.seed, local) * event.noise.amount * event.noise.gain;
    }

    mix[idx] += signal * event.envelope.valueAt(offset);
  }
}

}  // namespace shapesound
