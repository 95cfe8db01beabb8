// Implementation of the audio event scheduler.

#include "synth/scheduler.h"

#include <algorithm>
#include <cmath>

#include "core/math_utils.h"
#include "core/rng_util.h"
#include "core/trace_log.h"
#include "synth/musical_scale.h"

namespace shapesound {

namespace {

/// Scale degrees of the Kiki bass riff.
constexpr int kBassRiff[8] = {0, 0, 5, 0, 3, 0, 5, 3};

constexpr float kNoiseBufferScale = 0.5f;
constexpr float kNoiseGainScale = 0.6f;
constexpr float kKickFloor = 0.01f;
constexpr float kHiHatFloor = 0.001f;

/// Step count of a loop that runs while step * interval < total.
int loopSteps(double total, double interval) {
  if (interval <= 0.0) return 0;
  int steps = 0;
  while (static_cast<double>(steps) < total / interval) ++steps;
  return steps;
}

}  // namespace

AutomationProgram percussiveEnvelope(const PercussiveEnvelope& envelope, double length) {
  AutomationProgram program;
  double attack = std::min(static_cast<double>(envelope.attack), length * 0.5);
  if (attack > 0.0) {
    program.initial = 0.0f;
    program.linearTo(attack, envelope.peak);
  } else {
    program.initial = envelope.peak;
  }
  program.exponentialTo(length, envelope.floor);
  return program;
}

AutomationProgram fadeEnvelope(float level, double fade_in, double fade_out, double hold_gap,
                               double duration) {
  double attack = std::clamp(fade_in, 0.0, duration);
  double hold_end = std::max(attack + hold_gap, duration - fade_out);
  hold_end = std::clamp(hold_end, attack, duration);

  AutomationProgram program;
  program.initial = 0.0f;
  program.linearTo(attack, level);
  program.linearTo(hold_end, level);
  program.linearTo(duration, 0.0f);
  return program;
}

EventScheduler::EventScheduler(const AnalysisRecord& record, const PerformanceParams& params,
                               double total_duration, uint32_t seed)
    : record_(record), params_(params), total_duration_(total_duration), seed_(seed) {
  session_.total_duration = total_duration;
  session_.performance = params.performance;
  session_.mode = params.mode;
  session_.intensity = params.intensity;
  session_.seed = seed;
}

bool EventScheduler::step() {
  switch (state_) {
    case State::Idle:
      state_ = State::Building;
      phase_ = SynthPhase::Bass;
      emitPhase(phase_);
      return true;
    case State::Building:
      if (phase_ == SynthPhase::Pad) {
        std::stable_sort(session_.events.begin(), session_.events.end(),
                         [](const SynthesisEvent& lhs, const SynthesisEvent& rhs) {
                           return lhs.start_time < rhs.start_time;
                         });
        state_ = State::Complete;
        return false;
      }
      phase_ = static_cast<SynthPhase>(static_cast<uint8_t>(phase_) + 1);
      emitPhase(phase_);
      return true;
    case State::Complete:
      return false;
  }
  return false;
}

void EventScheduler::run() {
  while (step()) {
  }
}

void EventScheduler::emitPhase(SynthPhase phase) {
  size_t before = session_.events.size();
  bool kiki = params_.performance == PerformanceMode::Kiki;

  switch (phase) {
    case SynthPhase::Bass:
      if (kiki) {
        emitBassLine();
      } else if (params_.drone.enabled) {
        emitSustainedTone(params_.drone, SynthPhase::Bass);
      }
      break;
    case SynthPhase::Melody:
      if (kiki) {
        emitStaccatoMelody();
      } else {
        emitLegatoMelody();
      }
      break;
    case SynthPhase::Percussion:
      if (kiki) {
        if (params_.kick.enabled) emitKick();
        if (params_.hihat.enabled) emitHiHat();
      }
      break;
    case SynthPhase::Pad:
      if (!kiki) {
        if (params_.pad.enabled) emitPad();
        if (params_.sub_bass.enabled) emitSustainedTone(params_.sub_bass, SynthPhase::Pad);
      }
      break;
  }

  trace("Scheduler", "phase=%s events=%zu", synthPhaseToString(phase),
        session_.events.size() - before);
}

NoiseLayer EventScheduler::makeNoiseLayer(float amount, double duration) const {
  NoiseLayer layer;
  if (amount < kNoiseAmountThreshold || duration <= 0.0) return layer;
  layer.enabled = true;
  layer.amount = amount * kNoiseBufferScale;
  layer.gain = amount * kNoiseGainScale;
  layer.duration = duration;
  return layer;
}

void EventScheduler::push(SynthesisEvent event) {
  uint32_t event_seed = rng::splitmix32(seed_, next_event_index_++);
  event.noise.seed = event_seed;
  event.burst.seed = event_seed;
  session_.events.push_back(std::move(event));
}

void EventScheduler::emitBassLine() {
  const BassLineParams& bass = params_.bass;
  double beat = params_.beat_length;
  if (beat <= 0.0) return;

  int steps = static_cast<int>(std::floor(total_duration_ / beat));
  double length = bass.note_length;
  float root = params_.base_frequency * 0.5f;

  for (int idx = 0; idx < steps; ++idx) {
    SynthesisEvent event;
    event.kind = EventKind::Oscillator;
    event.phase = SynthPhase::Bass;
    event.start_time = idx * beat;
    event.duration = length + bass.tail;
    event.waveform = bass.waveform;
    event.frequency = AutomationProgram::constant(degreeFrequency(root, kBassRiff[idx % 8]));
    event.envelope = percussiveEnvelope(bass.envelope, length);
    event.filter = {FilterType::Lowpass, bass.cutoff, bass.q};
    event.noise = makeNoiseLayer(bass.noise_amount, length);
    push(std::move(event));
  }
}

void EventScheduler::emitStaccatoMelody() {
  const StaccatoMelodyParams& melody = params_.staccato;
  const auto& segments = record_.segments;
  if (segments.empty()) return;
  float root = params_.base_frequency * melody.octave;

  for (int idx = 0; idx < melody.note_count; ++idx) {
    const Sample& segment = segments[static_cast<size_t>(idx) % segments.size()];
    double length = melody.length_base +
                    (1.0f - clamp01(segment.angularity)) * melody.length_per_roundness;

    SynthesisEvent event;
    event.phase = SynthPhase::Melody;
    event.start_time = idx * static_cast<double>(melody.spacing);
    event.frequency =
        AutomationProgram::constant(degreeFrequency(root, segmentDegree(segment.brightness)));
    event.filter = {FilterType::Lowpass, melody.cutoff, melody.q};
    if (melody.use_fm) {
      event.kind = EventKind::FmPair;
      event.duration = length;
      event.fm = {melody.fm_ratio, melody.fm_index};
      event.envelope = percussiveEnvelope(melody.fm_envelope, length);
    } else {
      event.kind = EventKind::Oscillator;
      event.duration = length + melody.tail;
      event.waveform = melody.waveform;
      event.envelope = percussiveEnvelope(melody.envelope, length);
    }
    event.noise = makeNoiseLayer(melody.noise_amount, length);
    push(std::move(event));
  }
}

void EventScheduler::emitLegatoMelody() {
  const LegatoMelodyParams& melody = params_.legato;
  const auto& segments = record_.segments;
  size_t count = segments.size();
  float root = params_.base_frequency * melody.octave;
  double spacing = melody.spacing;
  if (spacing <= 0.0 || count == 0) return;

  double attack = std::min(static_cast<double>(melody.attack), spacing);
  double sustain_end =
      std::clamp(std::max(attack + melody.hold_gap, spacing - melody.decay), attack, spacing);

  for (int idx = 0; idx < melody.note_count; ++idx) {
    size_t seg_idx = static_cast<size_t>(idx) % count;
    const Sample& segment = segments[seg_idx];

    SynthesisEvent event;
    event.kind = melody.use_fm ? EventKind::FmPair : EventKind::Oscillator;
    event.phase = SynthPhase::Melody;
    event.start_time = idx * spacing;
    event.duration = spacing + melody.tail;
    event.waveform = melody.waveform;
    event.frequency.initial = degreeFrequency(root, segmentDegree(segment.brightness));

    bool has_next = melody.glide_wraps || seg_idx + 1 < count;
    if (has_next) {
      const Sample& next = segments[(seg_idx + 1) % count];
      event.frequency.exponentialTo(spacing * melody.glide_fraction,
                                    degreeFrequency(root, segmentDegree(next.brightness)));
    }

    if (melody.vibrato) {
      event.vibrato.enabled = true;
      event.vibrato.rate = melody.vibrato_rate;
      event.vibrato.depth.initial = 0.0f;
      event.vibrato.depth.linearTo(std::min(static_cast<double>(melody.vibrato_fade), spacing),
                                   melody.vibrato_depth);
    }
    if (melody.use_fm) event.fm = {melody.fm_ratio, melody.fm_index};

    event.filter = {FilterType::Lowpass, melody.cutoff, melody.q};
    event.envelope.initial = 0.0f;
    event.envelope.linearTo(attack, melody.peak)
        .linearTo(sustain_end, melody.sustain)
        .linearTo(spacing, 0.0f);
    event.noise = makeNoiseLayer(melody.noise_amount, spacing);
    push(std::move(event));
  }
}

void EventScheduler::emitKick() {
  const KickParams& kick = params_.kick;
  int steps = loopSteps(total_duration_, params_.beat_length);
  double decay = std::min(kick.decay_time, kick.length);
  double sweep = std::min(kick.sweep_time, kick.length);

  for (int idx = 0; idx < steps; ++idx) {
    SynthesisEvent event;
    event.kind = EventKind::Oscillator;
    event.phase = SynthPhase::Percussion;
    event.start_time = idx * static_cast<double>(params_.beat_length);
    event.duration = kick.length;
    event.waveform = Waveform::Sine;
    event.frequency.initial = kick.start_frequency;
    event.frequency.exponentialTo(sweep, kick.end_frequency);
    event.envelope.initial = kick.volume;
    event.envelope.exponentialTo(decay, kKickFloor);
    if (kick.noise_amount > 0.0f) event.noise = makeNoiseLayer(kick.noise_amount, decay);
    push(std::move(event));
  }
}

void EventScheduler::emitHiHat() {
  const HiHatParams& hihat = params_.hihat;
  int steps = loopSteps(total_duration_, hihat.interval);

  for (int idx = 0; idx < steps; ++idx) {
    SynthesisEvent event;
    event.kind = EventKind::NoiseBurst;
    event.phase = SynthPhase::Percussion;
    event.start_time = idx * static_cast<double>(hihat.interval);
    event.duration = hihat.burst_length;
    event.burst.length = hihat.burst_length;
    event.burst.decay = hihat.burst_decay;
    event.filter = {FilterType::Highpass, hihat.cutoff, 1.0f};
    event.envelope.initial = hihat.volume;
    event.envelope.exponentialTo(hihat.burst_length, kHiHatFloor);
    push(std::move(event));
  }
}

void EventScheduler::emitPad() {
  const PadParams& pad = params_.pad;
  for (int degree : pad.degrees) {
    SynthesisEvent event;
    event.kind = EventKind::Oscillator;
    event.phase = SynthPhase::Pad;
    event.start_time = 0.0;
    event.duration = total_duration_;
    event.waveform = Waveform::Sine;
    event.frequency = AutomationProgram::constant(degreeFrequency(params_.base_frequency, degree));
    event.vibrato.enabled = true;
    event.vibrato.rate = pad.vibrato_rate;
    event.vibrato.depth = AutomationProgram::constant(pad.vibrato_depth);
    event.filter = {FilterType::Lowpass, pad.cutoff, 1.0f};
    event.envelope =
        fadeEnvelope(pad.level, pad.fade_in, pad.fade_out, pad.hold_gap, total_duration_);
    event.noise = makeNoiseLayer(pad.noise_amount, total_duration_);
    push(std::move(event));
  }
}

void EventScheduler::emitSustainedTone(const SustainedToneParams& tone, SynthPhase phase) {
  SynthesisEvent event;
  event.kind = EventKind::Oscillator;
  event.phase = phase;
  event.start_time = 0.0;
  event.duration = total_duration_;
  event.waveform = Waveform::Sine;
  event.frequency = AutomationProgram::constant(params_.base_frequency * tone.frequency_ratio);
  if (tone.lfo) {
    event.vibrato.enabled = true;
    event.vibrato.rate = tone.lfo_rate;
    event.vibrato.depth = AutomationProgram::constant(tone.lfo_depth);
  }
  event.filter = tone.filter;
  event.envelope =
      fadeEnvelope(tone.level, tone.fade_in, tone.fade_out, tone.hold_gap, total_duration_);
  event.noise = makeNoiseLayer(tone.noise_amount, total_duration_);
  push(std::move(event));
}

ScheduleResult schedule(const AnalysisRecord& record, SynthMode mode, double total_duration,
                        float master_volume, uint32_t seed) {
  ScheduleResult result;
  if (record.segments.empty()) {
    result.error_message = "Analysis record has no segment data";
    return result;
  }
  if (!(total_duration > 0.0)) {
    result.error_message = "Duration must be positive";
    return result;
  }
  if (total_duration > kMaxSessionDuration) {
    result.error_message = "Duration exceeds the maximum session length";
    return result;
  }

  auto mapper = createParamMapper(mode);
  PerformanceParams params = mapper->map(record, static_cast<float>(total_duration));

  EventScheduler scheduler(record, params, total_duration, seed);
  scheduler.run();

  result.session = scheduler.takeSession();
  result.session.master_volume = std::isnan(master_volume) ? 0.0f : clamp01(master_volume);
  result.success = true;

  trace("Scheduler", "%s %s intensity=%.2f duration=%.2fs events=%zu",
        performanceModeToString(result.session.performance), synthModeToString(mode),
        result.session.intensity, total_duration, result.session.events.size());
  return result;
}

}  // namespace shapesound
