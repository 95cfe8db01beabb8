// Audio event scheduler: turns performance parameters into a timed session.

#ifndef SHAPESOUND_SYNTH_SCHEDULER_H
#define SHAPESOUND_SYNTH_SCHEDULER_H

#include <cstdint>
#include <string>
#include <utility>

#include "core/basic_types.h"
#include "image/feature_extractor.h"
#include "synth/param_mapper.h"
#include "synth/synthesis_event.h"

namespace shapesound {

/// Longest session the scheduler accepts, in seconds.
constexpr double kMaxSessionDuration = 600.0;

/// Noise amounts below this produce no noise layer.
constexpr float kNoiseAmountThreshold = 0.05f;

/// @brief Result of schedule().
struct ScheduleResult {
  SynthesisSession session;
  bool success = false;
  std::string error_message;
};

/// @brief Builds the events of one performance, one phase at a time.
///
/// State moves Idle -> Building (Bass, Melody, Percussion, Pad) -> Complete.
/// Each step() emits the events of the next phase; the session is sorted by
/// start time (stable, so ties keep emission order) when the last phase is
/// done. Every envelope breakpoint lies within [0, event duration].
class EventScheduler {
 public:
  enum class State : uint8_t { Idle, Building, Complete };

  /// @param record Analysis record; its segments drive the melody.
  /// @param params Parameters from a ParamMapper.
  /// @param total_duration Session length in seconds (> 0).
  /// @param seed Session seed; noise layers derive their seeds from it.
  EventScheduler(const AnalysisRecord& record, const PerformanceParams& params,
                 double total_duration, uint32_t seed);

  /// @brief Emit the next phase. Returns false once the session is complete.
  bool step();

  /// @brief Run all remaining phases.
  void run();

  State state() const { return state_; }

  /// @brief Phase emitted by the most recent step().
  SynthPhase currentPhase() const { return phase_; }

  /// @brief The session (complete and sorted once state() is Complete).
  const SynthesisSession& session() const { return session_; }
  SynthesisSession takeSession() { return std::move(session_); }

 private:
  void emitPhase(SynthPhase phase);
  void emitBassLine();
  void emitStaccatoMelody();
  void emitLegatoMelody();
  void emitKick();
  void emitHiHat();
  void emitPad();
  void emitSustainedTone(const SustainedToneParams& tone, SynthPhase phase);

  NoiseLayer makeNoiseLayer(float amount, double duration) const;
  void push(SynthesisEvent event);

  const AnalysisRecord& record_;
  const PerformanceParams& params_;
  double total_duration_;
  uint32_t seed_;
  uint32_t next_event_index_ = 0;
  State state_ = State::Idle;
  SynthPhase phase_ = SynthPhase::Bass;
  SynthesisSession session_;
};

/// @brief Gain program: peak after an optional linear attack, then an
/// exponential fall to `envelope.floor` at `length`. The attack is clamped
/// to half of `length`.
AutomationProgram percussiveEnvelope(const PercussiveEnvelope& envelope, double length);

/// @brief Gain program: linear fade in, hold, linear fade out to 0 at `duration`.
/// Fade in is clamped to `duration`; the hold ends at
/// max(fade_in + hold_gap, duration - fade_out), clamped to [fade_in, duration].
AutomationProgram fadeEnvelope(float level, double fade_in, double fade_out, double hold_gap,
                               double duration);

/// @brief Map `record` with the strategy for `mode` and schedule the session.
///
/// @param record Analysis record (must carry segment data).
/// @param mode Legacy or continuous mapping.
/// @param total_duration Seconds, in (0, kMaxSessionDuration].
/// @param master_volume Clamped to [0,1].
/// @param seed Noise seed (used as given; 0 is a valid seed here).
/// @return ScheduleResult; success is false for a record without segments
///         or an out-of-range duration.
ScheduleResult schedule(const AnalysisRecord& record, SynthMode mode, double total_duration,
                        float master_volume, uint32_t seed);

}  // namespace shapesound

#endif  // SHAPESOUND_SYNTH_SCHEDULER_H
