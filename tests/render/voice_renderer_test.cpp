// Tests for render/voice_renderer.h -- block rendering of synthesis events.

#include "render/voice_renderer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "core/math_utils.h"
#include "synth/scheduler.h"

namespace shapesound {
namespace {

constexpr uint32_t kRate = 8000;

SynthesisEvent makeTone(double start, double duration, float freq, float level) {
  SynthesisEvent event;
  event.kind = EventKind::Oscillator;
  event.waveform = Waveform::Sine;
  event.start_time = start;
  event.duration = duration;
  event.frequency = AutomationProgram::constant(freq);
  event.envelope = AutomationProgram::constant(level);
  return event;
}

SynthesisSession makeSession(double total, std::vector<SynthesisEvent> events) {
  SynthesisSession session;
  session.total_duration = total;
  session.master_volume = 1.0f;
  session.events = std::move(events);
  return session;
}

AnalysisRecord makeRecord(float angularity) {
  AnalysisRecord record;
  record.angularity = angularity;
  record.brightness = 0.5f;
  record.texture = 0.6f;
  record.saturation = 0.4f;
  for (int idx = 0; idx < 16; ++idx) {
    Sample sample;
    sample.brightness = static_cast<float>((idx * 7) % 16) / 15.0f;
    sample.angularity = angularity;
    record.segments.push_back(sample);
  }
  return record;
}

std::vector<float> renderAll(const SynthesisSession& session, uint16_t channels,
                             size_t block) {
  VoiceRenderer renderer(session, kRate, channels);
  std::vector<float> out(static_cast<size_t>(renderer.totalFrames()) * channels, 0.0f);
  size_t done = 0;
  size_t total = static_cast<size_t>(renderer.totalFrames());
  while (done < total) {
    size_t frames = std::min(block, total - done);
    renderer.renderBlock(out.data() + done * channels, frames);
    done += frames;
  }
  return out;
}

// ---------------------------------------------------------------------------
// Oscillators and noise
// ---------------------------------------------------------------------------

TEST(VoiceRendererTest, OscillatorShapes) {
  EXPECT_NEAR(oscillatorSample(Waveform::Sine, 0.0), 0.0f, 1e-6f);
  EXPECT_NEAR(oscillatorSample(Waveform::Sine, 0.25), 1.0f, 1e-6f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Square, 0.1), 1.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Square, 0.6), -1.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Sawtooth, 0.0), -1.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Sawtooth, 0.5), 0.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Triangle, 0.25), 1.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Triangle, 0.5), 0.0f);
  EXPECT_FLOAT_EQ(oscillatorSample(Waveform::Triangle, 0.75), -1.0f);
}

TEST(VoiceRendererTest, WhiteNoiseIsBoundedAndDeterministic) {
  double sum = 0.0;
  for (uint64_t idx = 0; idx < 10000; ++idx) {
    float value = whiteNoise(42, idx);
    EXPECT_GE(value, -1.0f);
    EXPECT_LE(value, 1.0f);
    EXPECT_FLOAT_EQ(value, whiteNoise(42, idx));
    sum += value;
  }
  EXPECT_NEAR(sum / 10000.0, 0.0, 0.05);
}

TEST(VoiceRendererTest, WhiteNoiseDependsOnSeed) {
  int differing = 0;
  for (uint64_t idx = 0; idx < 64; ++idx) {
    if (whiteNoise(1, idx) != whiteNoise(2, idx)) ++differing;
  }
  EXPECT_GT(differing, 60);
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

TEST(VoiceRendererTest, TotalFramesFloorsDuration) {
  SynthesisSession session = makeSession(1.23456, {});
  VoiceRenderer renderer(session, kRate, 2);
  EXPECT_EQ(renderer.totalFrames(), static_cast<uint64_t>(std::floor(1.23456 * kRate)));
  EXPECT_EQ(renderer.sampleRate(), kRate);
  EXPECT_EQ(renderer.channels(), 2u);
}

TEST(VoiceRendererTest, SingleSineMatchesOscillator) {
  SynthesisSession session = makeSession(0.5, {makeTone(0.0, 0.5, 440.0f, 0.5f)});
  std::vector<float> out = renderAll(session, 1, 4000);
  ASSERT_EQ(out.size(), 4000u);
  for (size_t idx = 0; idx < 32; ++idx) {
    double phase = static_cast<double>(idx) * 440.0 / kRate;
    phase -= std::floor(phase);
    EXPECT_NEAR(out[idx], 0.5f * std::sin(2.0 * kPi * phase), 1e-4f) << "frame " << idx;
  }
}

TEST(VoiceRendererTest, EventIsSilentOutsideItsSpan) {
  SynthesisSession session = makeSession(1.0, {makeTone(0.25, 0.25, 300.0f, 1.0f)});
  std::vector<float> out = renderAll(session, 1, 256);
  for (size_t idx = 0; idx < 2000; ++idx) EXPECT_FLOAT_EQ(out[idx], 0.0f);
  for (size_t idx = 4000; idx < out.size(); ++idx) EXPECT_FLOAT_EQ(out[idx], 0.0f);
  float peak = 0.0f;
  for (size_t idx = 2000; idx < 4000; ++idx) peak = std::max(peak, std::fabs(out[idx]));
  EXPECT_GT(peak, 0.9f);
}

TEST(VoiceRendererTest, MasterVolumeScalesOutput) {
  SynthesisSession loud = makeSession(0.2, {makeTone(0.0, 0.2, 200.0f, 1.0f)});
  SynthesisSession quiet = loud;
  quiet.master_volume = 0.25f;
  std::vector<float> a = renderAll(loud, 1, 512);
  std::vector<float> b = renderAll(quiet, 1, 512);
  ASSERT_EQ(a.size(), b.size());
  for (size_t idx = 0; idx < a.size(); ++idx) EXPECT_NEAR(b[idx], a[idx] * 0.25f, 1e-6f);
}

TEST(VoiceRendererTest, ChannelsCarryTheSameSignal) {
  SynthesisSession session = makeSession(0.3, {makeTone(0.0, 0.3, 330.0f, 0.8f)});
  std::vector<float> out = renderAll(session, 2, 300);
  for (size_t frame = 0; frame + 1 < out.size() / 2; ++frame) {
    EXPECT_FLOAT_EQ(out[frame * 2], out[frame * 2 + 1]);
  }
}

TEST(VoiceRendererTest, BlockSizeDoesNotChangeOutput) {
  ScheduleResult scheduled = schedule(makeRecord(0.8f), SynthMode::V2, 2.0, 0.7f, 99);
  ASSERT_TRUE(scheduled.success);
  std::vector<float> whole = renderAll(scheduled.session, 1, 1u << 20);
  std::vector<float> small = renderAll(scheduled.session, 1, 37);
  ASSERT_EQ(whole.size(), small.size());
  for (size_t idx = 0; idx < whole.size(); ++idx) {
    ASSERT_FLOAT_EQ(whole[idx], small[idx]) << "frame " << idx;
  }
}

TEST(VoiceRendererTest, RendersSilenceAfterTheEnd) {
  SynthesisSession session = makeSession(0.1, {makeTone(0.0, 5.0, 220.0f, 1.0f)});
  VoiceRenderer renderer(session, kRate, 1);
  std::vector<float> block(static_cast<size_t>(renderer.totalFrames()));
  renderer.renderBlock(block.data(), block.size());
  EXPECT_TRUE(renderer.finished());

  std::vector<float> tail(128, 1.0f);
  renderer.renderBlock(tail.data(), tail.size());
  for (float value : tail) EXPECT_FLOAT_EQ(value, 0.0f);
  EXPECT_EQ(renderer.position(), block.size() + tail.size());
}

TEST(VoiceRendererTest, NoiseBurstDecays) {
  SynthesisEvent burst;
  burst.kind = EventKind::NoiseBurst;
  burst.start_time = 0.0;
  burst.duration = 0.1;
  burst.burst.length = 0.1;
  burst.burst.decay = 0.1f;
  burst.burst.seed = 5;
  burst.envelope = AutomationProgram::constant(1.0f);
  SynthesisSession session = makeSession(0.1, {burst});
  std::vector<float> out = renderAll(session, 1, 64);

  auto energy = [&out](size_t first, size_t last) {
    double sum = 0.0;
    for (size_t idx = first; idx < last; ++idx) sum += out[idx] * out[idx];
    return sum;
  };
  EXPECT_GT(energy(0, 100), 10.0 * energy(600, 700));
}

TEST(VoiceRendererTest, OutputStaysFiniteForGeneratedSessions) {
  for (float angularity : {0.0f, 0.3f, 0.6f, 1.0f}) {
    for (SynthMode mode : {SynthMode::Legacy, SynthMode::V2}) {
      ScheduleResult scheduled = schedule(makeRecord(angularity), mode, 1.5, 1.0f, 3);
      ASSERT_TRUE(scheduled.success);
      std::vector<float> out = renderAll(scheduled.session, 1, 512);
      for (float value : out) ASSERT_TRUE(std::isfinite(value));
    }
  }
}

}  // namespace
}  // namespace shapesound
