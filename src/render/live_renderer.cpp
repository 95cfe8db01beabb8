// Implementation of PortAudio live playback.

#include "render/live_renderer.h"

#include <chrono>
#include <thread>

#include "core/trace_log.h"

namespace shapesound {

namespace {

constexpr unsigned long kFramesPerBuffer = 512;

}  // namespace

LiveRenderer::LiveRenderer(const SynthesisSession& session, uint32_t sample_rate,
                           uint16_t channels)
    : session_(session), sample_rate_(sample_rate), channels_(channels) {}

LiveRenderer::~LiveRenderer() { cancel(); }

bool LiveRenderer::start() {
  if (stream_ != nullptr) {
    error_message_ = "Playback already started";
    return false;
  }
  if (sample_rate_ == 0 || channels_ == 0) {
    error_message_ = "Sample rate and channel count must be positive";
    return false;
  }

  renderer_ = std::make_unique<VoiceRenderer>(session_, sample_rate_, channels_);
  finished_.store(renderer_->finished(), std::memory_order_release);

  PaError err = Pa_Initialize();
  if (err != paNoError) {
    error_message_ = std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err);
    return false;
  }
  initialized_ = true;

  err = Pa_OpenDefaultStream(&stream_, 0, channels_, paFloat32, sample_rate_, kFramesPerBuffer,
                             &LiveRenderer::streamCallback, this);
  if (err != paNoError) {
    error_message_ = std::string("Pa_OpenDefaultStream failed: ") + Pa_GetErrorText(err);
    stream_ = nullptr;
    cancel();
    return false;
  }

  err = Pa_StartStream(stream_);
  if (err != paNoError) {
    error_message_ = std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err);
    cancel();
    return false;
  }

  trace("Live", "playing %.2fs at %u Hz", session_.total_duration, sample_rate_);
  return true;
}

void LiveRenderer::cancel() {
  if (stream_ != nullptr) {
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) trace("Live", "Pa_StopStream: %s", Pa_GetErrorText(err));
    err = Pa_CloseStream(stream_);
    if (err != paNoError) trace("Live", "Pa_CloseStream: %s", Pa_GetErrorText(err));
    stream_ = nullptr;
  }
  if (initialized_) {
    Pa_Terminate();
    initialized_ = false;
  }
}

void LiveRenderer::waitUntilFinished(int poll_ms) const {
  while (stream_ != nullptr && !isFinished()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
  }
}

int LiveRenderer::streamCallback(const void* /*input*/, void* output, unsigned long frames,
                                 const PaStreamCallbackTimeInfo* /*time_info*/,
                                 PaStreamCallbackFlags /*status_flags*/, void* user_data) {
  auto* self = static_cast<LiveRenderer*>(user_data);
  self->renderer_->renderBlock(static_cast<float*>(output), frames);
  if (self->renderer_->finished()) {
    self->finished_.store(true, std::memory_order_release);
    return paComplete;
  }
  return paContinue;
}

}  // namespace shapesound
