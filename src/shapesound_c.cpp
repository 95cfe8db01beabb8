// Implementation of C API for FFI bindings.

#include "shapesound_c.h"

#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/json_parser.h"
#include "generator.h"
#include "image/pixel_buffer.h"
#include "render/offline_renderer.h"
#include "synth/scheduler.h"
#include "wav/wav_writer.h"

namespace {

constexpr const char* kVersion = "0.1.0";
constexpr uint8_t kSamplingCount = 4;
constexpr uint8_t kModeCount = 2;

/// @brief Internal state held per ShapesoundHandle.
struct ShapesoundInstance {
  shapesound::GeneratorConfig config;
  shapesound::GeneratorResult result;
  std::vector<uint8_t> wav_bytes;
  std::string events_json;
  std::string analysis_json;
  std::string error_message;
  bool has_result = false;
};

/// @brief Parse a GeneratorConfig from a JSON key-value map.
/// @return SHAPESOUND_OK, or the code of the first unrecognized field value.
ShapesoundError configFromJson(const std::map<std::string, shapesound::JsonValue>& kv,
                               shapesound::GeneratorConfig& config) {
  auto it = kv.find("sampling");
  if (it != kv.end()) {
    auto method = shapesound::samplingMethodFromString(it->second.asString());
    if (!method) return SHAPESOUND_ERROR_INVALID_SAMPLING;
    config.sampling = *method;
  }

  it = kv.find("mode");
  if (it != kv.end()) {
    auto mode = shapesound::synthModeFromString(it->second.asString());
    if (!mode) return SHAPESOUND_ERROR_INVALID_MODE;
    config.mode = *mode;
  }

  it = kv.find("duration");
  if (it != kv.end()) {
    config.duration = it->second.asDouble(config.duration);
  }

  it = kv.find("volume");
  if (it != kv.end()) {
    config.volume = static_cast<float>(it->second.asDouble(config.volume));
  }

  it = kv.find("seed");
  if (it != kv.end()) {
    config.seed = it->second.asUint(0);
  }

  it = kv.find("sample_rate");
  if (it != kv.end()) {
    config.sample_rate = it->second.asUint(config.sample_rate);
  }

  it = kv.find("channels");
  if (it != kv.end()) {
    uint32_t channels = it->second.asUint(config.channels);
    config.channels = channels > 0xFFFFu ? 0xFFFFu : static_cast<uint16_t>(channels);
  }

  return SHAPESOUND_OK;
}

/// @brief Validate a GeneratorConfig and return an error code.
ShapesoundError validateConfig(const shapesound::GeneratorConfig& config) {
  if (!(config.duration > 0.0) || config.duration > shapesound::kMaxSessionDuration) {
    return SHAPESOUND_ERROR_INVALID_PARAM;
  }
  if (config.sample_rate == 0 || config.sample_rate > shapesound::kMaxSampleRate) {
    return SHAPESOUND_ERROR_INVALID_PARAM;
  }
  if (config.channels == 0 || config.channels > shapesound::kMaxChannels) {
    return SHAPESOUND_ERROR_INVALID_PARAM;
  }
  return SHAPESOUND_OK;
}

ShapesoundJsonData* copyJson(const std::string& text) {
  auto* result = static_cast<ShapesoundJsonData*>(malloc(sizeof(ShapesoundJsonData)));
  if (!result) return nullptr;

  result->length = text.size();
  result->json = static_cast<char*>(malloc(result->length + 1));
  if (!result->json) {
    free(result);
    return nullptr;
  }

  memcpy(result->json, text.c_str(), result->length + 1);
  return result;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

ShapesoundHandle shapesound_create(void) {
  return new ShapesoundInstance();
}

void shapesound_destroy(ShapesoundHandle handle) {
  delete static_cast<ShapesoundInstance*>(handle);
}

// ============================================================================
// Generation
// ============================================================================

ShapesoundError shapesound_generate_from_json(ShapesoundHandle handle, const uint8_t* rgba,
                                              uint32_t width, uint32_t height, const char* json,
                                              size_t length) {
  if (!handle) {
    return SHAPESOUND_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<ShapesoundInstance*>(handle);
  instance->has_result = false;
  instance->error_message.clear();

  if (!rgba || width == 0 || height == 0) {
    instance->error_message = "Image has zero width or height";
    return SHAPESOUND_ERROR_INVALID_IMAGE;
  }

  // Parse JSON config
  instance->config = shapesound::GeneratorConfig();
  auto kv = shapesound::parseJsonObject(json, json ? length : 0);
  ShapesoundError err = configFromJson(kv, instance->config);
  if (err == SHAPESOUND_OK) err = validateConfig(instance->config);
  if (err != SHAPESOUND_OK) {
    instance->error_message = shapesound_error_string(err);
    return err;
  }

  shapesound::PixelBuffer pixels;
  pixels.width = static_cast<int>(width);
  pixels.height = static_cast<int>(height);
  pixels.data.assign(rgba, rgba + static_cast<size_t>(width) * height * 4);

  // Generate
  instance->result = shapesound::generate(pixels, instance->config);
  if (!instance->result.success) {
    instance->error_message = instance->result.error_message;
    return SHAPESOUND_ERROR_GENERATION_FAILED;
  }

  // Render WAV bytes
  shapesound::WavExportResult wav = shapesound::exportWav(instance->result, instance->config);
  if (!wav.success) {
    instance->error_message = wav.error_message;
    return SHAPESOUND_ERROR_RENDER_FAILED;
  }
  instance->wav_bytes = std::move(wav.bytes);

  instance->events_json = shapesound::buildEventsJson(instance->result, instance->config);
  instance->analysis_json = shapesound::buildAnalysisJson(instance->result.record);

  instance->has_result = true;
  return SHAPESOUND_OK;
}

// ============================================================================
// Output Retrieval
// ============================================================================

ShapesoundWavData* shapesound_get_wav(ShapesoundHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<ShapesoundInstance*>(handle);
  if (!instance->has_result || instance->wav_bytes.empty()) return nullptr;

  auto* result = static_cast<ShapesoundWavData*>(malloc(sizeof(ShapesoundWavData)));
  if (!result) return nullptr;

  result->size = instance->wav_bytes.size();
  result->data = static_cast<uint8_t*>(malloc(result->size));
  if (!result->data) {
    free(result);
    return nullptr;
  }

  memcpy(result->data, instance->wav_bytes.data(), result->size);
  return result;
}

void shapesound_free_wav(ShapesoundWavData* data) {
  if (data) {
    free(data->data);
    free(data);
  }
}

ShapesoundJsonData* shapesound_get_events(ShapesoundHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<ShapesoundInstance*>(handle);
  if (!instance->has_result) return nullptr;
  return copyJson(instance->events_json);
}

ShapesoundJsonData* shapesound_get_analysis(ShapesoundHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<ShapesoundInstance*>(handle);
  if (!instance->has_result) return nullptr;
  return copyJson(instance->analysis_json);
}

void shapesound_free_json(ShapesoundJsonData* data) {
  if (data) {
    free(data->json);
    free(data);
  }
}

// Static buffer for info queries
static ShapesoundInfo s_info;

ShapesoundInfo* shapesound_get_info(ShapesoundHandle handle) {
  s_info = {};
  if (!handle) return &s_info;

  auto* instance = static_cast<ShapesoundInstance*>(handle);
  if (!instance->has_result) return &s_info;

  const auto& session = instance->result.session;
  s_info.angularity = instance->result.record.angularity;
  s_info.intensity = session.intensity;
  s_info.performance = session.performance == shapesound::PerformanceMode::Kiki ? 1 : 0;
  s_info.event_count = static_cast<uint32_t>(session.events.size());
  size_t frame_bytes = static_cast<size_t>(instance->config.channels) * 2;
  s_info.total_frames =
      static_cast<uint32_t>((instance->wav_bytes.size() - shapesound::kWavHeaderSize) / frame_bytes);
  s_info.sample_rate = instance->config.sample_rate;
  s_info.seed_used = instance->result.seed_used;

  return &s_info;
}

const char* shapesound_last_error_message(ShapesoundHandle handle) {
  if (!handle) return "";
  return static_cast<ShapesoundInstance*>(handle)->error_message.c_str();
}

// ============================================================================
// Enumeration
// ============================================================================

uint8_t shapesound_sampling_count(void) {
  return kSamplingCount;
}

const char* shapesound_sampling_name(uint8_t id) {
  if (id >= kSamplingCount) return "";
  return shapesound::samplingMethodToString(static_cast<shapesound::SamplingMethod>(id));
}

uint8_t shapesound_mode_count(void) {
  return kModeCount;
}

const char* shapesound_mode_name(uint8_t id) {
  if (id >= kModeCount) return "";
  return shapesound::synthModeToString(static_cast<shapesound::SynthMode>(id));
}

// ============================================================================
// Error Handling
// ============================================================================

const char* shapesound_error_string(ShapesoundError error) {
  switch (error) {
    case SHAPESOUND_OK:
      return "OK";
    case SHAPESOUND_ERROR_INVALID_PARAM:
      return "Invalid parameter";
    case SHAPESOUND_ERROR_INVALID_IMAGE:
      return "Invalid image";
    case SHAPESOUND_ERROR_INVALID_SAMPLING:
      return "Invalid sampling method";
    case SHAPESOUND_ERROR_INVALID_MODE:
      return "Invalid synthesis mode";
    case SHAPESOUND_ERROR_GENERATION_FAILED:
      return "Generation failed";
    case SHAPESOUND_ERROR_RENDER_FAILED:
      return "Rendering failed";
  }
  return "Unknown error";
}

// ============================================================================
// Utilities
// ============================================================================

const char* shapesound_version(void) {
  return kVersion;
}

}  // extern "C"
