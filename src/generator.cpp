// Unified generator implementation.

#include "generator.h"

#include <array>
#include <utility>

#include "core/json_helpers.h"
#include "core/rng_util.h"
#include "core/trace_log.h"
#include "render/offline_renderer.h"
#include "synth/scheduler.h"
#include "wav/wav_writer.h"

namespace shapesound {

namespace {

void writeProgram(JsonWriter& writer, const AutomationProgram& program) {
  writer.beginObject();
  writer.key("initial");
  writer.value(static_cast<double>(program.initial));
  writer.key("points");
  writer.beginArray();
  for (const auto& point : program.points) {
    writer.beginObject();
    writer.key("offset");
    writer.value(point.offset);
    writer.key("value");
    writer.value(static_cast<double>(point.value));
    writer.key("ramp");
    writer.value(rampTypeToString(point.ramp));
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

void writeEvent(JsonWriter& writer, const SynthesisEvent& event) {
  writer.beginObject();
  writer.key("kind");
  writer.value(eventKindToString(event.kind));
  writer.key("phase");
  writer.value(synthPhaseToString(event.phase));
  writer.key("start");
  writer.value(event.start_time);
  writer.key("duration");
  writer.value(event.duration);

  if (event.kind == EventKind::NoiseBurst) {
    writer.key("burst");
    writer.beginObject();
    writer.key("length");
    writer.value(event.burst.length);
    writer.key("decay");
    writer.value(static_cast<double>(event.burst.decay));
    writer.key("seed");
    writer.value(event.burst.seed);
    writer.endObject();
  } else {
    writer.key("waveform");
    writer.value(waveformToString(event.waveform));
    writer.key("frequency");
    writeProgram(writer, event.frequency);
  }

  if (event.kind == EventKind::FmPair) {
    writer.key("fm");
    writer.beginObject();
    writer.key("ratio");
    writer.value(static_cast<double>(event.fm.ratio));
    writer.key("index");
    writer.value(static_cast<double>(event.fm.index));
    writer.endObject();
  }

  if (event.vibrato.enabled) {
    writer.key("vibrato");
    writer.beginObject();
    writer.key("rate");
    writer.value(static_cast<double>(event.vibrato.rate));
    writer.key("depth");
    writeProgram(writer, event.vibrato.depth);
    writer.endObject();
  }

  writer.key("envelope");
  writeProgram(writer, event.envelope);

  writer.key("filter");
  writer.beginObject();
  writer.key("type");
  writer.value(filterTypeToString(event.filter.type));
  if (event.filter.type != FilterType::None) {
    writer.key("cutoff");
    writer.value(static_cast<double>(event.filter.cutoff));
    writer.key("q");
    writer.value(static_cast<double>(event.filter.q));
  }
  writer.endObject();

  if (event.noise.enabled) {
    writer.key("noise");
    writer.beginObject();
    writer.key("amount");
    writer.value(static_cast<double>(event.noise.amount));
    writer.key("gain");
    writer.value(static_cast<double>(event.noise.gain));
    writer.key("duration");
    writer.value(event.noise.duration);
    writer.key("seed");
    writer.value(event.noise.seed);
    writer.endObject();
  }

  writer.endObject();
}

template <size_t N>
void writeFloatArray(JsonWriter& writer, const std::array<float, N>& values) {
  writer.beginArray();
  for (float val : values) writer.value(static_cast<double>(val));
  writer.endArray();
}

void writeScaleMetrics(JsonWriter& writer, const ScaleMetrics& metrics) {
  writer.beginObject();
  writer.key("direction_clustering");
  writer.value(static_cast<double>(metrics.direction_clustering));
  writer.key("edge_contrast");
  writer.value(static_cast<double>(metrics.edge_contrast));
  writer.key("direction_change_sharpness");
  writer.value(static_cast<double>(metrics.direction_change_sharpness));
  writer.endObject();
}

void writeScaleWeights(JsonWriter& writer, const ScaleWeights& weights) {
  writer.beginObject();
  writer.key("fine");
  writer.value(static_cast<double>(weights.fine));
  writer.key("medium");
  writer.value(static_cast<double>(weights.medium));
  writer.key("coarse");
  writer.value(static_cast<double>(weights.coarse));
  writer.endObject();
}

}  // namespace

GeneratorResult generate(const PixelBuffer& pixels, const GeneratorConfig& config) {
  GeneratorResult result;

  // Auto-select seed if 0.
  result.seed_used = config.seed == 0 ? rng::generateRandomSeed() : config.seed;

  AnalysisResult analysis = analyze(pixels, config.sampling, result.seed_used);
  if (!analysis.success) {
    result.error_message = analysis.error_message;
    return result;
  }
  result.record = std::move(analysis.record);

  ScheduleResult scheduled =
      schedule(result.record, config.mode, config.duration, config.volume, result.seed_used);
  if (!scheduled.success) {
    result.error_message = scheduled.error_message;
    return result;
  }
  result.session = std::move(scheduled.session);

  trace("Generator", "seed=%u mode=%s performance=%s events=%zu", result.seed_used,
        synthModeToString(config.mode), performanceModeToString(result.session.performance),
        result.session.events.size());
  result.success = true;
  return result;
}

WavExportResult exportWav(const GeneratorResult& result, const GeneratorConfig& config) {
  WavExportResult exported;
  if (!result.success) {
    exported.error_message = "Generation did not succeed";
    return exported;
  }

  RenderConfig render_config;
  render_config.sample_rate = config.sample_rate;
  render_config.channels = config.channels;
  RenderResult rendered = renderOffline(result.session, render_config);
  if (!rendered.success) {
    exported.error_message = rendered.error_message;
    return exported;
  }

  WavWriter writer;
  if (!writer.build(rendered.samples, rendered.channels, rendered.sample_rate)) {
    exported.error_message = "Audio data exceeds the WAV size limit";
    return exported;
  }
  exported.bytes = writer.toBytes();
  exported.success = true;
  return exported;
}

std::string buildEventsJson(const GeneratorResult& result, const GeneratorConfig& config) {
  const SynthesisSession& session = result.session;
  JsonWriter writer;
  writer.beginObject();

  writer.key("seed");
  writer.value(result.seed_used);
  writer.key("mode");
  writer.value(synthModeToString(session.mode));
  writer.key("performance");
  writer.value(performanceModeToString(session.performance));
  writer.key("intensity");
  writer.value(static_cast<double>(session.intensity));
  writer.key("sampling");
  writer.value(samplingMethodToString(config.sampling));
  writer.key("duration");
  writer.value(session.total_duration);
  writer.key("volume");
  writer.value(static_cast<double>(session.master_volume));
  writer.key("sample_rate");
  writer.value(config.sample_rate);
  writer.key("event_count");
  writer.value(static_cast<int>(session.events.size()));

  writer.key("events");
  writer.beginArray();
  for (const auto& event : session.events) writeEvent(writer, event);
  writer.endArray();

  writer.endObject();
  return writer.toString();
}

std::string buildAnalysisJson(const AnalysisRecord& record) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("brightness");
  writer.value(static_cast<double>(record.brightness));
  writer.key("angularity");
  writer.value(static_cast<double>(record.angularity));
  writer.key("complexity");
  writer.value(static_cast<double>(record.complexity));
  writer.key("rhythm");
  writer.value(static_cast<double>(record.rhythm));
  writer.key("warmth");
  writer.value(static_cast<double>(record.warmth));
  writer.key("saturation");
  writer.value(static_cast<double>(record.saturation));
  writer.key("texture");
  writer.value(static_cast<double>(record.texture));
  writer.key("sampling");
  writer.value(samplingMethodToString(record.sampling_method));

  writer.key("segments");
  writer.beginArray();
  for (const auto& segment : record.segments) {
    writer.beginObject();
    writer.key("brightness");
    writer.value(static_cast<double>(segment.brightness));
    writer.key("angularity");
    writer.value(static_cast<double>(segment.angularity));
    writer.key("x");
    writer.value(segment.x);
    writer.key("y");
    writer.value(segment.y);
    writer.endObject();
  }
  writer.endArray();

  writer.key("histogram");
  writeFloatArray(writer, record.histogram);

  writer.key("color_histogram");
  writer.beginObject();
  writer.key("red");
  writeFloatArray(writer, record.color_histogram.red);
  writer.key("green");
  writeFloatArray(writer, record.color_histogram.green);
  writer.key("blue");
  writeFloatArray(writer, record.color_histogram.blue);
  writer.endObject();

  const AngularityResult& metrics = record.angularity_metrics;
  writer.key("angularity_metrics");
  writer.beginObject();
  writer.key("direction_clustering");
  writer.value(static_cast<double>(metrics.blended.direction_clustering));
  writer.key("edge_contrast");
  writer.value(static_cast<double>(metrics.blended.edge_contrast));
  writer.key("direction_change_sharpness");
  writer.value(static_cast<double>(metrics.blended.direction_change_sharpness));
  writer.key("multi_scale");
  writer.value(metrics.multi_scale);
  if (metrics.multi_scale) {
    writer.key("fine");
    writeScaleMetrics(writer, metrics.fine);
    writer.key("medium");
    writeScaleMetrics(writer, metrics.medium);
    writer.key("coarse");
    writeScaleMetrics(writer, metrics.coarse);
    writer.key("direction_weights");
    writeScaleWeights(writer, metrics.direction_weights);
    writer.key("contrast_weights");
    writeScaleWeights(writer, metrics.contrast_weights);
  }
  writer.endObject();

  writer.endObject();
  return writer.toString();
}

}  // namespace shapesound
