/// @file
/// @brief CLI entry point for the shapesound image-to-audio generator.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>

#include "core/basic_types.h"
#include "core/trace_log.h"
#include "generator.h"
#include "image/ppm_reader.h"
#include "render/offline_renderer.h"
#include "wav/wav_writer.h"

#ifdef SHAPESOUND_HAS_PORTAUDIO
#include "render/live_renderer.h"
#endif

namespace {

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::string input;
  std::string output = "output.wav";
  shapesound::SamplingMethod sampling = shapesound::SamplingMethod::Brightness;
  shapesound::SynthMode mode = shapesound::SynthMode::V2;
  double duration = 5.0;
  float volume = 0.5f;
  uint32_t seed = 0;
  bool json_output = false;
  bool play = false;
  bool verbose = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("shapesound_cli - Bouba/Kiki image sonification\n\n");
  std::printf("Usage: shapesound_cli --input IMAGE.ppm [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --input FILE     Binary PPM (P6) or PGM (P5) image\n");
  std::printf("  --sampling M     Sampling: brightness, edges, scattered (random), regions\n");
  std::printf("  --mode MODE      Synthesis mode: legacy (discrete), v2 (continuous)\n");
  std::printf("  --duration SEC   Session length in seconds (default 5)\n");
  std::printf("  --volume V       Master volume 0-1 (default 0.5)\n");
  std::printf("  --seed N         Random seed (0 = auto)\n");
  std::printf("  --json           Write events and analysis JSON next to the WAV\n");
#ifdef SHAPESOUND_HAS_PORTAUDIO
  std::printf("  --play           Play the session on the default output device\n");
#endif
  std::printf("  --verbose        Trace analysis and scheduling to stderr\n");
  std::printf("  -o FILE          Output WAV path (default output.wav)\n");
  std::printf("  --help           Show this help\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @param exit_code Set when the caller should exit (help or bad value).
/// @return False if the caller should exit with `exit_code`.
bool parseArgs(int argc, char* argv[], CliOptions& opts, int& exit_code) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      exit_code = 0;
      return false;
    }
    if (std::strcmp(argv[idx], "--input") == 0 && idx + 1 < argc) {
      opts.input = argv[++idx];
    } else if (std::strcmp(argv[idx], "-o") == 0 && idx + 1 < argc) {
      opts.output = argv[++idx];
    } else if (std::strcmp(argv[idx], "--sampling") == 0 && idx + 1 < argc) {
      auto method = shapesound::samplingMethodFromString(argv[++idx]);
      if (!method) {
        std::fprintf(stderr, "Error: unknown sampling method '%s'\n", argv[idx]);
        exit_code = 1;
        return false;
      }
      opts.sampling = *method;
    } else if (std::strcmp(argv[idx], "--mode") == 0 && idx + 1 < argc) {
      auto mode = shapesound::synthModeFromString(argv[++idx]);
      if (!mode) {
        std::fprintf(stderr, "Error: unknown mode '%s'\n", argv[idx]);
        exit_code = 1;
        return false;
      }
      opts.mode = *mode;
    } else if (std::strcmp(argv[idx], "--duration") == 0 && idx + 1 < argc) {
      opts.duration = std::atof(argv[++idx]);
    } else if (std::strcmp(argv[idx], "--volume") == 0 && idx + 1 < argc) {
      opts.volume = static_cast<float>(std::atof(argv[++idx]));
    } else if (std::strcmp(argv[idx], "--seed") == 0 && idx + 1 < argc) {
      opts.seed = static_cast<uint32_t>(std::strtoul(argv[++idx], nullptr, 10));
    } else if (std::strcmp(argv[idx], "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(argv[idx], "--play") == 0) {
      opts.play = true;
    } else if (std::strcmp(argv[idx], "--verbose") == 0) {
      opts.verbose = true;
    }
  }
  return true;
}

/// @brief Replace the extension of `path` with `suffix`.
std::string sidecarPath(const std::string& path, const char* suffix) {
  auto dot_pos = path.rfind('.');
  if (dot_pos != std::string::npos) return path.substr(0, dot_pos) + suffix;
  return path + suffix;
}

void writeJsonFile(const std::string& path, const std::string& json, const char* label) {
  std::ofstream json_file(path);
  if (json_file.is_open()) {
    json_file << json;
    json_file.close();
    std::printf("%-11s%s\n", label, path.c_str());
  } else {
    std::fprintf(stderr, "Warning: failed to write %s\n", path.c_str());
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  int exit_code = 0;
  if (!parseArgs(argc, argv, opts, exit_code)) {
    return exit_code;
  }
  if (opts.input.empty()) {
    std::fprintf(stderr, "Error: --input is required\n");
    printUsage();
    return 1;
  }
  shapesound::setTraceEnabled(opts.verbose);

  shapesound::GeneratorConfig config;
  config.sampling = opts.sampling;
  config.mode = opts.mode;
  config.duration = opts.duration;
  config.volume = opts.volume;
  config.seed = opts.seed;

  std::printf("shapesound_cli v0.1.0\n");
  std::printf("Input:      %s\n", opts.input.c_str());
  std::printf("Sampling:   %s\n", shapesound::samplingMethodToString(config.sampling));
  std::printf("Mode:       %s\n", shapesound::synthModeToString(config.mode));
  std::printf("Duration:   %.2f s\n", config.duration);
  std::printf("Volume:     %.2f\n", static_cast<double>(config.volume));
  std::printf("Seed:       %u%s\n", config.seed, config.seed == 0 ? " (auto)" : "");
  std::printf("\n");

  shapesound::PpmReadResult image = shapesound::readPpmFile(opts.input);
  if (!image.success) {
    std::fprintf(stderr, "Error: %s\n", image.error_message.c_str());
    return 1;
  }

  shapesound::GeneratorResult result = shapesound::generate(image.buffer, config);
  if (!result.success) {
    std::fprintf(stderr, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  std::printf("Image:      %dx%d\n", image.buffer.width, image.buffer.height);
  std::printf("Angularity: %.3f\n", static_cast<double>(result.record.angularity));
  std::printf("Brightness: %.3f\n", static_cast<double>(result.record.brightness));
  std::printf("Performance:%s (intensity %.2f)\n",
              shapesound::performanceModeToString(result.session.performance),
              static_cast<double>(result.session.intensity));
  std::printf("Events:     %zu\n", result.session.events.size());
  std::printf("Seed used:  %u\n", result.seed_used);

  shapesound::RenderConfig render_config;
  render_config.sample_rate = config.sample_rate;
  render_config.channels = config.channels;
  shapesound::RenderResult rendered = shapesound::renderOffline(result.session, render_config);
  if (!rendered.success) {
    std::fprintf(stderr, "Error: %s\n", rendered.error_message.c_str());
    return 1;
  }

  shapesound::WavWriter writer;
  if (!writer.build(rendered.samples, rendered.channels, rendered.sample_rate)) {
    std::fprintf(stderr, "Error: audio data exceeds the WAV size limit\n");
    return 1;
  }
  if (!writer.writeToFile(opts.output)) {
    std::fprintf(stderr, "Error: failed to write %s\n", opts.output.c_str());
    return 1;
  }
  std::printf("\nOutput:     %s\n", opts.output.c_str());

  if (opts.json_output) {
    writeJsonFile(sidecarPath(opts.output, ".json"), shapesound::buildEventsJson(result, config),
                  "JSON:");
    writeJsonFile(sidecarPath(opts.output, "_analysis.json"),
                  shapesound::buildAnalysisJson(result.record), "Analysis:");
  }

  if (opts.play) {
#ifdef SHAPESOUND_HAS_PORTAUDIO
    shapesound::LiveRenderer live(result.session, config.sample_rate, config.channels);
    if (!live.start()) {
      std::fprintf(stderr, "Error: %s\n", live.errorMessage().c_str());
      return 1;
    }
    std::printf("Playing...\n");
    live.waitUntilFinished();
    live.cancel();
#else
    std::fprintf(stderr, "Warning: built without PortAudio, --play ignored\n");
#endif
  }

  return 0;
}
