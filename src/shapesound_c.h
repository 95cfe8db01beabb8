// C API for FFI bindings.

#ifndef SHAPESOUND_C_H
#define SHAPESOUND_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a shapesound generator instance.
typedef void* ShapesoundHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  SHAPESOUND_OK = 0,
  SHAPESOUND_ERROR_INVALID_PARAM = 1,
  SHAPESOUND_ERROR_INVALID_IMAGE = 2,
  SHAPESOUND_ERROR_INVALID_SAMPLING = 3,
  SHAPESOUND_ERROR_INVALID_MODE = 4,
  SHAPESOUND_ERROR_GENERATION_FAILED = 5,
  SHAPESOUND_ERROR_RENDER_FAILED = 6,
} ShapesoundError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief WAV binary output.
typedef struct {
  uint8_t* data;  ///< RIFF/WAVE bytes
  size_t size;    ///< Size in bytes
} ShapesoundWavData;

/// @brief JSON text output (events or analysis).
typedef struct {
  char* json;     ///< JSON string
  size_t length;  ///< String length
} ShapesoundJsonData;

/// @brief Generation info.
typedef struct {
  float angularity;        ///< Image angularity (0..1)
  float intensity;         ///< Performance intensity (0..1)
  uint8_t performance;     ///< 0 = bouba, 1 = kiki
  uint32_t event_count;    ///< Number of scheduled events
  uint32_t total_frames;   ///< Rendered length in frames
  uint32_t sample_rate;    ///< Sample rate used
  uint32_t seed_used;      ///< Seed used for generation
} ShapesoundInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new generator instance.
/// @return Handle (must be freed with shapesound_destroy)
ShapesoundHandle shapesound_create(void);

/// @brief Destroy a generator instance.
/// @param handle Handle to destroy
void shapesound_destroy(ShapesoundHandle handle);

// ============================================================================
// Generation
// ============================================================================

/// @brief Analyze an RGBA image and render its performance.
///
/// JSON fields (all optional, defaults applied):
///   sampling: string ("brightness", "edges", "scattered"/"random", "regions")
///   mode: string ("legacy", "v2")
///   duration: number (seconds, 0 < duration <= 600, default 5)
///   volume: number (0-1, default 0.5)
///   seed: number (0 = random)
///   sample_rate: number (default 44100)
///   channels: number (default 2)
///
/// @param handle Generator handle
/// @param rgba Row-major RGBA pixels (width * height * 4 bytes)
/// @param width Image width in pixels
/// @param height Image height in pixels
/// @param json JSON config string (may be NULL for defaults)
/// @param length Length of the JSON string
/// @return SHAPESOUND_OK on success
ShapesoundError shapesound_generate_from_json(ShapesoundHandle handle, const uint8_t* rgba,
                                              uint32_t width, uint32_t height, const char* json,
                                              size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get rendered WAV data.
/// @param handle Generator handle
/// @return WavData (must be freed with shapesound_free_wav)
ShapesoundWavData* shapesound_get_wav(ShapesoundHandle handle);

/// @brief Free WAV data.
/// @param data Pointer returned by shapesound_get_wav
void shapesound_free_wav(ShapesoundWavData* data);

/// @brief Get the scheduled events as JSON.
/// @param handle Generator handle
/// @return JsonData (must be freed with shapesound_free_json)
ShapesoundJsonData* shapesound_get_events(ShapesoundHandle handle);

/// @brief Get the image analysis record as JSON.
/// @param handle Generator handle
/// @return JsonData (must be freed with shapesound_free_json)
ShapesoundJsonData* shapesound_get_analysis(ShapesoundHandle handle);

/// @brief Free JSON data.
/// @param data Pointer returned by shapesound_get_events or shapesound_get_analysis
void shapesound_free_json(ShapesoundJsonData* data);

/// @brief Get generation info.
/// @param handle Generator handle
/// @return Pointer to static ShapesoundInfo (valid until next call, do not free)
ShapesoundInfo* shapesound_get_info(ShapesoundHandle handle);

/// @brief Get the detail message of the last failed generation.
/// @param handle Generator handle
/// @return Message owned by the handle ("" when none)
const char* shapesound_last_error_message(ShapesoundHandle handle);

// ============================================================================
// Enumeration
// ============================================================================

/// @brief Get number of sampling methods. @return Count (4)
uint8_t shapesound_sampling_count(void);

/// @brief Get sampling method name. @param id Method ID @return Name (e.g. "edges")
const char* shapesound_sampling_name(uint8_t id);

/// @brief Get number of synthesis modes. @return Count (2)
uint8_t shapesound_mode_count(void);

/// @brief Get synthesis mode name. @param id Mode ID @return Name (e.g. "v2")
const char* shapesound_mode_name(uint8_t id);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* shapesound_error_string(ShapesoundError error);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* shapesound_version(void);

#ifdef __cplusplus
}
#endif

#endif  // SHAPESOUND_C_H
