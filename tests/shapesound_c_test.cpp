// Tests for shapesound_c.h -- the C API used by FFI bindings.

#include "shapesound_c.h"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "test_helpers.h"
#include "wav/wav_writer.h"

namespace shapesound {
namespace {

class ShapesoundCApiTest : public ::testing::Test {
 protected:
  void SetUp() override {
    handle_ = shapesound_create();
    image_ = test_helpers::makeCheckerboard(64, 64, 8);
  }

  void TearDown() override { shapesound_destroy(handle_); }

  ShapesoundError generateWith(const std::string& json) {
    return shapesound_generate_from_json(handle_, image_.data.data(),
                                         static_cast<uint32_t>(image_.width),
                                         static_cast<uint32_t>(image_.height), json.c_str(),
                                         json.size());
  }

  ShapesoundHandle handle_ = nullptr;
  PixelBuffer image_;
};

// ---------------------------------------------------------------------------
// Success path
// ---------------------------------------------------------------------------

TEST_F(ShapesoundCApiTest, GeneratesWavAndJson) {
  ASSERT_EQ(generateWith(R"({"duration":0.5,"seed":9,"sample_rate":8000,"channels":1})"),
            SHAPESOUND_OK);
  EXPECT_STREQ(shapesound_last_error_message(handle_), "");

  ShapesoundWavData* wav = shapesound_get_wav(handle_);
  ASSERT_NE(wav, nullptr);
  EXPECT_EQ(wav->size, kWavHeaderSize + 4000u * 2u);
  EXPECT_EQ(std::memcmp(wav->data, "RIFF", 4), 0);
  shapesound_free_wav(wav);

  ShapesoundJsonData* events = shapesound_get_events(handle_);
  ASSERT_NE(events, nullptr);
  EXPECT_EQ(std::strlen(events->json), events->length);
  EXPECT_NE(std::string(events->json).find("\"seed\":9"), std::string::npos);
  shapesound_free_json(events);

  ShapesoundJsonData* analysis = shapesound_get_analysis(handle_);
  ASSERT_NE(analysis, nullptr);
  EXPECT_NE(std::string(analysis->json).find("\"angularity\":"), std::string::npos);
  shapesound_free_json(analysis);
}

TEST_F(ShapesoundCApiTest, InfoDescribesGeneration) {
  ASSERT_EQ(generateWith(R"({"duration":1,"seed":5,"sample_rate":8000,"mode":"legacy"})"),
            SHAPESOUND_OK);
  ShapesoundInfo* info = shapesound_get_info(handle_);
  ASSERT_NE(info, nullptr);
  EXPECT_EQ(info->seed_used, 5u);
  EXPECT_EQ(info->sample_rate, 8000u);
  EXPECT_EQ(info->total_frames, 8000u);
  EXPECT_FLOAT_EQ(info->intensity, 1.0f);
  EXPECT_GT(info->event_count, 0u);
  EXPECT_GE(info->angularity, 0.0f);
  EXPECT_LE(info->angularity, 1.0f);
  EXPECT_EQ(info->performance, info->angularity > 0.5f ? 1 : 0);
}

TEST_F(ShapesoundCApiTest, NullJsonUsesDefaults) {
  ASSERT_EQ(shapesound_generate_from_json(handle_, image_.data.data(), 64, 64, nullptr, 0),
            SHAPESOUND_OK);
  ShapesoundInfo* info = shapesound_get_info(handle_);
  EXPECT_EQ(info->sample_rate, 44100u);
  EXPECT_EQ(info->total_frames, 5u * 44100u);
  EXPECT_NE(info->seed_used, 0u);
}

TEST_F(ShapesoundCApiTest, RandomIsAnAliasForScattered) {
  EXPECT_EQ(generateWith(R"({"sampling":"random","duration":0.2,"seed":1})"), SHAPESOUND_OK);
}

// ---------------------------------------------------------------------------
// Error codes
// ---------------------------------------------------------------------------

TEST_F(ShapesoundCApiTest, UnknownSamplingIsRejected) {
  EXPECT_EQ(generateWith(R"({"sampling":"spiral"})"), SHAPESOUND_ERROR_INVALID_SAMPLING);
  EXPECT_STREQ(shapesound_last_error_message(handle_), "Invalid sampling method");
  EXPECT_EQ(shapesound_get_wav(handle_), nullptr);
  EXPECT_EQ(shapesound_get_events(handle_), nullptr);
}

TEST_F(ShapesoundCApiTest, UnknownModeIsRejected) {
  EXPECT_EQ(generateWith(R"({"mode":"v3"})"), SHAPESOUND_ERROR_INVALID_MODE);
}

TEST_F(ShapesoundCApiTest, DurationOutOfRangeIsRejected) {
  EXPECT_EQ(generateWith(R"({"duration":0})"), SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(generateWith(R"({"duration":-2})"), SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(generateWith(R"({"duration":600.5})"), SHAPESOUND_ERROR_INVALID_PARAM);
}

TEST_F(ShapesoundCApiTest, ZeroChannelsIsRejected) {
  EXPECT_EQ(generateWith(R"({"channels":0})"), SHAPESOUND_ERROR_INVALID_PARAM);
}

TEST_F(ShapesoundCApiTest, OutOfRangeFormatIsRejected) {
  EXPECT_EQ(generateWith(R"({"duration":2,"sample_rate":192000,"channels":65535})"),
            SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(generateWith(R"({"channels":70000})"), SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(generateWith(R"({"channels":9})"), SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(generateWith(R"({"sample_rate":384000})"), SHAPESOUND_ERROR_INVALID_PARAM);
}

TEST_F(ShapesoundCApiTest, OversizedRenderReportsRenderFailure) {
  EXPECT_EQ(generateWith(R"({"duration":600,"sample_rate":192000,"channels":3,"seed":2})"),
            SHAPESOUND_ERROR_RENDER_FAILED);
  EXPECT_STREQ(shapesound_last_error_message(handle_),
               "Render length exceeds the supported maximum");
  EXPECT_EQ(shapesound_get_wav(handle_), nullptr);
}

TEST_F(ShapesoundCApiTest, MissingImageIsRejected) {
  EXPECT_EQ(shapesound_generate_from_json(handle_, nullptr, 4, 4, nullptr, 0),
            SHAPESOUND_ERROR_INVALID_IMAGE);
  EXPECT_EQ(shapesound_generate_from_json(handle_, image_.data.data(), 0, 4, nullptr, 0),
            SHAPESOUND_ERROR_INVALID_IMAGE);
}

TEST_F(ShapesoundCApiTest, FailureClearsPreviousResult) {
  ASSERT_EQ(generateWith(R"({"duration":0.2,"seed":3})"), SHAPESOUND_OK);
  ASSERT_EQ(generateWith(R"({"mode":"bogus"})"), SHAPESOUND_ERROR_INVALID_MODE);
  EXPECT_EQ(shapesound_get_wav(handle_), nullptr);
  EXPECT_EQ(shapesound_get_info(handle_)->event_count, 0u);
}

TEST(ShapesoundCApiNullTest, NullHandleIsSafe) {
  uint8_t pixel[4] = {0, 0, 0, 255};
  EXPECT_EQ(shapesound_generate_from_json(nullptr, pixel, 1, 1, nullptr, 0),
            SHAPESOUND_ERROR_INVALID_PARAM);
  EXPECT_EQ(shapesound_get_wav(nullptr), nullptr);
  EXPECT_EQ(shapesound_get_analysis(nullptr), nullptr);
  EXPECT_STREQ(shapesound_last_error_message(nullptr), "");
  shapesound_destroy(nullptr);
  shapesound_free_wav(nullptr);
  shapesound_free_json(nullptr);
}

// ---------------------------------------------------------------------------
// Enumeration and strings
// ---------------------------------------------------------------------------

TEST(ShapesoundCApiNullTest, EnumeratesSamplingMethods) {
  ASSERT_EQ(shapesound_sampling_count(), 4);
  EXPECT_STREQ(shapesound_sampling_name(0), "brightness");
  EXPECT_STREQ(shapesound_sampling_name(1), "edges");
  EXPECT_STREQ(shapesound_sampling_name(2), "scattered");
  EXPECT_STREQ(shapesound_sampling_name(3), "regions");
  EXPECT_STREQ(shapesound_sampling_name(4), "");
}

TEST(ShapesoundCApiNullTest, EnumeratesModes) {
  ASSERT_EQ(shapesound_mode_count(), 2);
  EXPECT_STREQ(shapesound_mode_name(0), "legacy");
  EXPECT_STREQ(shapesound_mode_name(1), "v2");
  EXPECT_STREQ(shapesound_mode_name(2), "");
}

TEST(ShapesoundCApiNullTest, ErrorStringsAndVersion) {
  EXPECT_STREQ(shapesound_error_string(SHAPESOUND_OK), "OK");
  EXPECT_STREQ(shapesound_error_string(SHAPESOUND_ERROR_RENDER_FAILED), "Rendering failed");
  EXPECT_STREQ(shapesound_version(), "0.1.0");
}

}  // namespace
}  // namespace shapesound
