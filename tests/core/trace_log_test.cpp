// Tests for core/trace_log.h -- diagnostic trace hook.

#include "core/trace_log.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace shapesound {
namespace {

class TraceLogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    setTraceSink([this](const char* tag, const std::string& message) {
      lines_.push_back(std::string(tag) + ": " + message);
    });
  }

  void TearDown() override {
    setTraceEnabled(false);
    setTraceSink(nullptr);
  }

  std::vector<std::string> lines_;
};

TEST_F(TraceLogTest, DisabledByDefault) {
  EXPECT_FALSE(traceEnabled());
  trace("Scheduler", "events=%d", 3);
  EXPECT_TRUE(lines_.empty());
}

TEST_F(TraceLogTest, EnabledTraceReachesSink) {
  setTraceEnabled(true);
  trace("Angularity", "score=%.2f multi=%s", 0.75, "yes");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0], "Angularity: score=0.75 multi=yes");
}

TEST_F(TraceLogTest, LongMessagesAreTruncatedNotOverflowed) {
  setTraceEnabled(true);
  std::string longText(2000, 'x');
  trace("Render", "%s", longText.c_str());
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_LT(lines_[0].size(), longText.size());
}

}  // namespace
}  // namespace shapesound
