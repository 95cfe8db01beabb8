// Tests for wav/byte_stream.h -- little-endian helpers.

#include "wav/byte_stream.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace shapesound {
namespace {

TEST(ByteStreamTest, WriteLE16) {
  std::vector<uint8_t> buf;
  writeLE16(buf, 0x1234);
  ASSERT_EQ(buf.size(), 2u);
  EXPECT_EQ(buf[0], 0x34);
  EXPECT_EQ(buf[1], 0x12);
}

TEST(ByteStreamTest, WriteLE32) {
  std::vector<uint8_t> buf;
  writeLE32(buf, 0xAABBCCDDu);
  ASSERT_EQ(buf.size(), 4u);
  EXPECT_EQ(buf[0], 0xDD);
  EXPECT_EQ(buf[1], 0xCC);
  EXPECT_EQ(buf[2], 0xBB);
  EXPECT_EQ(buf[3], 0xAA);
}

TEST(ByteStreamTest, WriteTagAppendsFourCharacters) {
  std::vector<uint8_t> buf = {0x00};
  writeTag(buf, "WAVE");
  ASSERT_EQ(buf.size(), 5u);
  EXPECT_EQ(buf[1], 'W');
  EXPECT_EQ(buf[4], 'E');
}

TEST(ByteStreamTest, ReadBackAtOffset) {
  std::vector<uint8_t> buf = {0xFF, 0xFF};
  writeLE16(buf, 0xBEEF);
  writeLE32(buf, 44100);
  EXPECT_EQ(readLE16(buf.data(), 2), 0xBEEF);
  EXPECT_EQ(readLE32(buf.data(), 4), 44100u);
  EXPECT_EQ(readLE16(buf.data(), 0), 0xFFFF);
}

}  // namespace
}  // namespace shapesound
