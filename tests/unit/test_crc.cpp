#include <gtest/gtest.h>

#include <array>
#include <vector>

#include "command_builder.hpp"
#include "crc.hpp"
#include "test_helpers.hpp"

using namespace robomaster;
using namespace robomaster::protocol;
using namespace robomaster::testing;

// ═══════════════════════════════════════════════════════════════════════════
// CRC8 Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(Crc8Test, EmptyInputReturnsSeed) {
  EXPECT_EQ(CalculateCrc8({}), kCrc8Init);
  EXPECT_EQ(CalculateCrc8({}, 0x12), 0x12);
}

TEST(Crc8Test, KnownHeaderVectors) {
  // Header bytes of a 15-byte and a 27-byte command
  const std::array<uint8_t, 3> short_header = {0x55, 0x0f, 0x04};
  const std::array<uint8_t, 3> twist_header = {0x55, 0x1b, 0x04};

  EXPECT_EQ(CalculateCrc8(short_header), 0xa2);
  EXPECT_EQ(CalculateCrc8(twist_header), 0x75);
}

TEST(Crc8Test, IncrementalMatchesOneShot) {
  const std::array<uint8_t, 6> data = {0x55, 0x1a, 0x04, 0x09, 0x18, 0x00};
  const uint8_t head = CalculateCrc8(std::span(data).first(2));
  EXPECT_EQ(CalculateCrc8(std::span(data).subspan(2), head),
            CalculateCrc8(data));
}

TEST(Crc8Test, AppendThenVerify) {
  std::vector<uint8_t> data = {0x55, 0x0d, 0x04};
  AppendCrc8(data);

  ASSERT_EQ(data.size(), 4u);
  EXPECT_EQ(data[3], 0x33);
  EXPECT_TRUE(VerifyCrc8(data));

  data[1] ^= 0x01;
  EXPECT_FALSE(VerifyCrc8(data)) << "Corrupted byte should fail CRC8";
}

TEST(Crc8Test, VerifyRejectsEmptyBuffer) {
  EXPECT_FALSE(VerifyCrc8({}));
}

// ═══════════════════════════════════════════════════════════════════════════
// CRC16 Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST(Crc16Test, EmptyInputReturnsSeed) {
  EXPECT_EQ(CalculateCrc16({}), 13970);
  EXPECT_EQ(CalculateCrc16({}), kCrc16Init);
}

TEST(Crc16Test, KnownVectors) {
  const auto header_1b =
      Bytes({0x55, 0x1b, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04,
             0x4c, 0x00, 0x00});
  const auto recenter =
      Bytes({0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04,
             0x4c, 0x00, 0x00});
  const auto tail = Bytes({0x40, 0x04, 0x4c, 0x00, 0x00});
  const auto single = Bytes({0x40});

  EXPECT_EQ(CalculateCrc16(header_1b), 0x2065);
  EXPECT_EQ(CalculateCrc16(recenter), 0x30cb);
  EXPECT_EQ(CalculateCrc16(tail), 0x3fee);
  EXPECT_EQ(CalculateCrc16(single), 0xf5a9);
}

TEST(Crc16Test, AppendIsLittleEndian) {
  auto data = Bytes({0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40,
                     0x04, 0x4c, 0x00, 0x00});
  AppendCrc16(data);

  ASSERT_EQ(data.size(), 15u);
  EXPECT_EQ(data[13], 0xcb) << "Low byte first";
  EXPECT_EQ(data[14], 0x30) << "High byte second";
}

TEST(Crc16Test, VerifyAcceptsAppendedAndRejectsCorrupted) {
  auto data = Bytes({0x55, 0x0d, 0x04, 0x33, 0x09, 0xc3, 0x00, 0x00, 0x40,
                     0x00, 0x01});
  AppendCrc16(data);
  EXPECT_TRUE(VerifyCrc16(data));

  data[5] ^= 0x80;
  EXPECT_FALSE(VerifyCrc16(data));
}

TEST(Crc16Test, AnySingleByteFlipFailsVerify) {
  // Built twist command, both CRC16 trailer bytes included
  const auto built = CommandBuilder::BuildTwist(
      {.vx = 0.5f, .vy = -0.25f, .vz = 0.75f}, SequenceCounters{.joy = 42});
  ASSERT_TRUE(robomaster::IsOk(built));
  const auto& frame = robomaster::GetValue(built);
  ASSERT_TRUE(VerifyCrc16(frame));

  for (size_t i = 0; i < frame.size(); ++i) {
    SCOPED_TRACE(::testing::Message() << "byte " << i);
    for (unsigned mask = 1; mask <= 0xFF; ++mask) {
      auto corrupted = frame;
      corrupted[i] ^= static_cast<uint8_t>(mask);
      ASSERT_FALSE(VerifyCrc16(corrupted)) << "mask 0x" << std::hex << mask;
    }
  }
}

TEST(Crc16Test, VerifyRejectsShortBuffers) {
  EXPECT_FALSE(VerifyCrc16({}));
  EXPECT_FALSE(VerifyCrc16(Bytes({0x92})));
}

TEST(Crc16Test, VerifyTwoByteBufferHoldingSeed) {
  // CRC16 of nothing is the seed itself: 0x3692 little-endian
  EXPECT_TRUE(VerifyCrc16(Bytes({0x92, 0x36})));
}
