#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "command_builder.hpp"
#include "frame_splitter.hpp"
#include "test_helpers.hpp"

using namespace robomaster;
using namespace robomaster::protocol;
using namespace robomaster::testing;

namespace {

std::vector<uint8_t> Sequence(size_t count) {
  std::vector<uint8_t> bytes(count);
  std::iota(bytes.begin(), bytes.end(), uint8_t{0});
  return bytes;
}

std::vector<uint8_t> Join(const std::vector<CanFrame>& frames) {
  std::vector<uint8_t> bytes;
  for (const auto& frame : frames) {
    const auto payload = frame.Payload();
    bytes.insert(bytes.end(), payload.begin(), payload.end());
  }
  return bytes;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// MakeControlFrame
// ═══════════════════════════════════════════════════════════════════════════

TEST(FrameSplitterTest, ControlFrameUsesStandardId) {
  const auto frame = MakeControlFrame(Bytes({0x55, 0x0d}));
  EXPECT_EQ(frame.id, 0x201u);
  EXPECT_FALSE(frame.extended);
  EXPECT_EQ(frame.len, 2);
  EXPECT_EQ(ToVector(frame.Payload()), Bytes({0x55, 0x0d}));
}

TEST(FrameSplitterTest, ControlFrameTruncatesToEightBytes) {
  const auto frame = MakeControlFrame(Sequence(12));
  EXPECT_EQ(frame.len, kMaxFrameData);
  EXPECT_EQ(ToVector(frame.Payload()), Sequence(8));
}

TEST(FrameSplitterTest, FrameEqualityIgnoresBytesPastLength) {
  CanFrame a = MakeFrame({1, 2, 3});
  CanFrame b = MakeFrame({1, 2, 3});
  b.data[5] = 0xAA;
  EXPECT_EQ(a, b);

  b.id = 0x202;
  EXPECT_FALSE(a == b);
}

// ═══════════════════════════════════════════════════════════════════════════
// SplitIntoFrames
// ═══════════════════════════════════════════════════════════════════════════

TEST(FrameSplitterTest, EmptyInputGivesNoFrames) {
  EXPECT_TRUE(SplitIntoFrames({}).empty());
}

TEST(FrameSplitterTest, SingleByte) {
  const auto frames = SplitIntoFrames(Bytes({0x55}));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].len, 1);
  EXPECT_EQ(frames[0].data[0], 0x55);
}

TEST(FrameSplitterTest, ExactlyOneFullFrame) {
  const auto frames = SplitIntoFrames(Sequence(8));
  ASSERT_EQ(frames.size(), 1u);
  EXPECT_EQ(frames[0].len, 8);
}

TEST(FrameSplitterTest, NineBytesSpillIntoSecondFrame) {
  const auto frames = SplitIntoFrames(Sequence(9));
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].len, 8);
  EXPECT_EQ(frames[1].len, 1);
  EXPECT_EQ(frames[1].data[0], 8);
}

TEST(FrameSplitterTest, SixteenBytesAreTwoFullFrames) {
  const auto frames = SplitIntoFrames(Sequence(16));
  ASSERT_EQ(frames.size(), 2u);
  EXPECT_EQ(frames[0].len, 8);
  EXPECT_EQ(frames[1].len, 8);
}

TEST(FrameSplitterTest, TwistCommandIsFourFrames) {
  auto twist = CommandBuilder::BuildTwist({.vx = 0.5f}, SequenceCounters{});
  ASSERT_TRUE(IsOk(twist));
  const auto frames = SplitIntoFrames(GetValue(twist));

  ASSERT_EQ(frames.size(), 4u);
  EXPECT_EQ(frames[3].len, 3);
  EXPECT_EQ(Join(frames), GetValue(twist));
}

TEST(FrameSplitterTest, BootSequenceIsTwentyOneFrames) {
  auto boot = CommandBuilder::BuildBootSequence();
  ASSERT_TRUE(IsOk(boot));
  const auto frames = SplitIntoFrames(GetValue(boot));

  // 162 bytes: 20 full frames and one with 2 bytes
  ASSERT_EQ(frames.size(), 21u);
  EXPECT_EQ(frames.back().len, 2);
  for (const auto& frame : frames) {
    EXPECT_EQ(frame.id, kControlArbitrationId);
    EXPECT_FALSE(frame.extended);
  }
  EXPECT_EQ(Join(frames), GetValue(boot));
}
