#include <gtest/gtest.h>

#include "command_presets.hpp"

using namespace robomaster;

// ═══════════════════════════════════════════════════════════════════════════
// MovementCommand
// ═══════════════════════════════════════════════════════════════════════════

TEST(MovementCommandTest, DefaultIsStop) {
  EXPECT_EQ(MovementCommand().Params(), MovementParams{});
}

TEST(MovementCommandTest, ChainsAllAxes) {
  const auto params =
      MovementCommand().Forward(0.5f).StrafeRight(-0.25f).RotateRight(0.75f).Params();
  EXPECT_FLOAT_EQ(params.vx, 0.5f);
  EXPECT_FLOAT_EQ(params.vy, -0.25f);
  EXPECT_FLOAT_EQ(params.vz, 0.75f);
}

TEST(MovementCommandTest, ClampsOutOfRangeSpeeds) {
  const auto params =
      MovementCommand().Forward(3.0f).StrafeRight(-2.0f).RotateRight(1.0f).Params();
  EXPECT_EQ(params, (MovementParams{1.0f, -1.0f, 1.0f}));
}

TEST(MovementCommandTest, LaterCallOverridesAxis) {
  const auto params = MovementCommand().Forward(0.5f).Forward(-0.5f).Params();
  EXPECT_FLOAT_EQ(params.vx, -0.5f);
}

// ═══════════════════════════════════════════════════════════════════════════
// LedCommand
// ═══════════════════════════════════════════════════════════════════════════

TEST(LedCommandTest, PresetColors) {
  EXPECT_EQ(LedCommand::Red(), (LedColor{255, 0, 0}));
  EXPECT_EQ(LedCommand::Green(), (LedColor{0, 255, 0}));
  EXPECT_EQ(LedCommand::Blue(), (LedColor{0, 0, 255}));
  EXPECT_EQ(LedCommand::White(), (LedColor{255, 255, 255}));
  EXPECT_EQ(LedCommand::Off(), LedColor{});
}

TEST(LedCommandTest, PresetsAreConstexpr) {
  static_assert(LedCommand::Rgb(1, 2, 3) == LedColor{1, 2, 3});
  static_assert(LedCommand::Off() == LedColor{});
  SUCCEED();
}

// ═══════════════════════════════════════════════════════════════════════════
// SequenceCounters
// ═══════════════════════════════════════════════════════════════════════════

TEST(SequenceCountersTest, AdvanceWrapsEveryField) {
  SequenceCounters counters{.joy = 0xFFFF, .led = 0xFFFF, .gimbal = 0xFFFE};
  Advance(counters.joy);
  Advance(counters.led);
  Advance(counters.gimbal);
  EXPECT_EQ(counters, (SequenceCounters{.joy = 0, .led = 0, .gimbal = 0xFFFF}));

  Advance(counters.gimbal);
  EXPECT_EQ(counters.gimbal, 0);
}
