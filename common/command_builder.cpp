#include "command_builder.hpp"

#include <algorithm>
#include <cmath>

namespace robomaster::protocol {

namespace {

// Байты команды touch до CRC16
constexpr std::array<uint8_t, 6> kTouchHeadPrefix = {0x55, 0x0f, 0x04,
                                                     0xa2, 0x09, 0x04};
constexpr std::array<uint8_t, 5> kTouchTailBody = {0x40, 0x04, 0x4c, 0x00,
                                                   0x00};

Result<std::vector<uint8_t>> BuildWithEncoder(CommandId id, uint16_t counter,
                                              const auto& encoder) {
  auto found = CommandTable::Instance().Find(id);
  if (IsError(found)) return GetError(found);
  return CommandBuilder::BuildFromTemplate(*GetValue(found), counter, encoder);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Фиксированная точка
// ═══════════════════════════════════════════════════════════════════════════

uint16_t CommandBuilder::EncodeAxis(float v) noexcept {
  const long raw = std::lround(kAxisScale * v + kAxisOffset);
  return static_cast<uint16_t>(std::clamp<long>(raw, 0, kAxisMax));
}

int16_t CommandBuilder::EncodeAngle(float r) noexcept {
  return static_cast<int16_t>(std::lround(kAngleScale * r));
}

// ═══════════════════════════════════════════════════════════════════════════
// Команды таблицы
// ═══════════════════════════════════════════════════════════════════════════

Result<std::vector<uint8_t>> CommandBuilder::BuildGeneric(CommandId id,
                                                          uint16_t counter) {
  return BuildWithEncoder(id, counter, LiteralEncoder{});
}

Result<std::vector<uint8_t>> CommandBuilder::BuildTwist(
    const MovementParams& params, const SequenceCounters& counters) {
  const MovementParams clamped = params.Clamped();
  const uint16_t x = EncodeAxis(clamped.vx);
  const uint16_t y = EncodeAxis(clamped.vy);
  const uint16_t z = EncodeAxis(clamped.vz);

  auto encoder = [x, y, z](ParamTag tag, uint8_t literal) -> uint8_t {
    switch (tag) {
      case ParamTag::TwistYLow:
        return y & 0xFF;
      case ParamTag::TwistXLowYHigh:
        return ((x << 3) & 0xFF) | ((y >> 8) & 0x07);
      case ParamTag::TwistXHigh:
        return (literal & 0xC0) | ((x >> 5) & 0x3F);
      case ParamTag::TwistZLow:
        return ((z << 4) & 0xFF) | 0x08;
      case ParamTag::TwistZHigh:
        return (z >> 4) & 0xFF;
      case ParamTag::TwistReserved:
        return 0x00;
      case ParamTag::TwistZLowShift2:
        return 0x02 | ((z << 2) & 0xFF);
      case ParamTag::TwistZHighShift6:
        return (z >> 6) & 0xFF;
      case ParamTag::TwistModeLow:
        return 0x04;
      case ParamTag::TwistEnableMask:
        return 0x0C;  // 4: x-y, 8: yaw
      case ParamTag::TwistModeHigh:
        return 0x00;
      case ParamTag::TwistControlMode:
        return 0x04;
      default:
        return literal;
    }
  };
  return BuildWithEncoder(CommandId::Twist, counters.joy, encoder);
}

Result<std::vector<uint8_t>> CommandBuilder::BuildGimbal(
    const GimbalParams& params, const SequenceCounters& counters) {
  const GimbalParams clamped = params.Clamped();
  const auto pitch = static_cast<uint16_t>(EncodeAngle(clamped.ry));
  const auto yaw = static_cast<uint16_t>(EncodeAngle(clamped.rz));

  auto encoder = [pitch, yaw](ParamTag tag, uint8_t literal) -> uint8_t {
    switch (tag) {
      case ParamTag::GimbalPitchLow:
        return pitch & 0xFF;
      case ParamTag::GimbalPitchHigh:
        return (pitch >> 8) & 0xFF;
      case ParamTag::GimbalYawLow:
        return yaw & 0xFF;
      case ParamTag::GimbalYawHigh:
        return (yaw >> 8) & 0xFF;
      default:
        return literal;
    }
  };
  return BuildWithEncoder(CommandId::Gimbal, counters.gimbal, encoder);
}

Result<std::vector<uint8_t>> CommandBuilder::BuildLed(
    const LedColor& color, const SequenceCounters& counters) {
  auto encoder = [color](ParamTag tag, uint8_t literal) -> uint8_t {
    switch (tag) {
      case ParamTag::LedRed:
        return color.red;
      case ParamTag::LedGreen:
        return color.green;
      case ParamTag::LedBlue:
        return color.blue;
      default:
        return literal;
    }
  };
  return BuildWithEncoder(CommandId::LedColor, counters.led, encoder);
}

Result<std::vector<uint8_t>> CommandBuilder::BuildLedOn(uint16_t counter) {
  return BuildGeneric(CommandId::LedOn, counter);
}

// ═══════════════════════════════════════════════════════════════════════════
// Touch и загрузка
// ═══════════════════════════════════════════════════════════════════════════

TouchCommand CommandBuilder::BuildTouch(
    const SequenceCounters& counters) noexcept {
  TouchCommand cmd;
  std::copy(kTouchHeadPrefix.begin(), kTouchHeadPrefix.end(),
            cmd.head.begin());
  cmd.head[kCounterLowOffset] = counters.joy & 0xFF;
  cmd.head[kCounterHighOffset] = (counters.joy >> 8) & 0xFF;

  std::copy(kTouchTailBody.begin(), kTouchTailBody.end(), cmd.tail.begin());

  // CRC16 считается по обоим массивам подряд
  uint16_t crc = CalculateCrc16(cmd.head);
  crc = CalculateCrc16(kTouchTailBody, crc);
  cmd.tail[kTouchTailBody.size()] = crc & 0xFF;
  cmd.tail[kTouchTailBody.size() + 1] = (crc >> 8) & 0xFF;
  return cmd;
}

Result<std::vector<uint8_t>> CommandBuilder::BuildBootSequence() {
  std::vector<uint8_t> sequence;
  for (auto id = static_cast<size_t>(kBootFirst);
       id <= static_cast<size_t>(kBootLast); ++id) {
    auto cmd = BuildGeneric(static_cast<CommandId>(id), 0);
    if (IsError(cmd)) return GetError(cmd);
    const auto& bytes = GetValue(cmd);
    sequence.insert(sequence.end(), bytes.begin(), bytes.end());
  }

  auto led_on = BuildLedOn(0);
  if (IsError(led_on)) return GetError(led_on);
  const auto& bytes = GetValue(led_on);
  sequence.insert(sequence.end(), bytes.begin(), bytes.end());
  return sequence;
}

}  // namespace robomaster::protocol
