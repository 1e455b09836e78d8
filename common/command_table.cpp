#include "command_table.hpp"

#include <algorithm>
#include <string>

namespace robomaster::protocol {

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// Захваченные команды (счётчик 0, нейтральные параметры)
// ═══════════════════════════════════════════════════════════════════════════

constexpr std::array<uint8_t, 13> kRowQueryVersionChassis = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x00, 0x01, 0x2a,
    0x99};
constexpr std::array<uint8_t, 13> kRowQueryVersionGimbal = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0x04, 0x00, 0x00, 0x40, 0x00, 0x01, 0x88,
    0x82};
constexpr std::array<uint8_t, 13> kRowQueryVersionLed = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0x18, 0x00, 0x00, 0x40, 0x00, 0x01, 0xcc,
    0xf1};
constexpr std::array<uint8_t, 13> kRowQueryVersionBlaster = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0x17, 0x00, 0x00, 0x40, 0x00, 0x01, 0x45,
    0xcc};
constexpr std::array<uint8_t, 13> kRowQueryVersionCamera = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0x01, 0x00, 0x00, 0x40, 0x00, 0x01, 0x0f,
    0x96};
constexpr std::array<uint8_t, 13> kRowQueryVersionArmor = {
    0x55, 0x0d, 0x04, 0x33, 0x09, 0x06, 0x00, 0x00, 0x40, 0x00, 0x01, 0xde,
    0x8a};
constexpr std::array<uint8_t, 16> kRowSubscribeResetChassis = {
    0x55, 0x10, 0x04, 0x56, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x03, 0x09,
    0x00, 0x00, 0x84, 0xc0};
constexpr std::array<uint8_t, 16> kRowSubscribeResetGimbal = {
    0x55, 0x10, 0x04, 0x56, 0x09, 0x04, 0x00, 0x00, 0x40, 0x48, 0x03, 0x09,
    0x00, 0x00, 0xd2, 0x0b};
constexpr std::array<uint8_t, 18> kRowSubscribeNodeChassis = {
    0x55, 0x12, 0x04, 0xc7, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x01, 0x09,
    0x00, 0x00, 0x00, 0x00, 0x7d, 0x2c};
constexpr std::array<uint8_t, 18> kRowSubscribeNodeGimbal = {
    0x55, 0x12, 0x04, 0xc7, 0x09, 0x04, 0x00, 0x00, 0x40, 0x48, 0x01, 0x09,
    0x00, 0x00, 0x00, 0x00, 0x85, 0xd3};
constexpr std::array<uint8_t, 22> kRowSubscribeChassisPosition = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x01, 0x14, 0x00, 0x00, 0x00, 0x09, 0x00, 0xc1, 0xdc};
constexpr std::array<uint8_t, 22> kRowSubscribeChassisAttitude = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x02, 0x14, 0x00, 0x00, 0x00, 0x0a, 0x00, 0xc7, 0x5e};
constexpr std::array<uint8_t, 22> kRowSubscribeChassisVelocity = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x03, 0x14, 0x00, 0x00, 0x00, 0x0b, 0x00, 0xca, 0xd8};
constexpr std::array<uint8_t, 22> kRowSubscribeChassisEsc = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x04, 0x14, 0x00, 0x00, 0x00, 0x0c, 0x00, 0xda, 0x52};
constexpr std::array<uint8_t, 22> kRowSubscribeChassisImu = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x05, 0x14, 0x00, 0x00, 0x00, 0x0d, 0x00, 0xd7, 0xd4};
constexpr std::array<uint8_t, 22> kRowSubscribeBattery = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x06, 0x05, 0x00, 0x00, 0x00, 0x0e, 0x00, 0x4a, 0x10};
constexpr std::array<uint8_t, 22> kRowSubscribeGimbalAttitude = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0x04, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x07, 0x14, 0x00, 0x00, 0x00, 0x0f, 0x00, 0xdc, 0x84};
constexpr std::array<uint8_t, 16> kRowUnsubscribeChassis = {
    0x55, 0x10, 0x04, 0x56, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x04, 0x09,
    0x00, 0x01, 0x2c, 0x86};
constexpr std::array<uint8_t, 16> kRowUnsubscribeGimbal = {
    0x55, 0x10, 0x04, 0x56, 0x09, 0x04, 0x00, 0x00, 0x40, 0x48, 0x04, 0x09,
    0x00, 0x07, 0x4c, 0x28};
constexpr std::array<uint8_t, 14> kRowChassisSpeedMode = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x3f, 0x21, 0x01,
    0x4e, 0xe5};
constexpr std::array<uint8_t, 14> kRowChassisStickOverlay = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x3f, 0x28, 0x00,
    0xdf, 0x23};
constexpr std::array<uint8_t, 15> kRowGimbalSuspend = {
    0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04, 0x2a, 0x2a,
    0x00, 0x1c, 0x3d};
constexpr std::array<uint8_t, 15> kRowGimbalResume = {
    0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04, 0x2a, 0x2b,
    0x00, 0xc4, 0x24};
constexpr std::array<uint8_t, 15> kRowGimbalRecenter = {
    0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04, 0x4c, 0x00,
    0x00, 0xcb, 0x30};
constexpr std::array<uint8_t, 27> kRowTwist = {
    0x55, 0x1b, 0x04, 0x75, 0x09, 0xc3, 0x00, 0x00, 0x00, 0x3f, 0x60, 0x00,
    0x04, 0x20, 0x00, 0x01, 0x08, 0x40, 0x00, 0x02, 0x10, 0x04, 0x0c, 0x00,
    0x04, 0xab, 0x3d};
constexpr std::array<uint8_t, 20> kRowGimbal = {
    0x55, 0x14, 0x04, 0x6d, 0x09, 0x04, 0x00, 0x00, 0x00, 0x04, 0x69, 0x08,
    0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x12, 0x47};
constexpr std::array<uint8_t, 14> kRowBootEnterSdkMode = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x3f, 0xd1, 0x01,
    0x46, 0x99};
constexpr std::array<uint8_t, 14> kRowBootRobotModeFree = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x3f, 0x46, 0x00,
    0x9a, 0xdc};
constexpr std::array<uint8_t, 14> kRowBootChassisEnable = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x3f, 0x1a, 0x01,
    0x44, 0xb7};
constexpr std::array<uint8_t, 14> kRowBootGimbalEnable = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04, 0x1a, 0x01,
    0x4f, 0x9e};
constexpr std::array<uint8_t, 15> kRowBootGimbalCtrlMode = {
    0x55, 0x0f, 0x04, 0xa2, 0x09, 0x04, 0x00, 0x00, 0x40, 0x04, 0x4c, 0x01,
    0x00, 0x13, 0x29};
constexpr std::array<uint8_t, 14> kRowBootLedReset = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0x18, 0x00, 0x00, 0x40, 0x3f, 0x33, 0x00,
    0xb6, 0xd0};
constexpr std::array<uint8_t, 14> kRowBootArmorEnable = {
    0x55, 0x0e, 0x04, 0x66, 0x09, 0x06, 0x00, 0x00, 0x40, 0x3f, 0x5e, 0x01,
    0xfa, 0x27};
constexpr std::array<uint8_t, 15> kRowBootBlasterEnable = {
    0x55, 0x0f, 0x04, 0xa2, 0x09, 0x17, 0x00, 0x00, 0x40, 0x3f, 0x55, 0x73,
    0x00, 0xa3, 0xae};
constexpr std::array<uint8_t, 22> kRowBootSubscribeTwistEcho = {
    0x55, 0x16, 0x04, 0xfc, 0x09, 0xc3, 0x00, 0x00, 0x40, 0x48, 0x08, 0x09,
    0x00, 0x08, 0x32, 0x00, 0x00, 0x00, 0x60, 0x3f, 0x5b, 0x7b};
constexpr std::array<uint8_t, 26> kRowLedOn = {
    0x55, 0x1a, 0x04, 0xb1, 0x09, 0x18, 0x00, 0x00, 0x00, 0x3f, 0x32, 0x01,
    0xff, 0x00, 0x7f, 0x46, 0x00, 0x00, 0xc8, 0x00, 0xc8, 0x00, 0x0f, 0x00,
    0x86, 0x7d};
constexpr std::array<uint8_t, 26> kRowLedColor = {
    0x55, 0x1a, 0x04, 0xb1, 0x09, 0x18, 0x00, 0x00, 0x00, 0x3f, 0x32, 0x01,
    0xff, 0x00, 0x00, 0x00, 0x00, 0x00, 0xc8, 0x00, 0xc8, 0x00, 0x0f, 0x00,
    0xba, 0xbd};
constexpr std::array<uint8_t, 26> kRowLedOff = {
    0x55, 0x1a, 0x04, 0xb1, 0x09, 0x18, 0x00, 0x00, 0x00, 0x3f, 0x32, 0x02,
    0xff, 0x00, 0x00, 0x00, 0x00, 0x00, 0xc8, 0x00, 0xc8, 0x00, 0x0f, 0x00,
    0x4d, 0xb3};

constexpr std::array<std::span<const uint8_t>, kCommandCount> kRows = {
    kRowQueryVersionChassis,
    kRowQueryVersionGimbal,
    kRowQueryVersionLed,
    kRowQueryVersionBlaster,
    kRowQueryVersionCamera,
    kRowQueryVersionArmor,
    kRowSubscribeResetChassis,
    kRowSubscribeResetGimbal,
    kRowSubscribeNodeChassis,
    kRowSubscribeNodeGimbal,
    kRowSubscribeChassisPosition,
    kRowSubscribeChassisAttitude,
    kRowSubscribeChassisVelocity,
    kRowSubscribeChassisEsc,
    kRowSubscribeChassisImu,
    kRowSubscribeBattery,
    kRowSubscribeGimbalAttitude,
    kRowUnsubscribeChassis,
    kRowUnsubscribeGimbal,
    kRowChassisSpeedMode,
    kRowChassisStickOverlay,
    kRowGimbalSuspend,
    kRowGimbalResume,
    kRowGimbalRecenter,
    kRowTwist,
    kRowGimbal,
    kRowBootEnterSdkMode,
    kRowBootRobotModeFree,
    kRowBootChassisEnable,
    kRowBootGimbalEnable,
    kRowBootGimbalCtrlMode,
    kRowBootLedReset,
    kRowBootArmorEnable,
    kRowBootBlasterEnable,
    kRowBootSubscribeTwistEcho,
    kRowLedOn,
    kRowLedColor,
    kRowLedOff,
};

// ═══════════════════════════════════════════════════════════════════════════
// Раскладка параметров {команда, смещение, тег}
// ═══════════════════════════════════════════════════════════════════════════

struct ParamLayout {
  CommandId command;
  uint8_t offset;
  ParamTag tag;
};

// Смещения Twist получены с устройства, менять нельзя: любая перестановка
// молча переводит управление на другую ось.
constexpr std::array<ParamLayout, 19> kParamLayout = {{
    {CommandId::Twist, 11, ParamTag::TwistYLow},
    {CommandId::Twist, 12, ParamTag::TwistXLowYHigh},
    {CommandId::Twist, 13, ParamTag::TwistXHigh},
    {CommandId::Twist, 16, ParamTag::TwistZLow},
    {CommandId::Twist, 17, ParamTag::TwistZHigh},
    {CommandId::Twist, 18, ParamTag::TwistReserved},
    {CommandId::Twist, 19, ParamTag::TwistZLowShift2},
    {CommandId::Twist, 20, ParamTag::TwistZHighShift6},
    {CommandId::Twist, 21, ParamTag::TwistModeLow},
    {CommandId::Twist, 22, ParamTag::TwistEnableMask},
    {CommandId::Twist, 23, ParamTag::TwistModeHigh},
    {CommandId::Twist, 24, ParamTag::TwistControlMode},
    {CommandId::Gimbal, 13, ParamTag::GimbalPitchLow},
    {CommandId::Gimbal, 14, ParamTag::GimbalPitchHigh},
    {CommandId::Gimbal, 15, ParamTag::GimbalYawLow},
    {CommandId::Gimbal, 16, ParamTag::GimbalYawHigh},
    {CommandId::LedColor, 14, ParamTag::LedRed},
    {CommandId::LedColor, 15, ParamTag::LedGreen},
    {CommandId::LedColor, 16, ParamTag::LedBlue},
}};

ParamTag FindParam(CommandId id, size_t offset) noexcept {
  for (const auto& entry : kParamLayout) {
    if (entry.command == id && entry.offset == offset) return entry.tag;
  }
  return ParamTag::None;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// CommandTemplate
// ═══════════════════════════════════════════════════════════════════════════

CommandTemplate CommandTemplate::FromRow(CommandId id,
                                         std::span<const uint8_t> row) {
  const uint8_t declared = row.size() > kLengthOffset ? row[kLengthOffset] : 0;
  const size_t body = declared >= kCrc16Bytes ? declared - kCrc16Bytes : 0;
  const size_t count = std::min(body, row.size());

  std::vector<FieldDescriptor> fields;
  fields.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    FieldDescriptor field{.role = FieldRole::Literal, .literal = row[i]};
    if (i == kCrc8Offset) {
      field.role = FieldRole::Crc8Marker;
    } else if (i == kCounterLowOffset) {
      field.role = FieldRole::CounterLow;
    } else if (i == kCounterHighOffset) {
      field.role = FieldRole::CounterHigh;
    } else if (auto tag = FindParam(id, i); tag != ParamTag::None) {
      field.role = FieldRole::Parameter;
      field.param = tag;
    }
    fields.push_back(field);
  }
  return CommandTemplate(id, declared, std::move(fields));
}

// ═══════════════════════════════════════════════════════════════════════════
// CommandTable
// ═══════════════════════════════════════════════════════════════════════════

CommandTable::CommandTable() {
  templates_.reserve(kCommandCount);
  for (size_t i = 0; i < kCommandCount; ++i) {
    templates_.push_back(
        CommandTemplate::FromRow(static_cast<CommandId>(i), kRows[i]));
  }
}

const CommandTable& CommandTable::Instance() {
  static const CommandTable s_instance;
  return s_instance;
}

Result<const CommandTemplate*> CommandTable::Find(CommandId id) const {
  return Find(static_cast<size_t>(id));
}

Result<const CommandTemplate*> CommandTable::Find(size_t index) const {
  if (index >= templates_.size()) {
    return MakeError(ErrorCode::CommandNotFound,
                     "command " + std::to_string(index));
  }
  return &templates_[index];
}

std::span<const uint8_t> CommandTable::RawRow(size_t index) noexcept {
  if (index >= kRows.size()) return {};
  return kRows[index];
}

}  // namespace robomaster::protocol
