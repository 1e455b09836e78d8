#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "error.hpp"

namespace robomaster::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы формата команд
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr uint8_t kFrameHeader = 0x55;
inline constexpr uint8_t kFrameVersion = 0x04;
inline constexpr uint8_t kHostAddress = 0x09;

inline constexpr size_t kLengthOffset = 1;
inline constexpr size_t kCrc8Offset = 3;
inline constexpr size_t kCounterLowOffset = 6;
inline constexpr size_t kCounterHighOffset = 7;

// ═══════════════════════════════════════════════════════════════════════════
// Идентификаторы команд
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Идентификаторы шаблонов команд (индекс в таблице)
 *
 * 0..23 запросы версий, подписки и режимы; 24 и 25 движение шасси и
 * подвеса; 26..34 загрузочная последовательность; 35..37 светодиоды.
 */
enum class CommandId : uint8_t {
  QueryVersionChassis = 0,
  QueryVersionGimbal,
  QueryVersionLed,
  QueryVersionBlaster,
  QueryVersionCamera,
  QueryVersionArmor,
  SubscribeResetChassis,
  SubscribeResetGimbal,
  SubscribeNodeChassis,
  SubscribeNodeGimbal,
  SubscribeChassisPosition,  // 10
  SubscribeChassisAttitude,
  SubscribeChassisVelocity,
  SubscribeChassisEsc,
  SubscribeChassisImu,
  SubscribeBattery,
  SubscribeGimbalAttitude,
  UnsubscribeChassis,
  UnsubscribeGimbal,
  ChassisSpeedMode,
  ChassisStickOverlay,  // 20
  GimbalSuspend,
  GimbalResume,
  GimbalRecenter,
  Twist,
  Gimbal,
  BootEnterSdkMode,
  BootRobotModeFree,
  BootChassisEnable,
  BootGimbalEnable,
  BootGimbalCtrlMode,  // 30
  BootLedReset,
  BootArmorEnable,
  BootBlasterEnable,
  BootSubscribeTwistEcho,
  LedOn,
  LedColor,
  LedOff
};

inline constexpr size_t kCommandCount = 38;
inline constexpr CommandId kBootFirst = CommandId::BootEnterSdkMode;
inline constexpr CommandId kBootLast = CommandId::BootSubscribeTwistEcho;

// ═══════════════════════════════════════════════════════════════════════════
// Роли байтов шаблона
// ═══════════════════════════════════════════════════════════════════════════

enum class FieldRole : uint8_t {
  Literal,      ///< Байт шаблона без изменений
  Crc8Marker,   ///< CRC8 от уже выданных байт
  CounterLow,   ///< Младший байт счётчика
  CounterHigh,  ///< Старший байт счётчика
  Parameter     ///< Упакованный параметр команды
};

/**
 * @brief Тег параметра: какой упакованный байт писать в позицию
 *
 * Раскладка Twist воспроизводит протокол устройства бит в бит.
 */
enum class ParamTag : uint8_t {
  None = 0,
  // Twist: x = vx, y = vy, z = vz (11 бит на ось)
  TwistYLow,        ///< y & 0xFF
  TwistXLowYHigh,   ///< (x << 3) | (y >> 8)
  TwistXHigh,       ///< (literal & 0xC0) | (x >> 5)
  TwistZLow,        ///< (z << 4) | 0x08
  TwistZHigh,       ///< z >> 4
  TwistReserved,    ///< 0x00
  TwistZLowShift2,  ///< 0x02 | (z << 2)
  TwistZHighShift6, ///< z >> 6
  TwistModeLow,     ///< 0x04
  TwistEnableMask,  ///< 0x0C: 4 = x-y, 8 = yaw
  TwistModeHigh,    ///< 0x00
  TwistControlMode, ///< 0x04
  // Gimbal: int16 little-endian
  GimbalPitchLow,
  GimbalPitchHigh,
  GimbalYawLow,
  GimbalYawHigh,
  // LED
  LedRed,
  LedGreen,
  LedBlue
};

/**
 * @brief Описание одного байта шаблона
 */
struct FieldDescriptor {
  FieldRole role{FieldRole::Literal};
  uint8_t literal{0};  ///< Исходный байт захваченной команды
  ParamTag param{ParamTag::None};

  [[nodiscard]] bool operator==(const FieldDescriptor&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Шаблон команды
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Неизменяемый шаблон команды
 *
 * Хранит объявленную длину L и L-2 дескриптора; последние два байта
 * зарезервированы под CRC16 и не описываются.
 */
class CommandTemplate {
 public:
  CommandTemplate(CommandId id, uint8_t declared_length,
                  std::vector<FieldDescriptor> fields)
      : id_(id), declared_length_(declared_length), fields_(std::move(fields)) {}

  /**
   * @brief Разметить захваченную команду по ролям байтов
   *
   * Длина берётся из байта 1, CRC8 в позиции 3, счётчик в 6..7, параметры
   * по таблице раскладки.
   * @param id Идентификатор команды
   * @param row Байты захваченной команды (со старым CRC16)
   */
  [[nodiscard]] static CommandTemplate FromRow(CommandId id,
                                               std::span<const uint8_t> row);

  [[nodiscard]] CommandId Id() const noexcept { return id_; }
  [[nodiscard]] uint8_t DeclaredLength() const noexcept {
    return declared_length_;
  }
  [[nodiscard]] std::span<const FieldDescriptor> Fields() const noexcept {
    return fields_;
  }

  /** Длина согласована: L >= 2 и ровно L-2 дескриптора. */
  [[nodiscard]] bool IsConsistent() const noexcept {
    return declared_length_ >= kCrc16Bytes &&
           fields_.size() == static_cast<size_t>(declared_length_) - kCrc16Bytes;
  }

 private:
  static constexpr size_t kCrc16Bytes = 2;

  CommandId id_;
  uint8_t declared_length_;
  std::vector<FieldDescriptor> fields_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Таблица шаблонов
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Таблица всех шаблонов, размечается один раз при первом обращении
 */
class CommandTable {
 public:
  [[nodiscard]] static const CommandTable& Instance();

  /**
   * @brief Найти шаблон по идентификатору
   * @return Шаблон или CommandNotFound
   */
  [[nodiscard]] Result<const CommandTemplate*> Find(CommandId id) const;

  /** Поиск по сырому номеру (0..37). */
  [[nodiscard]] Result<const CommandTemplate*> Find(size_t index) const;

  /**
   * @brief Захваченные байты команды (со счётчиком 0 и исходным CRC16)
   * @return Пустой span для номера вне таблицы
   */
  [[nodiscard]] static std::span<const uint8_t> RawRow(size_t index) noexcept;

  [[nodiscard]] size_t Size() const noexcept { return templates_.size(); }

 private:
  CommandTable();

  std::vector<CommandTemplate> templates_;
};

}  // namespace robomaster::protocol
