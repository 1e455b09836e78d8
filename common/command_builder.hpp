#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "command_table.hpp"
#include "command_types.hpp"
#include "crc.hpp"
#include "error.hpp"

namespace robomaster::protocol {

// ═══════════════════════════════════════════════════════════════════════════
// Константы кодирования
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr float kAxisScale = 256.0f;
inline constexpr float kAxisOffset = 1024.0f;
inline constexpr uint16_t kAxisMax = 2047;  // 11 бит
inline constexpr float kAngleScale = -1024.0f;

inline constexpr size_t kTouchHeadSize = 8;
inline constexpr size_t kTouchTailSize = 7;  // 5 байт + CRC16

// ═══════════════════════════════════════════════════════════════════════════
// Концепты
// ═══════════════════════════════════════════════════════════════════════════

/** Кодировщик параметров: (тег, байт шаблона) -> байт команды. */
template <typename T>
concept ParameterEncoder = requires(const T& e, ParamTag tag, uint8_t literal) {
  { e(tag, literal) } -> std::convertible_to<uint8_t>;
};

/** Кодировщик без параметров: байт шаблона остаётся как есть. */
struct LiteralEncoder {
  constexpr uint8_t operator()(ParamTag, uint8_t literal) const noexcept {
    return literal;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Типы данных
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Команда touch: два кадра, CRC16 от обоих только во втором
 */
struct TouchCommand {
  std::array<uint8_t, kTouchHeadSize> head{};
  std::array<uint8_t, kTouchTailSize> tail{};
};

// ═══════════════════════════════════════════════════════════════════════════
// Построитель команд
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Сборка команд из шаблонов
 *
 * Проход по байтам 0..L-3 шаблона: маркер CRC8 получает CRC8 уже выданных
 * байт, позиции 6/7 получают счётчик, позиции параметров получают
 * упакованные значения, остальные байты копируются. В конец дописывается
 * CRC16 (little-endian).
 */
class CommandBuilder {
 public:
  /**
   * @brief Собрать команду по шаблону
   * @param tmpl Шаблон
   * @param counter Значение счётчика для позиций 6..7
   * @param encoder Кодировщик параметров
   * @return Готовая команда или InvalidCommandLength
   */
  template <ParameterEncoder Encoder>
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildFromTemplate(
      const CommandTemplate& tmpl, uint16_t counter, const Encoder& encoder);

  /** Собрать команду без параметров. */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildFromTemplate(
      const CommandTemplate& tmpl, uint16_t counter) {
    return BuildFromTemplate(tmpl, counter, LiteralEncoder{});
  }

  /**
   * @brief Собрать любую команду таблицы с заданным счётчиком
   * @return Команда или CommandNotFound / InvalidCommandLength
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildGeneric(
      CommandId id, uint16_t counter);

  /**
   * @brief Команда движения шасси (счётчик joy)
   * @param params Скорости, ограничиваются [-1.0, 1.0]
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildTwist(
      const MovementParams& params, const SequenceCounters& counters);

  /**
   * @brief Команда подвеса (счётчик gimbal)
   * @param params Углы, ограничиваются [-1.0, 1.0]
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildGimbal(
      const GimbalParams& params, const SequenceCounters& counters);

  /** Цвет светодиодов (счётчик led). */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildLed(
      const LedColor& color, const SequenceCounters& counters);

  /** Включение светодиодов. */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildLedOn(
      uint16_t counter);

  /** Команда touch (счётчик joy). */
  [[nodiscard]] static TouchCommand BuildTouch(
      const SequenceCounters& counters) noexcept;

  /**
   * @brief Загрузочная последовательность
   *
   * Команды kBootFirst..kBootLast и включение светодиодов, все со счётчиком
   * 0, склеенные в один буфер.
   */
  [[nodiscard]] static Result<std::vector<uint8_t>> BuildBootSequence();

  // ─────────────────────────────────────────────────────────────────────────
  // Фиксированная точка
  // ─────────────────────────────────────────────────────────────────────────

  /** clamp(round(256 * v + 1024), 0, 2047) */
  [[nodiscard]] static uint16_t EncodeAxis(float v) noexcept;

  /** round(-1024 * r) */
  [[nodiscard]] static int16_t EncodeAngle(float r) noexcept;
};

// ═══════════════════════════════════════════════════════════════════════════
// Реализация шаблонного метода
// ═══════════════════════════════════════════════════════════════════════════

template <ParameterEncoder Encoder>
Result<std::vector<uint8_t>> CommandBuilder::BuildFromTemplate(
    const CommandTemplate& tmpl, uint16_t counter, const Encoder& encoder) {
  if (!tmpl.IsConsistent()) {
    return MakeError(ErrorCode::InvalidCommandLength,
                     "command " +
                         std::to_string(static_cast<unsigned>(tmpl.Id())) +
                         " length " +
                         std::to_string(tmpl.DeclaredLength()));
  }

  std::vector<uint8_t> out;
  out.reserve(tmpl.DeclaredLength());
  for (const auto& field : tmpl.Fields()) {
    switch (field.role) {
      case FieldRole::Crc8Marker:
        out.push_back(CalculateCrc8(out));
        break;
      case FieldRole::CounterLow:
        out.push_back(counter & 0xFF);
        break;
      case FieldRole::CounterHigh:
        out.push_back((counter >> 8) & 0xFF);
        break;
      case FieldRole::Parameter:
        out.push_back(static_cast<uint8_t>(encoder(field.param, field.literal)));
        break;
      case FieldRole::Literal:
        out.push_back(field.literal);
        break;
    }
  }
  AppendCrc16(out);
  return out;
}

}  // namespace robomaster::protocol
