#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "command_types.hpp"
#include "error.hpp"
#include "frame_splitter.hpp"

namespace robomaster {

// ═══════════════════════════════════════════════════════════════════════════
// Телеметрия
// ═══════════════════════════════════════════════════════════════════════════

/** Префикс эха команды Twist от шасси; за ним счётчик joy (LE). */
inline constexpr std::array<uint8_t, 6> kTwistEchoPrefix = {0x55, 0x1b, 0x04,
                                                            0x75, 0x09, 0xc3};
inline constexpr size_t kTwistEchoMinSize = 8;

/**
 * @brief Извлечь счётчик joy из кадра телеметрии
 *
 * Кадр подходит, если идентификатор стандартный 0x201, данных не меньше
 * 8 байт и начало совпадает с kTwistEchoPrefix.
 * @return Счётчик из байт 6..7 или std::nullopt
 */
[[nodiscard]] std::optional<uint16_t> ParseTwistEcho(
    const CanFrame& frame) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Базовый класс CAN-шины
// ═══════════════════════════════════════════════════════════════════════════

/**
 * Базовый класс транспорта CAN.
 * Наследники реализуют OpenDevice(), WriteFrame(), ReadFrame(), CloseDevice()
 * под конкретную платформу. Проверки длины, пакетная отправка и разбор
 * телеметрии находятся в базе.
 *
 * @note Наследник обязан вызвать Close() в своём деструкторе.
 */
class CanBusBase {
 public:
  virtual ~CanBusBase() = default;

  CanBusBase(const CanBusBase&) = delete;
  CanBusBase& operator=(const CanBusBase&) = delete;

  /**
   * @brief Открыть интерфейс (например, "can0")
   *
   * Уже открытый интерфейс сначала закрывается.
   * @return true или OpenFailed с именем интерфейса и errno
   */
  [[nodiscard]] Result<bool> Open(std::string_view interface_name);

  /**
   * @brief Отправить кадр
   * @return true, InvalidDataLength при длине > 8, SendFailed при ошибке
   */
  [[nodiscard]] Result<bool> Send(const CanFrame& frame);

  /**
   * @brief Отправить до 8 байт на идентификатор 0x201
   * @return true, InvalidDataLength при длине > 8, SendFailed при ошибке
   */
  [[nodiscard]] Result<bool> Send(std::span<const uint8_t> bytes);

  /**
   * @brief Отправить кадры подряд
   *
   * Останавливается на первой ошибке; кадры после неё не отправляются.
   */
  [[nodiscard]] Result<bool> SendBurst(std::span<const CanFrame> frames);

  /**
   * @brief Принять кадр
   * @param timeout_ms Максимальное ожидание
   * @return Кадр, std::nullopt по таймауту или ReceiveFailed
   */
  [[nodiscard]] Result<std::optional<CanFrame>> Receive(uint32_t timeout_ms);

  /**
   * @brief Принять кадр и синхронизировать счётчик joy по телеметрии
   *
   * При эхе Twist: joy = счётчик устройства + 1. Остальные кадры и таймаут
   * игнорируются.
   * @return true, если счётчик обновлён; ReceiveFailed при ошибке чтения
   */
  [[nodiscard]] Result<bool> ReceiveAndProcess(SequenceCounters& counters,
                                               uint32_t timeout_ms);

  /**
   * @brief Закрыть интерфейс. Повторный вызов ничего не делает.
   */
  void Close() noexcept;

  [[nodiscard]] bool IsOpen() const noexcept { return open_; }
  [[nodiscard]] const std::string& InterfaceName() const noexcept {
    return interface_name_;
  }

 protected:
  CanBusBase() = default;

  /**
   * Открыть устройство (платформенная реализация).
   * @param interface_name Имя интерфейса
   * @return 0 при успехе, иначе errno
   */
  virtual int OpenDevice(std::string_view interface_name) = 0;

  /**
   * Записать кадр (платформенная реализация, блокирующая).
   * @param frame Кадр, len <= 8
   * @return 0 при успехе, иначе errno
   */
  virtual int WriteFrame(const CanFrame& frame) = 0;

  /**
   * Прочитать кадр с таймаутом (платформенная реализация).
   * @param frame Выходной кадр
   * @param timeout_ms Максимальное ожидание
   * @return 1 если кадр прочитан, 0 по таймауту, -errno при ошибке
   */
  virtual int ReadFrame(CanFrame& frame, uint32_t timeout_ms) = 0;

  /**
   * Освободить устройство (платформенная реализация).
   */
  virtual void CloseDevice() noexcept = 0;

 private:
  std::string interface_name_;
  bool open_{false};
};

}  // namespace robomaster
