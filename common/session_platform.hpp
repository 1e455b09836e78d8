#pragma once

#include <cstdint>
#include <string_view>

namespace robomaster {

/**
 * @brief Уровни логирования
 */
enum class LogLevel : uint8_t { Info = 0, Warning, Error };

/**
 * @brief Абстрактный интерфейс платформы для ControlSession
 *
 * Платформенные сервисы: логирование, монотонное время, задержки.
 * Реализация предоставляется целевой платформой (Linux) или тестами.
 */
class SessionPlatform {
 public:
  virtual ~SessionPlatform() = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Время
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Текущее время в миллисекундах
   * @return Монотонное время с момента старта
   */
  [[nodiscard]] virtual uint32_t GetTimeMs() const noexcept = 0;

  /**
   * @brief Блокирующая задержка
   * @param delay_ms Длительность в миллисекундах
   */
  virtual void DelayMs(uint32_t delay_ms) = 0;

  // ─────────────────────────────────────────────────────────────────────────
  // Логирование
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Вывод лог-сообщения
   * @param level Уровень важности
   * @param msg Текст сообщения (UTF-8)
   */
  virtual void Log(LogLevel level, std::string_view msg) const = 0;
};

}  // namespace robomaster
