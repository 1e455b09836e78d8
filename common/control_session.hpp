#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "can_bus_base.hpp"
#include "command_types.hpp"
#include "config.hpp"
#include "error.hpp"
#include "session_platform.hpp"

namespace robomaster {

/**
 * @brief Состояние сессии управления
 */
enum class SessionState : uint8_t {
  Uninitialized = 0,  ///< Загрузочная последовательность не отправлена
  Initializing,       ///< Идёт отправка загрузочной последовательности
  Ready,              ///< Робот принимает команды движения
  Closed              ///< Сессия завершена, шина закрыта
};

/**
 * @brief Параметры сессии
 */
struct SessionOptions {
  std::string interface_name{config::CanConfig::kInterface};
  uint32_t receive_timeout_ms{config::CanConfig::kReceiveTimeoutMs};
  uint32_t settle_delay_ms{config::SessionConfig::kBootSettleMs};
};

/**
 * @brief Сессия управления роботом по CAN
 *
 * Владеет шиной и счётчиками последовательности. Загрузочная
 * последовательность отправляется один раз: явно через Initialize() или
 * лениво при первом Move(). Счётчик семейства увеличивается только после
 * полной отправки команды.
 *
 * Не потокобезопасна: вызовы должны идти из одного потока.
 *
 * @example
 * @code
 * ControlSession session(std::make_unique<SocketCanBus>(), platform);
 * if (IsOk(session.Open())) {
 *   session.Move(MovementCommand().Forward(0.5f).Params());
 *   session.Stop();
 *   std::move(session).Shutdown();
 * }
 * @endcode
 */
class ControlSession {
 public:
  /**
   * @brief Конструктор
   * @param bus Шина (сессия становится владельцем)
   * @param platform Платформенные сервисы, должны пережить сессию
   * @param options Параметры сессии
   */
  ControlSession(std::unique_ptr<CanBusBase> bus, SessionPlatform& platform,
                 SessionOptions options = {});

  /** Закрывает шину, если Shutdown() не вызывался. */
  ~ControlSession();

  ControlSession(const ControlSession&) = delete;
  ControlSession& operator=(const ControlSession&) = delete;
  ControlSession(ControlSession&&) noexcept = default;
  ControlSession& operator=(ControlSession&&) noexcept = default;

  // ─────────────────────────────────────────────────────────────────────────
  // Жизненный цикл
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Открыть CAN-интерфейс из параметров сессии
   * @return true или OpenFailed
   */
  [[nodiscard]] Result<bool> Open();

  /**
   * @brief Отправить загрузочную последовательность
   *
   * Ничего не делает в состоянии Ready. После отправки ждёт
   * settle_delay_ms. При ошибке сессия возвращается в Uninitialized.
   */
  [[nodiscard]] Result<bool> Initialize();

  /** Инициализировать, если ещё не инициализирована. */
  [[nodiscard]] Result<bool> EnsureInitialized();

  /**
   * @brief Переоткрыть интерфейс и заново отправить загрузку
   */
  [[nodiscard]] Result<bool> Reconnect();

  /**
   * @brief Завершить сессию
   *
   * Закрывает шину и переводит сессию в Closed. Квалификатор `&&` лишь
   * сигнал вызывающему: объект остаётся живым, дальнейшие команды
   * возвращают SessionClosed. Поглощающий вариант: свободная
   * Shutdown(ControlSession). Ошибок не возвращает.
   */
  void Shutdown() &&;

  // ─────────────────────────────────────────────────────────────────────────
  // Команды
  // ─────────────────────────────────────────────────────────────────────────

  /**
   * @brief Движение шасси
   *
   * Вместе с Twist отправляет команду подвеса: тангаж 0, рыскание = vz.
   * Счётчики joy и gimbal увеличиваются на 1.
   */
  [[nodiscard]] Result<bool> Move(const MovementParams& params);

  /** Move с нулевыми скоростями. */
  [[nodiscard]] Result<bool> Stop();

  /**
   * @brief Цвет светодиодов (инициализация не требуется)
   */
  [[nodiscard]] Result<bool> ControlLed(const LedColor& color);

  /** Keepalive: два кадра touch, счётчик joy + 1. */
  [[nodiscard]] Result<bool> SendTouch();

  /**
   * @brief Принять телеметрию и синхронизировать счётчик joy
   * @return true, если счётчик обновлён
   */
  [[nodiscard]] Result<bool> ReceiveMessages();

  // ─────────────────────────────────────────────────────────────────────────
  // Состояние
  // ─────────────────────────────────────────────────────────────────────────

  [[nodiscard]] SessionState State() const noexcept { return state_; }
  [[nodiscard]] bool IsReady() const noexcept {
    return state_ == SessionState::Ready;
  }
  [[nodiscard]] const SequenceCounters& Counters() const noexcept {
    return counters_;
  }
  [[nodiscard]] const std::string& InterfaceName() const noexcept {
    return options_.interface_name;
  }
  [[nodiscard]] const SessionOptions& Options() const noexcept {
    return options_;
  }

 private:
  [[nodiscard]] Result<bool> CheckUsable() const;
  [[nodiscard]] Result<bool> SendCommand(std::span<const uint8_t> bytes);
  void Log(LogLevel level, std::string_view msg) const;

  std::unique_ptr<CanBusBase> bus_;
  SessionPlatform* platform_;
  SessionOptions options_;
  SequenceCounters counters_{};
  SessionState state_{SessionState::Uninitialized};
};

/**
 * @brief Завершить сессию, забрав владение
 *
 * Сессия принимается по значению: у вызывающего остаётся moved-from объект
 * без шины, любая команда на нём возвращает SessionClosed.
 */
void Shutdown(ControlSession session);

}  // namespace robomaster
