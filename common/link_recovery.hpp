#pragma once

#include <cstdint>

#include "config.hpp"
#include "error.hpp"

namespace robomaster {

class ControlSession;
class SessionPlatform;

/**
 * @brief Действие после ошибки транспорта
 */
enum class RecoveryAction : uint8_t {
  RetryAfterDelay = 0,  ///< Подождать recovery_delay_ms и повторить
  Reinitialize,         ///< Переоткрыть шину и отправить загрузку
  Abort                 ///< Ошибка не лечится повтором
};

/**
 * @brief Параметры восстановления связи
 */
struct RecoveryOptions {
  uint32_t recovery_delay_ms{config::RecoveryConfig::kDelayMs};
  uint32_t max_init_attempts{config::RecoveryConfig::kMaxInitAttempts};
  uint32_t recovery_error_threshold{config::RecoveryConfig::kErrorThreshold};
};

/**
 * @brief LinkRecovery - счётчик ошибок шины подряд
 *
 * Считает последовательные восстановимые ошибки (SendFailed,
 * ReceiveFailed). После recovery_error_threshold ошибок подряд требует
 * переинициализацию, затем начинает счёт заново. Любой успех сбрасывает
 * счёт.
 *
 * @example
 * @code
 * LinkRecovery recovery;
 * auto r = session.SendTouch();
 * if (IsOk(r)) {
 *   recovery.OnSuccess();
 * } else if (recovery.OnFailure(GetError(r)) == RecoveryAction::Reinitialize) {
 *   session.Reconnect();
 * }
 * @endcode
 */
class LinkRecovery {
 public:
  explicit LinkRecovery(RecoveryOptions options = {}) noexcept
      : options_(options) {}

  /** Успешная операция: счёт ошибок сбрасывается. */
  void OnSuccess() noexcept { consecutive_failures_ = 0; }

  /**
   * @brief Учесть ошибку и выбрать действие
   * @param error Ошибка операции
   * @return Abort для невосстановимых ошибок, Reinitialize при достижении
   * порога, иначе RetryAfterDelay
   */
  [[nodiscard]] RecoveryAction OnFailure(const Error& error) noexcept;

  [[nodiscard]] uint32_t ConsecutiveFailures() const noexcept {
    return consecutive_failures_;
  }

  /** Сколько раз требовалась переинициализация. */
  [[nodiscard]] uint32_t ReinitCount() const noexcept { return reinit_count_; }

  [[nodiscard]] const RecoveryOptions& Options() const noexcept {
    return options_;
  }

 private:
  RecoveryOptions options_;
  uint32_t consecutive_failures_{0};
  uint32_t reinit_count_{0};
};

/**
 * @brief Инициализация с повторами
 *
 * До max_init_attempts вызовов Initialize() с паузой recovery_delay_ms между
 * ними. SessionClosed прерывает попытки сразу.
 * @return true или ошибка последней попытки
 */
[[nodiscard]] Result<bool> InitializeWithRetry(ControlSession& session,
                                               SessionPlatform& platform,
                                               const RecoveryOptions& options);

}  // namespace robomaster
