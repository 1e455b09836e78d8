#pragma once

#include <cstdint>

#include "config_common.hpp"

namespace robomaster::config {

/**
 * @brief Конфигурация CAN-шины
 */
struct CanConfig {
  static constexpr const char* kInterface =
      ROBOMASTER_CAN_INTERFACE;  ///< Интерфейс по умолчанию
  static constexpr uint32_t kReceiveTimeoutMs =
      ROBOMASTER_RECEIVE_TIMEOUT_MS;  ///< Ожидание кадра телеметрии
};

/**
 * @brief Конфигурация сессии управления
 */
struct SessionConfig {
  static constexpr uint32_t kBootSettleMs =
      ROBOMASTER_BOOT_SETTLE_MS;  ///< Пауза после загрузки
};

/**
 * @brief Конфигурация восстановления связи
 */
struct RecoveryConfig {
  static constexpr uint32_t kDelayMs =
      ROBOMASTER_RECOVERY_DELAY_MS;  ///< Пауза между попытками
  static constexpr uint32_t kMaxInitAttempts =
      ROBOMASTER_MAX_INIT_ATTEMPTS;  ///< Попыток инициализации
  static constexpr uint32_t kErrorThreshold =
      ROBOMASTER_RECOVERY_ERROR_THRESHOLD;  ///< Ошибок подряд до
                                            ///< переинициализации
};

/**
 * @brief Конфигурация keepalive
 */
struct KeepaliveConfig {
  static constexpr uint32_t kTouchIntervalMs =
      ROBOMASTER_TOUCH_INTERVAL_MS;  ///< Период touch (10 Hz)
};

/**
 * @brief Конфигурация лога
 */
struct LogConfig {
  static constexpr int kMinLevel = ROBOMASTER_LOG_LEVEL;
};

}  // namespace robomaster::config
