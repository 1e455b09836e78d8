#pragma once

// Общие параметры, не зависящие от конкретной платформы.
// Подключается из config.hpp; любое значение можно переопределить через -D.

// CAN-интерфейс по умолчанию.
#ifndef ROBOMASTER_CAN_INTERFACE
#define ROBOMASTER_CAN_INTERFACE "can0"
#endif

// Ожидание кадра при приёме телеметрии.
#ifndef ROBOMASTER_RECEIVE_TIMEOUT_MS
#define ROBOMASTER_RECEIVE_TIMEOUT_MS 200
#endif

// Пауза после загрузочной последовательности.
#ifndef ROBOMASTER_BOOT_SETTLE_MS
#define ROBOMASTER_BOOT_SETTLE_MS 500
#endif

// Восстановление связи.
#ifndef ROBOMASTER_RECOVERY_DELAY_MS
#define ROBOMASTER_RECOVERY_DELAY_MS 1000
#endif
#ifndef ROBOMASTER_MAX_INIT_ATTEMPTS
#define ROBOMASTER_MAX_INIT_ATTEMPTS 3
#endif
#ifndef ROBOMASTER_RECOVERY_ERROR_THRESHOLD
#define ROBOMASTER_RECOVERY_ERROR_THRESHOLD 5
#endif

// Период touch-команды (keepalive).
#ifndef ROBOMASTER_TOUCH_INTERVAL_MS
#define ROBOMASTER_TOUCH_INTERVAL_MS 100
#endif

// Минимальный уровень лога: 0 = Info, 1 = Warning, 2 = Error.
#ifndef ROBOMASTER_LOG_LEVEL
#define ROBOMASTER_LOG_LEVEL 0
#endif
