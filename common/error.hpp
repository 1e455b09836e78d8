#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace robomaster {

// ═══════════════════════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Коды ошибок движка команд
 */
enum class ErrorCode : uint8_t {
  OpenFailed,            ///< Не удалось открыть CAN-интерфейс
  SendFailed,            ///< Ошибка записи кадра в шину
  ReceiveFailed,         ///< Ошибка чтения из шины (не таймаут)
  InvalidDataLength,     ///< Кадр длиннее 8 байт
  CommandNotFound,       ///< Идентификатор вне таблицы шаблонов
  InvalidCommandLength,  ///< Длина шаблона не согласована с полями
  SessionClosed          ///< Сессия уже завершена
};

/**
 * @brief Категория ошибки
 */
enum class ErrorCategory : uint8_t {
  Transport,  ///< Шина CAN
  Protocol,   ///< Сборка команд
  State       ///< Жизненный цикл сессии
};

/**
 * @brief Ошибка с контекстом
 *
 * os_error хранит errno (0, если ошибка не от ОС), detail содержит имя
 * интерфейса или иной контекст для лога.
 */
struct Error {
  ErrorCode code{ErrorCode::SendFailed};
  int os_error{0};
  std::string detail;

  [[nodiscard]] bool operator==(const Error& other) const noexcept {
    return code == other.code && os_error == other.os_error &&
           detail == other.detail;
  }
};

// ═══════════════════════════════════════════════════════════════════════════
// Result type (альтернатива std::expected для C++23)
// ═══════════════════════════════════════════════════════════════════════════

template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
[[nodiscard]] inline bool IsOk(const Result<T>& r) noexcept {
  return std::holds_alternative<T>(r);
}

template <typename T>
[[nodiscard]] inline bool IsError(const Result<T>& r) noexcept {
  return std::holds_alternative<Error>(r);
}

template <typename T>
[[nodiscard]] inline const T& GetValue(const Result<T>& r) noexcept {
  return std::get<T>(r);
}

template <typename T>
[[nodiscard]] inline const Error& GetError(const Result<T>& r) noexcept {
  return std::get<Error>(r);
}

// ═══════════════════════════════════════════════════════════════════════════
// Утилиты
// ═══════════════════════════════════════════════════════════════════════════

/** Создать ошибку без контекста ОС. */
[[nodiscard]] inline Error MakeError(ErrorCode code,
                                     std::string detail = {}) {
  return Error{code, 0, std::move(detail)};
}

/** Категория кода ошибки. */
[[nodiscard]] ErrorCategory CategoryOf(ErrorCode code) noexcept;

/**
 * @brief Можно ли повторить операцию после ошибки
 * @return true только для сбоев чтения/записи шины
 */
[[nodiscard]] bool IsRecoverable(const Error& error) noexcept;

/** Имя кода ошибки (для логов и тестов). */
[[nodiscard]] std::string_view ToString(ErrorCode code) noexcept;

/** Имя категории. */
[[nodiscard]] std::string_view ToString(ErrorCategory category) noexcept;

/**
 * @brief Строка для лога: "SendFailed (transport): can0: No buffer space"
 */
[[nodiscard]] std::string Describe(const Error& error);

}  // namespace robomaster
