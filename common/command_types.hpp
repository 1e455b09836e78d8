#pragma once

#include <cmath>
#include <cstdint>

namespace robomaster {

namespace detail {

/** Ограничить значение диапазоном [-1.0, 1.0]; NaN превращается в 0. */
[[nodiscard]] inline float ClampUnit(float val) noexcept {
  if (std::isnan(val)) return 0.0f;
  if (val > 1.0f) return 1.0f;
  if (val < -1.0f) return -1.0f;
  return val;
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Параметры команд
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Скорости шасси, нормализованные [-1.0, 1.0]
 */
struct MovementParams {
  float vx{0.0f};  ///< Вперёд/назад
  float vy{0.0f};  ///< Вбок (вправо +)
  float vz{0.0f};  ///< Поворот (вправо +)

  [[nodiscard]] MovementParams Clamped() const noexcept {
    return MovementParams{detail::ClampUnit(vx), detail::ClampUnit(vy),
                          detail::ClampUnit(vz)};
  }

  [[nodiscard]] bool operator==(const MovementParams&) const = default;
};

/**
 * @brief Углы подвеса, нормализованные [-1.0, 1.0]
 */
struct GimbalParams {
  float ry{0.0f};  ///< Тангаж
  float rz{0.0f};  ///< Рыскание

  [[nodiscard]] GimbalParams Clamped() const noexcept {
    return GimbalParams{detail::ClampUnit(ry), detail::ClampUnit(rz)};
  }
};

/**
 * @brief Цвет светодиодов
 */
struct LedColor {
  uint8_t red{0};
  uint8_t green{0};
  uint8_t blue{0};

  [[nodiscard]] bool operator==(const LedColor&) const = default;
};

// ═══════════════════════════════════════════════════════════════════════════
// Счётчики последовательности
// ═══════════════════════════════════════════════════════════════════════════

/**
 * @brief Счётчики семейств команд
 *
 * Каждый увеличивается на 1 после успешной отправки команды своего
 * семейства. Переполнение 65535 -> 0 штатное.
 */
struct SequenceCounters {
  uint16_t joy{0};     ///< Twist и touch
  uint16_t led{0};     ///< Светодиоды
  uint16_t gimbal{0};  ///< Подвес

  [[nodiscard]] bool operator==(const SequenceCounters&) const = default;
};

/** Увеличить счётчик по модулю 65536. */
inline void Advance(uint16_t& counter) noexcept {
  counter = static_cast<uint16_t>(counter + 1);
}

}  // namespace robomaster
