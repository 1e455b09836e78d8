#pragma once

#include <cstdint>

#include "command_types.hpp"

namespace robomaster {

/**
 * @brief Построитель команды движения
 *
 * @example
 * @code
 * auto params = MovementCommand().Forward(0.5f).RotateRight(-0.3f).Params();
 * session.Move(params);
 * @endcode
 */
class MovementCommand {
 public:
  MovementCommand() = default;

  /** Вперёд (+) / назад (-). */
  MovementCommand& Forward(float speed) noexcept {
    params_.vx = detail::ClampUnit(speed);
    return *this;
  }

  /** Вправо (+) / влево (-). */
  MovementCommand& StrafeRight(float speed) noexcept {
    params_.vy = detail::ClampUnit(speed);
    return *this;
  }

  /** Поворот вправо (+) / влево (-). */
  MovementCommand& RotateRight(float speed) noexcept {
    params_.vz = detail::ClampUnit(speed);
    return *this;
  }

  [[nodiscard]] MovementParams Params() const noexcept { return params_; }

 private:
  MovementParams params_{};
};

/**
 * @brief Готовые цвета светодиодов
 */
class LedCommand {
 public:
  [[nodiscard]] static constexpr LedColor Rgb(uint8_t r, uint8_t g,
                                              uint8_t b) noexcept {
    return LedColor{r, g, b};
  }
  [[nodiscard]] static constexpr LedColor Red() noexcept {
    return Rgb(255, 0, 0);
  }
  [[nodiscard]] static constexpr LedColor Green() noexcept {
    return Rgb(0, 255, 0);
  }
  [[nodiscard]] static constexpr LedColor Blue() noexcept {
    return Rgb(0, 0, 255);
  }
  [[nodiscard]] static constexpr LedColor White() noexcept {
    return Rgb(255, 255, 255);
  }
  [[nodiscard]] static constexpr LedColor Off() noexcept {
    return Rgb(0, 0, 0);
  }
};

}  // namespace robomaster
