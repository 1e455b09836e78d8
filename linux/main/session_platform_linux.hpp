#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

#include "session_platform.hpp"

namespace robomaster {

/**
 * @brief Реализация SessionPlatform для Linux
 *
 * Лог в stderr в формате "I (1234) robomaster: текст", уровни ниже
 * ROBOMASTER_LOG_LEVEL отбрасываются. Время от steady_clock с момента
 * создания платформы.
 */
class SessionPlatformLinux : public SessionPlatform {
 public:
  SessionPlatformLinux() noexcept;

  [[nodiscard]] uint32_t GetTimeMs() const noexcept override;
  void DelayMs(uint32_t delay_ms) override;
  void Log(LogLevel level, std::string_view msg) const override;

 private:
  std::chrono::steady_clock::time_point start_;
};

}  // namespace robomaster
