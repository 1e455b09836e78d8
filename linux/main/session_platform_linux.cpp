#include "session_platform_linux.hpp"

#include <cstdio>
#include <thread>

#include "config.hpp"

namespace robomaster {

static const char* TAG = "robomaster";

SessionPlatformLinux::SessionPlatformLinux() noexcept
    : start_(std::chrono::steady_clock::now()) {}

uint32_t SessionPlatformLinux::GetTimeMs() const noexcept {
  const auto elapsed = std::chrono::steady_clock::now() - start_;
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void SessionPlatformLinux::DelayMs(uint32_t delay_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void SessionPlatformLinux::Log(LogLevel level, std::string_view msg) const {
  if (static_cast<int>(level) < config::LogConfig::kMinLevel) return;

  char prefix = 'I';
  switch (level) {
    case LogLevel::Info:
      prefix = 'I';
      break;
    case LogLevel::Warning:
      prefix = 'W';
      break;
    case LogLevel::Error:
      prefix = 'E';
      break;
  }
  std::fprintf(stderr, "%c (%u) %s: %.*s\n", prefix, GetTimeMs(), TAG,
               static_cast<int>(msg.size()), msg.data());
}

}  // namespace robomaster
