#include <csignal>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include "command_presets.hpp"
#include "config.hpp"
#include "control_session.hpp"
#include "link_recovery.hpp"
#include "session_platform_linux.hpp"
#include "socketcan_bus.hpp"

using namespace robomaster;

namespace {

volatile std::sig_atomic_t s_stop_requested = 0;

void OnSignal(int) { s_stop_requested = 1; }

/**
 * Обработать результат команды: счёт ошибок и переподключение.
 * @return false, если продолжать нельзя
 */
bool HandleResult(const Result<bool>& result, ControlSession& session,
                  LinkRecovery& recovery, SessionPlatform& platform) {
  if (IsOk(result)) {
    recovery.OnSuccess();
    return true;
  }

  switch (recovery.OnFailure(GetError(result))) {
    case RecoveryAction::RetryAfterDelay:
      platform.DelayMs(recovery.Options().recovery_delay_ms);
      return true;
    case RecoveryAction::Reinitialize:
      platform.Log(LogLevel::Warning, "Too many CAN errors, reconnecting");
      if (auto reconnected = session.Reconnect(); IsError(reconnected)) {
        platform.Log(LogLevel::Error,
                     "Reconnect failed: " + Describe(GetError(reconnected)));
        return false;
      }
      return true;
    case RecoveryAction::Abort:
      platform.Log(LogLevel::Error,
                   "Unrecoverable error: " + Describe(GetError(result)));
      return false;
  }
  return false;
}

// Остановка перед выходом, ошибка только в лог
void StopRobot(ControlSession& session, SessionPlatform& platform) {
  if (auto stopped = session.Stop(); IsError(stopped)) {
    platform.Log(LogLevel::Warning,
                 "Stop failed: " + Describe(GetError(stopped)));
  }
}

// Держит паузу, продолжая keepalive и приём телеметрии
bool RunKeepalive(uint32_t duration_ms, ControlSession& session,
                  LinkRecovery& recovery, SessionPlatform& platform) {
  const uint32_t start = platform.GetTimeMs();
  while (!s_stop_requested && platform.GetTimeMs() - start < duration_ms) {
    const uint32_t tick = platform.GetTimeMs();
    if (!HandleResult(session.SendTouch(), session, recovery, platform)) {
      return false;
    }
    if (!HandleResult(session.ReceiveMessages(), session, recovery,
                      platform)) {
      return false;
    }
    const uint32_t spent = platform.GetTimeMs() - tick;
    if (spent < config::KeepaliveConfig::kTouchIntervalMs) {
      platform.DelayMs(config::KeepaliveConfig::kTouchIntervalMs - spent);
    }
  }
  return !s_stop_requested;
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  SessionOptions options;
  if (argc > 1) options.interface_name = argv[1];

  SessionPlatformLinux platform;
  platform.Log(LogLevel::Info, "RoboMaster CAN control starting on " +
                                   options.interface_name);

  ControlSession session(std::make_unique<SocketCanBus>(), platform, options);
  if (auto opened = session.Open(); IsError(opened)) {
    std::fprintf(stderr, "Failed to open %s: %s\n",
                 options.interface_name.c_str(),
                 Describe(GetError(opened)).c_str());
    return 1;
  }

  const RecoveryOptions recovery_options;
  if (auto init = InitializeWithRetry(session, platform, recovery_options);
      IsError(init)) {
    Shutdown(std::move(session));
    return 1;
  }

  LinkRecovery recovery(recovery_options);

  // Проверка светодиодов
  for (const LedColor color : {LedCommand::Red(), LedCommand::Green(),
                               LedCommand::Blue(), LedCommand::White()}) {
    if (!HandleResult(session.ControlLed(color), session, recovery,
                      platform) ||
        !RunKeepalive(500, session, recovery, platform)) {
      Shutdown(std::move(session));
      return s_stop_requested ? 0 : 1;
    }
  }

  // Короткий манёвр: вперёд, поворот, стоп
  const MovementParams pattern[] = {
      MovementCommand().Forward(0.3f).Params(),
      MovementCommand().RotateRight(0.3f).Params(),
      MovementParams{},
  };
  for (const auto& step : pattern) {
    if (!HandleResult(session.Move(step), session, recovery, platform) ||
        !RunKeepalive(1000, session, recovery, platform)) {
      StopRobot(session, platform);
      Shutdown(std::move(session));
      return s_stop_requested ? 0 : 1;
    }
  }

  // Удержание связи до Ctrl+C
  platform.Log(LogLevel::Info, "Keepalive running, press Ctrl+C to stop");
  while (!s_stop_requested) {
    if (!RunKeepalive(1000, session, recovery, platform)) break;
  }

  StopRobot(session, platform);
  if (auto led = session.ControlLed(LedCommand::Off()); IsError(led)) {
    platform.Log(LogLevel::Warning, "LED off failed: " + Describe(GetError(led)));
  }
  const SequenceCounters counters = session.Counters();
  platform.Log(LogLevel::Info,
               "Counters joy=" + std::to_string(counters.joy) +
                   " led=" + std::to_string(counters.led) +
                   " gimbal=" + std::to_string(counters.gimbal) +
                   " reinit=" + std::to_string(recovery.ReinitCount()));
  Shutdown(std::move(session));
  return s_stop_requested ? 0 : 1;
}
