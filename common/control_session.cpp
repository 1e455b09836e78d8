#include "control_session.hpp"

#include <array>
#include <utility>
#include <vector>

#include "command_builder.hpp"
#include "frame_splitter.hpp"

namespace robomaster {

using protocol::CommandBuilder;

ControlSession::ControlSession(std::unique_ptr<CanBusBase> bus,
                               SessionPlatform& platform,
                               SessionOptions options)
    : bus_(std::move(bus)), platform_(&platform), options_(std::move(options)) {}

ControlSession::~ControlSession() {
  if (bus_) bus_->Close();
}

// ═════════════════════════════════════════════════════════════════════════
// Вспомогательные методы
// ═════════════════════════════════════════════════════════════════════════

void ControlSession::Log(LogLevel level, std::string_view msg) const {
  if (platform_) platform_->Log(level, msg);
}

Result<bool> ControlSession::CheckUsable() const {
  if (state_ == SessionState::Closed || !bus_) {
    return MakeError(ErrorCode::SessionClosed, options_.interface_name);
  }
  return true;
}

Result<bool> ControlSession::SendCommand(std::span<const uint8_t> bytes) {
  const std::vector<CanFrame> frames = SplitIntoFrames(bytes);
  return bus_->SendBurst(frames);
}

// ═════════════════════════════════════════════════════════════════════════
// Жизненный цикл
// ═════════════════════════════════════════════════════════════════════════

Result<bool> ControlSession::Open() {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;

  auto opened = bus_->Open(options_.interface_name);
  if (IsError(opened)) {
    Log(LogLevel::Error, "CAN open failed: " + Describe(GetError(opened)));
    return opened;
  }
  Log(LogLevel::Info, "CAN interface " + options_.interface_name + " opened");
  return true;
}

Result<bool> ControlSession::Initialize() {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;
  if (state_ == SessionState::Ready) return true;

  state_ = SessionState::Initializing;
  Log(LogLevel::Info, "Sending boot sequence");

  auto boot = CommandBuilder::BuildBootSequence();
  if (IsError(boot)) {
    state_ = SessionState::Uninitialized;
    Log(LogLevel::Error, "Boot sequence build failed: " +
                             Describe(GetError(boot)));
    return GetError(boot);
  }

  auto sent = SendCommand(GetValue(boot));
  if (IsError(sent)) {
    state_ = SessionState::Uninitialized;
    Log(LogLevel::Error, "Boot sequence send failed: " +
                             Describe(GetError(sent)));
    return sent;
  }

  platform_->DelayMs(options_.settle_delay_ms);
  state_ = SessionState::Ready;
  Log(LogLevel::Info, "Robot initialized");
  return true;
}

Result<bool> ControlSession::EnsureInitialized() {
  if (state_ == SessionState::Ready) return true;
  return Initialize();
}

Result<bool> ControlSession::Reconnect() {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;

  Log(LogLevel::Warning, "Reconnecting to " + options_.interface_name);
  bus_->Close();
  state_ = SessionState::Uninitialized;

  auto opened = Open();
  if (IsError(opened)) return opened;
  return Initialize();
}

void ControlSession::Shutdown() && {
  if (state_ == SessionState::Closed) return;
  if (bus_) bus_->Close();
  state_ = SessionState::Closed;
  Log(LogLevel::Info, "Session closed");
}

void Shutdown(ControlSession session) { std::move(session).Shutdown(); }

// ═════════════════════════════════════════════════════════════════════════
// Команды
// ═════════════════════════════════════════════════════════════════════════

Result<bool> ControlSession::Move(const MovementParams& params) {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;
  if (auto init = EnsureInitialized(); IsError(init)) return init;

  const MovementParams clamped = params.Clamped();
  auto twist = CommandBuilder::BuildTwist(clamped, counters_);
  if (IsError(twist)) return GetError(twist);
  auto gimbal = CommandBuilder::BuildGimbal(
      GimbalParams{.ry = 0.0f, .rz = clamped.vz}, counters_);
  if (IsError(gimbal)) return GetError(gimbal);

  if (auto sent = SendCommand(GetValue(twist)); IsError(sent)) {
    Log(LogLevel::Warning, "Twist send failed: " + Describe(GetError(sent)));
    return sent;
  }
  Advance(counters_.joy);

  if (auto sent = SendCommand(GetValue(gimbal)); IsError(sent)) {
    Log(LogLevel::Warning, "Gimbal send failed: " + Describe(GetError(sent)));
    return sent;
  }
  Advance(counters_.gimbal);
  return true;
}

Result<bool> ControlSession::Stop() { return Move(MovementParams{}); }

Result<bool> ControlSession::ControlLed(const LedColor& color) {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;

  auto led = CommandBuilder::BuildLed(color, counters_);
  if (IsError(led)) return GetError(led);

  if (auto sent = SendCommand(GetValue(led)); IsError(sent)) {
    Log(LogLevel::Warning, "LED send failed: " + Describe(GetError(sent)));
    return sent;
  }
  Advance(counters_.led);
  return true;
}

Result<bool> ControlSession::SendTouch() {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;

  const auto touch = CommandBuilder::BuildTouch(counters_);
  const std::array<CanFrame, 2> frames = {MakeControlFrame(touch.head),
                                          MakeControlFrame(touch.tail)};
  if (auto sent = bus_->SendBurst(frames); IsError(sent)) {
    Log(LogLevel::Warning, "Touch send failed: " + Describe(GetError(sent)));
    return sent;
  }
  Advance(counters_.joy);
  return true;
}

Result<bool> ControlSession::ReceiveMessages() {
  if (auto usable = CheckUsable(); IsError(usable)) return usable;
  return bus_->ReceiveAndProcess(counters_, options_.receive_timeout_ms);
}

}  // namespace robomaster
