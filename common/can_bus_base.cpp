#include "can_bus_base.hpp"

#include <algorithm>
#include <cerrno>

namespace robomaster {

std::optional<uint16_t> ParseTwistEcho(const CanFrame& frame) noexcept {
  if (frame.extended || frame.id != kControlArbitrationId) return std::nullopt;
  if (frame.len < kTwistEchoMinSize) return std::nullopt;
  if (!std::equal(kTwistEchoPrefix.begin(), kTwistEchoPrefix.end(),
                  frame.data.begin())) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(frame.data[6] |
                               (static_cast<uint16_t>(frame.data[7]) << 8));
}

// ═══════════════════════════════════════════════════════════════════════════
// Открытие и закрытие
// ═══════════════════════════════════════════════════════════════════════════

Result<bool> CanBusBase::Open(std::string_view interface_name) {
  Close();

  const int err = OpenDevice(interface_name);
  if (err != 0) {
    return Error{ErrorCode::OpenFailed, err, std::string(interface_name)};
  }
  interface_name_ = std::string(interface_name);
  open_ = true;
  return true;
}

void CanBusBase::Close() noexcept {
  if (!open_) return;
  CloseDevice();
  open_ = false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Отправка
// ═══════════════════════════════════════════════════════════════════════════

Result<bool> CanBusBase::Send(const CanFrame& frame) {
  if (frame.len > kMaxFrameData) {
    return MakeError(ErrorCode::InvalidDataLength,
                     std::to_string(frame.len) + " bytes");
  }
  if (!open_) {
    return Error{ErrorCode::SendFailed, EBADF, interface_name_};
  }

  const int err = WriteFrame(frame);
  if (err != 0) {
    return Error{ErrorCode::SendFailed, err, interface_name_};
  }
  return true;
}

Result<bool> CanBusBase::Send(std::span<const uint8_t> bytes) {
  if (bytes.size() > kMaxFrameData) {
    return MakeError(ErrorCode::InvalidDataLength,
                     std::to_string(bytes.size()) + " bytes");
  }
  return Send(MakeControlFrame(bytes));
}

Result<bool> CanBusBase::SendBurst(std::span<const CanFrame> frames) {
  for (const auto& frame : frames) {
    auto sent = Send(frame);
    if (IsError(sent)) return sent;
  }
  return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Приём
// ═══════════════════════════════════════════════════════════════════════════

Result<std::optional<CanFrame>> CanBusBase::Receive(uint32_t timeout_ms) {
  if (!open_) {
    return Error{ErrorCode::ReceiveFailed, EBADF, interface_name_};
  }

  CanFrame frame;
  const int ret = ReadFrame(frame, timeout_ms);
  if (ret < 0) {
    return Error{ErrorCode::ReceiveFailed, -ret, interface_name_};
  }
  if (ret == 0) {
    return std::optional<CanFrame>{};
  }
  return std::optional<CanFrame>{frame};
}

Result<bool> CanBusBase::ReceiveAndProcess(SequenceCounters& counters,
                                           uint32_t timeout_ms) {
  auto received = Receive(timeout_ms);
  if (IsError(received)) return GetError(received);

  const auto& frame = GetValue(received);
  if (!frame) return false;

  auto device_counter = ParseTwistEcho(*frame);
  if (!device_counter) return false;

  counters.joy = *device_counter;
  Advance(counters.joy);
  return true;
}

}  // namespace robomaster
