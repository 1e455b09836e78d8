#include "error.hpp"

#include <cstring>

namespace robomaster {

ErrorCategory CategoryOf(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::OpenFailed:
    case ErrorCode::SendFailed:
    case ErrorCode::ReceiveFailed:
    case ErrorCode::InvalidDataLength:
      return ErrorCategory::Transport;
    case ErrorCode::CommandNotFound:
    case ErrorCode::InvalidCommandLength:
      return ErrorCategory::Protocol;
    case ErrorCode::SessionClosed:
      return ErrorCategory::State;
  }
  return ErrorCategory::State;
}

bool IsRecoverable(const Error& error) noexcept {
  return error.code == ErrorCode::SendFailed ||
         error.code == ErrorCode::ReceiveFailed;
}

std::string_view ToString(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::OpenFailed:
      return "OpenFailed";
    case ErrorCode::SendFailed:
      return "SendFailed";
    case ErrorCode::ReceiveFailed:
      return "ReceiveFailed";
    case ErrorCode::InvalidDataLength:
      return "InvalidDataLength";
    case ErrorCode::CommandNotFound:
      return "CommandNotFound";
    case ErrorCode::InvalidCommandLength:
      return "InvalidCommandLength";
    case ErrorCode::SessionClosed:
      return "SessionClosed";
  }
  return "Unknown";
}

std::string_view ToString(ErrorCategory category) noexcept {
  switch (category) {
    case ErrorCategory::Transport:
      return "transport";
    case ErrorCategory::Protocol:
      return "protocol";
    case ErrorCategory::State:
      return "state";
  }
  return "unknown";
}

std::string Describe(const Error& error) {
  std::string out(ToString(error.code));
  out += " (";
  out += ToString(CategoryOf(error.code));
  out += ")";
  if (!error.detail.empty()) {
    out += ": ";
    out += error.detail;
  }
  if (error.os_error != 0) {
    out += ": ";
    out += std::strerror(error.os_error);
  }
  return out;
}

}  // namespace robomaster
