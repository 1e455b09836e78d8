#include "link_recovery.hpp"

#include <algorithm>
#include <string>

#include "control_session.hpp"
#include "session_platform.hpp"

namespace robomaster {

RecoveryAction LinkRecovery::OnFailure(const Error& error) noexcept {
  if (!IsRecoverable(error)) {
    return RecoveryAction::Abort;
  }

  ++consecutive_failures_;
  const uint32_t threshold = std::max<uint32_t>(options_.recovery_error_threshold, 1);
  if (consecutive_failures_ >= threshold) {
    // Порог достигнут - переинициализация, счёт заново
    consecutive_failures_ = 0;
    ++reinit_count_;
    return RecoveryAction::Reinitialize;
  }
  return RecoveryAction::RetryAfterDelay;
}

Result<bool> InitializeWithRetry(ControlSession& session,
                                 SessionPlatform& platform,
                                 const RecoveryOptions& options) {
  const uint32_t attempts = std::max<uint32_t>(options.max_init_attempts, 1);

  Result<bool> last = true;
  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    last = session.Initialize();
    if (IsOk(last)) return last;

    const Error& error = GetError(last);
    if (error.code == ErrorCode::SessionClosed) return last;

    platform.Log(LogLevel::Warning,
                 "Initialization attempt " + std::to_string(attempt) + "/" +
                     std::to_string(attempts) + " failed: " + Describe(error));
    if (attempt < attempts) {
      platform.DelayMs(options.recovery_delay_ms);
    }
  }

  platform.Log(LogLevel::Error, "Initialization failed after all attempts");
  return last;
}

}  // namespace robomaster
