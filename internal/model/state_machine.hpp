#pragma once

#include <cstdint>

namespace vaultsync::model {

enum class SessionState : std::uint8_t {
  kIdle        = 0,
  kHandshaking = 1,
  kExchanging  = 2,
  kReconciled  = 3,
  kFailed      = 4,
};

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kReconciled || state == SessionState::kFailed;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (from == to) {
    return true;
  }
  // Any state can fail; terminal states only restart from Idle.
  if (to == SessionState::kFailed) {
    return true;
  }
  if (IsTerminal(from)) {
    return to == SessionState::kIdle;
  }
  if (to == SessionState::kIdle) {
    return true;
  }

  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kHandshaking:
      return "handshaking";
    case SessionState::kExchanging:
      return "exchanging";
    case SessionState::kReconciled:
      return "reconciled";
    case SessionState::kFailed:
      return "failed";
  }
  return "unknown";
}

} // namespace vaultsync::model
