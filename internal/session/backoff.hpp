#pragma once

#include <chrono>
#include <cstdint>

namespace vaultsync::session {

/*
  Exponential backoff with a cap and a bounded number of attempts.

  Delay(1) == base, doubling per attempt up to max_delay.
*/
struct BackoffPolicy {
  std::chrono::milliseconds base{500};
  std::chrono::milliseconds max_delay{30'000};
  std::uint32_t             max_attempts = 5;

  std::chrono::milliseconds Delay(std::uint32_t attempt) const;

  bool Exhausted(std::uint32_t attempts) const {
    return attempts >= max_attempts;
  }
};

} // namespace vaultsync::session
