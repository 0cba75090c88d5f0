#include "backoff.hpp"

#include <algorithm>

namespace vaultsync::session {

std::chrono::milliseconds BackoffPolicy::Delay(std::uint32_t attempt) const {
  if (attempt == 0) {
    return std::chrono::milliseconds{0};
  }
  auto delay = base;
  for (std::uint32_t i = 1; i < attempt && delay < max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay);
}

} // namespace vaultsync::session
