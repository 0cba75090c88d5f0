#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "internal/db/api/repository.hpp"

namespace vaultsync::transport {

/*
  Per-sender sliding window over envelope sequence numbers.

  A sequence is fresh if it is above the highest accepted one, or inside the
  window below it and not yet accepted. Only the highest accepted sequence is
  persisted; after a restart everything at or below it counts as seen.
*/
class ReplayGuard {
 public:
  static constexpr std::uint64_t kDefaultWindow = 256;

  explicit ReplayGuard(std::shared_ptr<db::Repository> repository, std::uint64_t window = kDefaultWindow);

  bool IsFresh(const std::string& sender_id, std::uint64_t sequence_no);

  // Call only after the envelope signature verified. Returns false if the
  // sequence was not fresh.
  bool Accept(const std::string& sender_id, std::uint64_t sequence_no);

 private:
  struct Window {
    std::uint64_t           highest  = 0;
    std::uint64_t           restored = 0;
    std::set<std::uint64_t> accepted;
  };

  Window& WindowFor(const std::string& sender_id);
  bool    FreshLocked(const Window& window, std::uint64_t sequence_no) const;

  std::shared_ptr<db::Repository> repository_;
  std::uint64_t                   window_;

  std::mutex                    mutex_;
  std::map<std::string, Window> windows_;
};

} // namespace vaultsync::transport
