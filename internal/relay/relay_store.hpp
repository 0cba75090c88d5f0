#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/transport/relay_endpoint.hpp"

namespace vaultsync::relay {

struct RelayLimits {
  std::uint32_t mailbox_capacity = 1024;
  std::uint64_t max_batch_bytes  = 4 * 1024 * 1024;
};

/*
  Store-and-forward mailboxes keyed by recipient device id.

  The relay is untrusted: it never sees keys or plaintext and performs no
  verification beyond size and capacity limits. Fetch removes what it
  returns.
*/
class RelayStore final : public transport::RelayEndpoint {
 public:
  explicit RelayStore(RelayLimits limits = {});

  // Throws util::RelayRejected when the mailbox is full or the batch is too big.
  void Put(const vaultsync::wire::v1::SealedBatch& batch) override;

  std::vector<vaultsync::wire::v1::SealedBatch> Fetch(const std::string& recipient_id, std::uint32_t max_batches) override;

  std::size_t Queued(const std::string& recipient_id) const;
  std::size_t TotalQueued() const;

 private:
  RelayLimits limits_;

  mutable std::mutex                                                   mutex_;
  std::map<std::string, std::deque<vaultsync::wire::v1::SealedBatch>> mailboxes_;
};

} // namespace vaultsync::relay
