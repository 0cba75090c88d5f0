#include "relay_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vaultsync::relay {

using observability::IntField;
using observability::StringField;

RelayStore::RelayStore(RelayLimits limits) : limits_(limits) {
}

void RelayStore::Put(const vaultsync::wire::v1::SealedBatch& batch) {
  if (batch.recipient_id().empty() || batch.sender_id().empty()) {
    throw util::RelayRejected("batch without sender or recipient");
  }
  if (batch.ByteSizeLong() > limits_.max_batch_bytes) {
    throw util::RelayRejected("batch of " + std::to_string(batch.ByteSizeLong()) + " bytes exceeds relay limit");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto&                       mailbox = mailboxes_[batch.recipient_id()];
  if (mailbox.size() >= limits_.mailbox_capacity) {
    VAULTSYNC_LOG_WARN("relay mailbox full", {StringField("recipient_id", batch.recipient_id()),
                                              IntField("queued", static_cast<int64_t>(mailbox.size()))});
    throw util::RelayRejected("mailbox full for " + batch.recipient_id());
  }
  mailbox.push_back(batch);
}

std::vector<vaultsync::wire::v1::SealedBatch> RelayStore::Fetch(const std::string& recipient_id, std::uint32_t max_batches) {
  std::lock_guard<std::mutex>                   lock(mutex_);
  std::vector<vaultsync::wire::v1::SealedBatch> out;

  auto it = mailboxes_.find(recipient_id);
  if (it == mailboxes_.end()) {
    return out;
  }
  auto& mailbox = it->second;
  while (!mailbox.empty() && (max_batches == 0 || out.size() < max_batches)) {
    out.push_back(std::move(mailbox.front()));
    mailbox.pop_front();
  }
  if (mailbox.empty()) {
    mailboxes_.erase(it);
  }
  return out;
}

std::size_t RelayStore::Queued(const std::string& recipient_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = mailboxes_.find(recipient_id);
  return it == mailboxes_.end() ? 0 : it->second.size();
}

std::size_t RelayStore::TotalQueued() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t                 total = 0;
  for (const auto& [_, mailbox] : mailboxes_) {
    total += mailbox.size();
  }
  return total;
}

} // namespace vaultsync::relay
