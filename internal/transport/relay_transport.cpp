#include "relay_transport.hpp"

#include "internal/util/errors.hpp"

namespace vaultsync::transport {

RelayTransport::RelayTransport(std::shared_ptr<RelayEndpoint> endpoint, std::string device_id, std::uint32_t fetch_max)
    : endpoint_(std::move(endpoint)), device_id_(std::move(device_id)), fetch_max_(fetch_max == 0 ? 1 : fetch_max) {
}

void RelayTransport::Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) {
  if (batch.recipient_id() != peer_id) {
    throw util::InvalidState("batch recipient " + batch.recipient_id() + " does not match " + peer_id);
  }
  endpoint_->Put(batch);
}

std::optional<vaultsync::wire::v1::SealedBatch> RelayTransport::Receive() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (buffered_.empty()) {
    try {
      for (auto& batch : endpoint_->Fetch(device_id_, fetch_max_)) {
        buffered_.push_back(std::move(batch));
      }
    } catch (const util::RelayRejected&) {
      // Unavailable relay reads as an empty inbox; sends surface the error.
      return std::nullopt;
    }
  }
  if (buffered_.empty()) {
    return std::nullopt;
  }
  auto batch = std::move(buffered_.front());
  buffered_.pop_front();
  return batch;
}

} // namespace vaultsync::transport
