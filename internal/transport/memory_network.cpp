#include "memory_network.hpp"

#include "internal/util/errors.hpp"

namespace vaultsync::transport {

std::shared_ptr<MemoryTransport> MemoryNetwork::Attach(const std::string& device_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inboxes_[device_id];
  }
  return std::make_shared<MemoryTransport>(shared_from_this(), device_id);
}

void MemoryNetwork::SetReachable(const std::string& device_id, bool reachable) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reachable) {
    offline_.erase(device_id);
  } else {
    offline_.insert(device_id);
  }
}

std::size_t MemoryNetwork::Queued(const std::string& device_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = inboxes_.find(device_id);
  return it == inboxes_.end() ? 0 : it->second.size();
}

void MemoryNetwork::Deliver(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = inboxes_.find(peer_id);
  if (it == inboxes_.end() || offline_.contains(peer_id) || offline_.contains(batch.sender_id())) {
    throw util::TransportUnreachable("peer unreachable: " + peer_id);
  }
  it->second.push_back(batch);
}

std::optional<vaultsync::wire::v1::SealedBatch> MemoryNetwork::Take(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = inboxes_.find(device_id);
  if (it == inboxes_.end() || it->second.empty() || offline_.contains(device_id)) {
    return std::nullopt;
  }
  auto batch = std::move(it->second.front());
  it->second.pop_front();
  return batch;
}

MemoryTransport::MemoryTransport(std::shared_ptr<MemoryNetwork> network, std::string device_id)
    : network_(std::move(network)), device_id_(std::move(device_id)) {
}

void MemoryTransport::Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) {
  network_->Deliver(peer_id, batch);
}

std::optional<vaultsync::wire::v1::SealedBatch> MemoryTransport::Receive() {
  return network_->Take(device_id_);
}

} // namespace vaultsync::transport
