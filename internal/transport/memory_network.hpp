#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "internal/transport/transport.hpp"

namespace vaultsync::transport {

class MemoryTransport;

/*
  In-process direct network between engines in one process.

  Devices can be taken offline; a send to an offline or unknown device fails
  with util::TransportUnreachable.
*/
class MemoryNetwork : public std::enable_shared_from_this<MemoryNetwork> {
 public:
  std::shared_ptr<MemoryTransport> Attach(const std::string& device_id);

  void SetReachable(const std::string& device_id, bool reachable);

  // Inbound batches queued for the device.
  std::size_t Queued(const std::string& device_id) const;

 private:
  friend class MemoryTransport;

  void                                            Deliver(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch);
  std::optional<vaultsync::wire::v1::SealedBatch> Take(const std::string& device_id);

  mutable std::mutex                                                   mutex_;
  std::map<std::string, std::deque<vaultsync::wire::v1::SealedBatch>> inboxes_;
  std::set<std::string>                                                offline_;
};

class MemoryTransport final : public Transport {
 public:
  MemoryTransport(std::shared_ptr<MemoryNetwork> network, std::string device_id);

  void                                            Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) override;
  std::optional<vaultsync::wire::v1::SealedBatch> Receive() override;

 private:
  std::shared_ptr<MemoryNetwork> network_;
  std::string                    device_id_;
};

} // namespace vaultsync::transport
