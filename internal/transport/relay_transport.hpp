#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/transport/relay_endpoint.hpp"
#include "internal/transport/transport.hpp"

namespace vaultsync::transport {

class RelayTransport final : public Transport {
 public:
  RelayTransport(std::shared_ptr<RelayEndpoint> endpoint, std::string device_id, std::uint32_t fetch_max = 64);

  void                                            Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) override;
  std::optional<vaultsync::wire::v1::SealedBatch> Receive() override;

 private:
  std::shared_ptr<RelayEndpoint> endpoint_;
  std::string                    device_id_;
  std::uint32_t                  fetch_max_;

  std::mutex                                   mutex_;
  std::deque<vaultsync::wire::v1::SealedBatch> buffered_;
};

} // namespace vaultsync::transport
