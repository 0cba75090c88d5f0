#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/transport/relay_endpoint.hpp"
#include "vaultsync/services/v1/relay_service.grpc.pb.h"

namespace vaultsync::grpc {

// RelayEndpoint backed by a remote RelayService.
class GrpcRelayClient final : public vaultsync::transport::RelayEndpoint {
 public:
  GrpcRelayClient(const std::string& endpoint, std::chrono::milliseconds rpc_timeout = std::chrono::milliseconds{5000});

  void Put(const vaultsync::wire::v1::SealedBatch& batch) override;

  std::vector<vaultsync::wire::v1::SealedBatch> Fetch(const std::string& recipient_id, std::uint32_t max_batches) override;

 private:
  std::unique_ptr<vaultsync::services::v1::RelayService::Stub> stub_;
  std::chrono::milliseconds                                    rpc_timeout_;
};

} // namespace vaultsync::grpc
