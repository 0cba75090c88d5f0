#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/relay/relay_store.hpp"
#include "vaultsync/services/v1/relay_service.grpc.pb.h"

namespace vaultsync::grpc {

/*
  Untrusted relay. Anyone may Put; Fetch hands out whatever is queued for
  the recipient, which cannot read or forge it without the device keys.
*/
class RelayServer final : public vaultsync::services::v1::RelayService::Service {
 public:
  explicit RelayServer(std::shared_ptr<vaultsync::relay::RelayStore> store, std::uint32_t fetch_max = 64);

  ::grpc::Status Put(::grpc::ServerContext*, const vaultsync::services::v1::PutRequest*, vaultsync::services::v1::PutResponse*) override;

  ::grpc::Status Fetch(::grpc::ServerContext*, const vaultsync::services::v1::FetchRequest*, vaultsync::services::v1::FetchResponse*) override;

 private:
  std::shared_ptr<vaultsync::relay::RelayStore> store_;
  std::uint32_t                                 fetch_max_;
};

} // namespace vaultsync::grpc
