#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/transport/transport.hpp"
#include "vaultsync/services/v1/peer_service.grpc.pb.h"

namespace vaultsync::grpc {

/*
  Direct device-to-device transport over PeerSyncService.

  Outbound batches go to the peer's configured address; inbound batches are
  queued by PeerServer and drained through Receive().
*/
class GrpcPeerTransport final : public vaultsync::transport::Transport {
 public:
  GrpcPeerTransport(std::map<std::string, std::string> peer_addresses, std::size_t inbox_capacity = 4096,
                    std::chrono::milliseconds rpc_timeout = std::chrono::milliseconds{5000});

  void                                            Send(const std::string& peer_id, const vaultsync::wire::v1::SealedBatch& batch) override;
  std::optional<vaultsync::wire::v1::SealedBatch> Receive() override;

  // False when the inbox is full.
  bool Enqueue(vaultsync::wire::v1::SealedBatch batch);

 private:
  vaultsync::services::v1::PeerSyncService::Stub& StubFor(const std::string& peer_id);

  std::map<std::string, std::string> peer_addresses_;
  std::size_t                        inbox_capacity_;
  std::chrono::milliseconds          rpc_timeout_;

  std::mutex                                                                          stubs_mutex_;
  std::map<std::string, std::unique_ptr<vaultsync::services::v1::PeerSyncService::Stub>> stubs_;

  std::mutex                                   inbox_mutex_;
  std::deque<vaultsync::wire::v1::SealedBatch> inbox_;
};

class PeerServer final : public vaultsync::services::v1::PeerSyncService::Service {
 public:
  explicit PeerServer(std::shared_ptr<GrpcPeerTransport> transport);

  ::grpc::Status Deliver(::grpc::ServerContext*, const vaultsync::wire::v1::SealedBatch*, vaultsync::services::v1::DeliverResponse*) override;

 private:
  std::shared_ptr<GrpcPeerTransport> transport_;
};

} // namespace vaultsync::grpc
