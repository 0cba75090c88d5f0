#include "peer_transport.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace vaultsync::grpc {

using vaultsync::services::v1::DeliverResponse;
using vaultsync::services::v1::PeerSyncService;
using vaultsync::wire::v1::SealedBatch;

GrpcPeerTransport::GrpcPeerTransport(std::map<std::string, std::string> peer_addresses, std::size_t inbox_capacity,
                                     std::chrono::milliseconds rpc_timeout)
    : peer_addresses_(std::move(peer_addresses)), inbox_capacity_(inbox_capacity), rpc_timeout_(rpc_timeout) {
}

PeerSyncService::Stub& GrpcPeerTransport::StubFor(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(stubs_mutex_);
  if (auto it = stubs_.find(peer_id); it != stubs_.end()) {
    return *it->second;
  }
  auto address = peer_addresses_.find(peer_id);
  if (address == peer_addresses_.end()) {
    throw util::TransportUnreachable("no address configured for peer " + peer_id);
  }
  auto channel = ::grpc::CreateChannel(address->second, ::grpc::InsecureChannelCredentials());
  auto stub    = PeerSyncService::NewStub(channel);
  auto& ref    = *stub;
  stubs_.emplace(peer_id, std::move(stub));
  return ref;
}

void GrpcPeerTransport::Send(const std::string& peer_id, const SealedBatch& batch) {
  auto& stub = StubFor(peer_id);

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
  DeliverResponse resp;

  const auto status = stub.Deliver(&ctx, batch, &resp);
  if (!status.ok()) {
    throw util::TransportUnreachable("deliver to " + peer_id + " failed: " + status.error_message());
  }
  if (!resp.accepted()) {
    throw util::TransportUnreachable("peer " + peer_id + " did not accept the batch");
  }
}

std::optional<SealedBatch> GrpcPeerTransport::Receive() {
  std::lock_guard<std::mutex> lock(inbox_mutex_);
  if (inbox_.empty()) {
    return std::nullopt;
  }
  auto batch = std::move(inbox_.front());
  inbox_.pop_front();
  return batch;
}

bool GrpcPeerTransport::Enqueue(SealedBatch batch) {
  std::lock_guard<std::mutex> lock(inbox_mutex_);
  if (inbox_.size() >= inbox_capacity_) {
    return false;
  }
  inbox_.push_back(std::move(batch));
  return true;
}

PeerServer::PeerServer(std::shared_ptr<GrpcPeerTransport> transport) : transport_(std::move(transport)) {
}

::grpc::Status PeerServer::Deliver(::grpc::ServerContext*, const SealedBatch* req, DeliverResponse* resp) {
  // Authenticity is checked when the batch is opened, not here.
  if (!transport_->Enqueue(*req)) {
    VAULTSYNC_LOG_WARN("peer inbox full, batch refused", {observability::StringField("sender_id", req->sender_id())});
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, "inbox full"};
  }
  resp->set_accepted(true);
  return ::grpc::Status::OK;
}

} // namespace vaultsync::grpc
