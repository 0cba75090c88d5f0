#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/core/sync_coordinator.hpp"
#include "internal/crypto/key_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/peer_transport.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/relay/relay_store.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/transport/memory_network.hpp"

namespace {

using namespace vaultsync::services::v1;

using vaultsync::wire::v1::SealedBatch;

std::shared_ptr<vaultsync::grpc::AdminServer> BuildAdminServer() {
  auto network   = std::make_shared<vaultsync::transport::MemoryNetwork>();
  auto identity  = vaultsync::crypto::DeviceIdentity::Generate();
  auto transport = network->Attach(identity.device_id());
  auto coordinator =
      std::make_shared<vaultsync::core::SyncCoordinator>("household", std::move(identity), std::make_shared<vaultsync::crypto::MemoryKeyStore>(),
                                                         std::make_shared<vaultsync::db::memory::MemoryRepository>(), transport);
  auto service = std::make_shared<vaultsync::service::AdminService>(vaultsync::service::ServiceContext{coordinator, nullptr});
  return std::make_shared<vaultsync::grpc::AdminServer>(service);
}

SealedBatch MakeBatch(const std::string& recipient, std::uint64_t sequence) {
  SealedBatch batch;
  batch.set_sender_id("sender");
  batch.set_recipient_id(recipient);
  batch.set_sequence_no(sequence);
  batch.set_ciphertext(std::string(32, 'x'));
  return batch;
}

void TestErrorMapping() {
  using vaultsync::grpc::ToStatus;
  namespace util = vaultsync::util;

  assert(ToStatus(util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::ClockRegression("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(util::AuthenticationFailure("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(util::UnknownOrRevokedSender("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(util::MissingCausalDependency("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(util::TransportUnreachable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(util::RelayRejected("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  const auto status = ToStatus(std::runtime_error("boom"));
  assert(status.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(status.error_message() == "boom");
}

void TestRevokeUnknownDeviceReturnsNotFound() {
  auto server = BuildAdminServer();

  RevokeRequest         req;
  RevokeResponse        resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_device_id("missing-device");

  const auto status = server->Revoke(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestPairWithoutTokenReturnsFailedPrecondition() {
  auto server = BuildAdminServer();

  PairRequest           req;
  PairResponse          resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->Pair(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestForgedTokenReturnsUnauthenticated() {
  auto server = BuildAdminServer();

  PairRequest req;
  *req.mutable_token() = vaultsync::crypto::DeviceIdentity::Generate().MakeToken("household", 1);
  req.mutable_token()->set_encryption_public(std::string(32, '\0'));
  PairResponse          resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->Pair(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestStatusSucceeds() {
  auto server = BuildAdminServer();

  StatusRequest         req;
  StatusResponse        resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->Status(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.device_id().empty());
  assert(resp.peers_size() == 0);
}

void TestRelayRejectsOversizedBatch() {
  vaultsync::relay::RelayLimits limits;
  limits.max_batch_bytes = 16;
  vaultsync::grpc::RelayServer server(std::make_shared<vaultsync::relay::RelayStore>(limits));

  PutRequest            req;
  PutResponse           resp;
  ::grpc::ServerContext grpc_ctx;
  *req.mutable_batch() = MakeBatch("phone", 1);

  const auto status = server.Put(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestRelayPutThenFetch() {
  auto                        store = std::make_shared<vaultsync::relay::RelayStore>();
  vaultsync::grpc::RelayServer server(store, 2);

  for (std::uint64_t seq = 1; seq <= 3; ++seq) {
    PutRequest            req;
    PutResponse           resp;
    ::grpc::ServerContext grpc_ctx;
    *req.mutable_batch() = MakeBatch("phone", seq);
    assert(server.Put(&grpc_ctx, &req, &resp).ok());
    assert(resp.queued() == seq);
  }

  FetchRequest          fetch;
  FetchResponse         fetched;
  ::grpc::ServerContext grpc_ctx;
  fetch.set_recipient_id("phone");
  fetch.set_max_batches(10);
  assert(server.Fetch(&grpc_ctx, &fetch, &fetched).ok());
  // Capped by the server's fetch limit.
  assert(fetched.batches_size() == 2);
  assert(fetched.batches(0).sequence_no() == 1);
  assert(store->Queued("phone") == 1);

  FetchRequest          anonymous;
  FetchResponse         nothing;
  ::grpc::ServerContext other_ctx;
  assert(server.Fetch(&other_ctx, &anonymous, &nothing).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestPeerServerRejectsWhenInboxFull() {
  auto transport = std::make_shared<vaultsync::grpc::GrpcPeerTransport>(std::map<std::string, std::string>{}, 1);
  vaultsync::grpc::PeerServer server(transport);

  DeliverResponse       resp;
  ::grpc::ServerContext grpc_ctx;
  const auto            first = MakeBatch("laptop", 1);
  assert(server.Deliver(&grpc_ctx, &first, &resp).ok());
  assert(resp.accepted());

  DeliverResponse       overflow;
  ::grpc::ServerContext overflow_ctx;
  const auto            second = MakeBatch("laptop", 2);
  assert(server.Deliver(&overflow_ctx, &second, &overflow).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);

  auto received = transport->Receive();
  assert(received.has_value());
  assert(received->sequence_no() == 1);
  assert(!transport->Receive().has_value());

  // No address configured for the peer.
  bool unreachable = false;
  try {
    transport->Send("nobody", first);
  } catch (const vaultsync::util::TransportUnreachable&) {
    unreachable = true;
  }
  assert(unreachable);
}

} // namespace

int main() {
  TestErrorMapping();
  TestRevokeUnknownDeviceReturnsNotFound();
  TestPairWithoutTokenReturnsFailedPrecondition();
  TestForgedTokenReturnsUnauthenticated();
  TestStatusSucceeds();
  TestRelayRejectsOversizedBatch();
  TestRelayPutThenFetch();
  TestPeerServerRejectsWhenInboxFull();

  std::cout << "vaultsync_unit_grpc_status: pass\n";
  return 0;
}
