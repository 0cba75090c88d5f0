#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/crypto/device_identity.hpp"
#include "internal/crypto/key_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/peer_transport.hpp"
#include "internal/grpc/relay_client.hpp"
#include "internal/grpc/relay_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/transport/relay_transport.hpp"

namespace vaultsync::factory {

using vaultsync::runtime::config::RuntimeConfig;
using vaultsync::runtime::config::SyncConfig;

using observability::IntField;
using observability::StringField;

namespace {

std::shared_ptr<crypto::KeyStore> BuildKeyStore(const RuntimeConfig& config) {
  const auto& key_path = config.device().key_path();
  if (key_path.empty()) {
    VAULTSYNC_LOG_WARN("device.key_path not set, keys will not survive a restart");
    return std::make_shared<crypto::MemoryKeyStore>();
  }
  return std::make_shared<crypto::FileKeyStore>(key_path);
}

struct TransportParts {
  std::shared_ptr<transport::Transport>    transport;
  std::shared_ptr<grpc::GrpcPeerTransport> peer_transport;
};

TransportParts BuildTransport(const RuntimeConfig& config, const std::string& device_id) {
  const auto& transport = config.transport();

  if (transport.has_relay()) {
    const auto& relay = transport.relay();
    if (relay.endpoint().empty()) {
      throw std::runtime_error("transport.relay.endpoint must be set");
    }
    auto client = std::make_shared<grpc::GrpcRelayClient>(relay.endpoint(), std::chrono::milliseconds(relay.rpc_timeout_ms()));
    VAULTSYNC_LOG_INFO("using relay transport", {StringField("endpoint", relay.endpoint())});
    return {std::make_shared<transport::RelayTransport>(std::move(client), device_id, relay.fetch_max()), nullptr};
  }

  if (transport.has_direct()) {
    std::map<std::string, std::string> addresses;
    for (const auto& peer : transport.direct().peers()) {
      if (peer.device_id().empty() || peer.address().empty()) {
        throw std::runtime_error("transport.direct.peers entries need device_id and address");
      }
      addresses[peer.device_id()] = peer.address();
    }
    VAULTSYNC_LOG_INFO("using direct transport", {IntField("peers", static_cast<std::int64_t>(addresses.size()))});
    auto direct = std::make_shared<grpc::GrpcPeerTransport>(std::move(addresses));
    return {direct, direct};
  }

  throw std::runtime_error("transport must configure either direct or relay");
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  VAULTSYNC_LOG_WARN("using in-memory database, the change log is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::CoordinatorOptions CoordinatorOptionsFromConfig(const SyncConfig& sync) {
  core::CoordinatorOptions options;
  options.session.round_trip_timeout     = std::chrono::milliseconds(sync.round_trip_timeout_ms());
  options.session.backoff.base           = std::chrono::milliseconds(sync.backoff_base_ms());
  options.session.backoff.max_delay      = std::chrono::milliseconds(sync.backoff_max_ms());
  options.session.backoff.max_attempts   = sync.max_attempts();
  options.session.max_batch_records      = sync.max_batch_records();
  options.log.pending_limit              = sync.pending_limit();
  options.padding_block                  = sync.padding_block_bytes();
  options.compaction_enabled             = sync.compaction_enabled();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  if (config.device().vault_id().empty()) {
    throw std::runtime_error("device.vault_id must be set");
  }

  Application app;

  // ------------------------------------------------------------------
  // Persistence and identity
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto key_store  = BuildKeyStore(config);
  auto identity   = crypto::DeviceIdentity::LoadOrCreate(*key_store);
  const auto device_id = identity.device_id();

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  auto parts = BuildTransport(config, device_id);

  app.coordinator = std::make_shared<core::SyncCoordinator>(config.device().vault_id(), std::move(identity), key_store, repository,
                                                            parts.transport, CoordinatorOptionsFromConfig(config.sync()));

  runtime::SyncSchedule schedule;
  schedule.initial_delay = std::chrono::milliseconds(config.sync().initial_delay_ms());
  schedule.interval      = std::chrono::milliseconds(config.sync().interval_ms());
  schedule.poll_interval = std::chrono::milliseconds(config.sync().poll_interval_ms());
  schedule.paused        = config.sync().paused();
  app.worker             = std::make_shared<runtime::SyncWorker>(app.coordinator, schedule);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.coordinator = app.coordinator;
  ctx.worker      = app.worker;

  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.admin_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));
  if (parts.peer_transport) {
    app.peer_services.push_back(std::make_unique<grpc::PeerServer>(parts.peer_transport));
  }

  VAULTSYNC_LOG_INFO("vault engine built", {StringField("device_id", device_id), StringField("vault_id", config.device().vault_id())});
  return app;
}

RelayApplication BuildRelay(const RuntimeConfig& config) {
  RelayApplication app;

  relay::RelayLimits limits;
  limits.mailbox_capacity = config.relay().mailbox_capacity();
  limits.max_batch_bytes  = config.relay().max_batch_bytes();

  app.store = std::make_shared<relay::RelayStore>(limits);
  app.grpc_services.push_back(std::make_unique<grpc::RelayServer>(app.store));
  return app;
}

} // namespace vaultsync::factory
