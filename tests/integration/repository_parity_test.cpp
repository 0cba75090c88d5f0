#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/changelog/change_log.hpp"
#include "internal/crypto/device_identity.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/registry/device_registry.hpp"

namespace {

using vaultsync::db::ErrorCode;
using vaultsync::db::Repository;
using vaultsync::db::memory::MemoryRepository;
using vaultsync::db::model::PeerCursorRow;
using vaultsync::db::model::RecordRow;
using vaultsync::db::model::SnapshotRow;
using vaultsync::model::DeviceEntry;
using vaultsync::model::LocalState;
using vaultsync::model::TrustState;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RecordRow MakeRow(const std::string& device, std::uint64_t clock, std::uint64_t sequence) {
  RecordRow row;
  row.record_id     = device + "/" + std::to_string(clock);
  row.entity_id     = "acct-" + std::to_string(clock % 2);
  row.field_path    = "balance";
  row.device_id     = device;
  row.logical_clock = clock;
  row.sequence      = sequence;
  row.encoded       = std::string("\x0a\x00\xff", 3) + row.record_id;
  return row;
}

void VerifyRecordLifecycle(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  // Inserted out of sequence order; ListRecords sorts.
  const auto second = MakeRow(prefix + "-phone", 1, 2);
  const auto first  = MakeRow(prefix + "-laptop", 1, 1);
  assert(repo.InsertRecord(*tx, second));
  assert(repo.InsertRecord(*tx, first));

  auto duplicate = repo.InsertRecord(*tx, first);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto fetched = repo.GetRecord(*tx, first.record_id);
  assert(fetched.has_value());
  assert(*fetched == first);
  assert(!repo.GetRecord(*tx, "missing").has_value());

  auto compacted      = second;
  compacted.compacted = true;
  compacted.encoded   = "stub";
  assert(repo.UpdateRecord(*tx, compacted));

  auto missing = MakeRow(prefix + "-ghost", 9, 9);
  auto update  = repo.UpdateRecord(*tx, missing);
  assert(update.code == ErrorCode::NotFound);

  tx->Commit();

  auto verify = repo.Begin();
  auto rows   = repo.ListRecords(*verify);
  assert(rows.size() == 2);
  assert(rows[0] == first);
  assert(rows[1] == compacted);
  verify->Commit();
}

void VerifySnapshots(Repository& repo, const std::string& entity) {
  auto tx = repo.Begin();
  assert(!repo.GetSnapshot(*tx, entity).has_value());

  SnapshotRow row{.entity_id = entity, .deleted = false, .encoded = "v1"};
  assert(repo.UpsertSnapshot(*tx, row));
  row.deleted = true;
  row.encoded = "v2";
  assert(repo.UpsertSnapshot(*tx, row));

  auto stored = repo.GetSnapshot(*tx, entity);
  assert(stored.has_value());
  assert(*stored == row);
  tx->Commit();
}

void VerifyDevices(Repository& repo, const std::string& prefix) {
  DeviceEntry laptop;
  laptop.device_id         = prefix + "-a";
  laptop.signing_public    = std::string(32, '\x01');
  laptop.encryption_public = std::string(32, '\x02');
  laptop.key_epoch         = 1;
  laptop.trust             = TrustState::kTrusted;
  laptop.last_seen_clock   = 17;
  laptop.last_synced_ms    = static_cast<std::int64_t>(NowMs());
  laptop.token             = "token-bytes";

  DeviceEntry phone                = laptop;
  phone.device_id                  = prefix + "-b";
  phone.trust                      = TrustState::kRevoked;
  phone.revoked_after_clock        = 12;
  phone.quarantined                = true;
  phone.revocation                 = "revocation-bytes";
  phone.rotation                   = "rotation-bytes";
  phone.previous_encryption_public = std::string(32, '\x04');

  auto tx = repo.Begin();
  assert(repo.UpsertDevice(*tx, phone));
  assert(repo.UpsertDevice(*tx, laptop));

  laptop.key_epoch         = 2;
  laptop.encryption_public = std::string(32, '\x03');
  assert(repo.UpsertDevice(*tx, laptop));
  tx->Commit();

  auto verify = repo.Begin();
  auto a      = repo.GetDevice(*verify, laptop.device_id);
  assert(a.has_value());
  assert(*a == laptop);
  auto b = repo.GetDevice(*verify, phone.device_id);
  assert(b.has_value());
  assert(*b == phone);
  assert(!repo.GetDevice(*verify, prefix + "-none").has_value());

  auto all = repo.ListDevices(*verify);
  assert(all.size() == 2);
  assert(all[0].device_id == laptop.device_id);
  assert(all[1].device_id == phone.device_id);
  verify->Commit();
}

void VerifyLocalStateAndCursors(Repository& repo, const std::string& peer) {
  auto tx = repo.Begin();
  assert(!repo.LoadLocalState(*tx).has_value());
  assert(!repo.GetPeerCursor(*tx, peer).has_value());

  LocalState state{.device_id = "self", .logical_clock = 41, .next_sequence = 57, .key_epoch = 3};
  assert(repo.SaveLocalState(*tx, state));
  state.logical_clock = 42;
  assert(repo.SaveLocalState(*tx, state));

  PeerCursorRow cursor{.device_id = peer, .inbound_watermark = 300, .acked_clock = std::string("\x0a\x04", 2)};
  assert(repo.UpsertPeerCursor(*tx, cursor));
  cursor.inbound_watermark = 301;
  assert(repo.UpsertPeerCursor(*tx, cursor));
  tx->Commit();

  auto verify = repo.Begin();
  assert(repo.LoadLocalState(*verify) == state);
  assert(repo.GetPeerCursor(*verify, peer) == cursor);
  verify->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  const auto row = MakeRow(prefix, 5, 500);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRecord(*tx, row));
    assert(repo.GetRecord(*tx, row.record_id).has_value());
    tx->Rollback();
  }
  {
    // Destructor rolls back an uncommitted transaction.
    auto tx = repo.Begin();
    assert(repo.UpsertSnapshot(*tx, SnapshotRow{.entity_id = prefix + "-entity", .deleted = false, .encoded = "x"}));
  }

  auto verify = repo.Begin();
  assert(!repo.GetRecord(*verify, row.record_id).has_value());
  assert(!repo.GetSnapshot(*verify, prefix + "-entity").has_value());
  verify->Commit();
}

// The engine reloads identical state from either backend.
void VerifyEngineReload(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto self = vaultsync::crypto::DeviceIdentity::Generate();
  auto peer = vaultsync::crypto::DeviceIdentity::Generate();

  auto repo = backend.make_repository();
  std::vector<vaultsync::model::ChangeRecord> before;
  vaultsync::model::VectorClock               known;
  {
    auto registry = std::make_shared<vaultsync::registry::DeviceRegistry>(repo, "household", self.device_id());
    registry->RegisterSelf(self.MakeToken("household", 1));
    registry->Pair(peer.MakeToken("household", 1));

    vaultsync::changelog::ChangeLog log(repo, registry, self.device_id());
    log.Append("acct", "balance", vaultsync::model::Money{10000, 2, "USD"});
    log.Append("acct", "memo", std::string("savings"));
    log.Delete("old-acct");
    before = log.Records();
    known  = log.Known();
  }

  backend.restart(repo);

  auto registry = std::make_shared<vaultsync::registry::DeviceRegistry>(repo, "household", self.device_id());
  assert(registry->Get(peer.device_id()).has_value());
  assert(registry->Get(peer.device_id())->trust == TrustState::kTrusted);

  vaultsync::changelog::ChangeLog log(repo, registry, self.device_id());
  assert(log.Records() == before);
  assert(log.Known() == known);
  assert(log.LocalClock() == 3);
  assert(log.Snapshot("old-acct").deleted);

  auto next = log.Append("acct", "memo", std::string("checking"));
  assert(next.logical_clock == 4);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("vaultsync_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<vaultsync::db::sqlite::SqliteDB>(db_path);
    vaultsync::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<vaultsync::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyRecordLifecycle(*repo, backend.name);
    VerifySnapshots(*repo, backend.name + "-entity");
    VerifyDevices(*repo, backend.name + "-device");
    VerifyLocalStateAndCursors(*repo, backend.name + "-peer");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }
  backend.cleanup();

  VerifyEngineReload(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "vaultsync_integration_repository_parity: pass\n";
  return 0;
}
