#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace vaultsync::db::sqlite {

using vaultsync::db::ErrorCode;
using vaultsync::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

model::RecordRow ReadRecord(sqlite3_stmt* st) {
  model::RecordRow r;
  r.record_id     = ColText(st, 0);
  r.entity_id     = ColText(st, 1);
  r.field_path    = ColText(st, 2);
  r.device_id     = ColText(st, 3);
  r.logical_clock = ColU64(st, 4);
  r.sequence      = ColU64(st, 5);
  r.compacted     = ColBool(st, 6);
  r.encoded       = ColBlob(st, 7);
  return r;
}

vaultsync::model::DeviceEntry ReadDevice(sqlite3_stmt* st) {
  vaultsync::model::DeviceEntry d;
  d.device_id                  = ColText(st, 0);
  d.signing_public             = ColBlob(st, 1);
  d.encryption_public          = ColBlob(st, 2);
  d.key_epoch                  = ColU64(st, 3);
  d.trust                      = static_cast<vaultsync::model::TrustState>(sqlite3_column_int(st, 4));
  d.last_seen_clock            = ColU64(st, 5);
  d.revoked_after_clock        = ColU64(st, 6);
  d.quarantined                = ColBool(st, 7);
  d.last_synced_ms             = ColI64(st, 8);
  d.token                      = ColBlob(st, 9);
  d.revocation                 = ColBlob(st, 10);
  d.rotation                   = ColBlob(st, 11);
  d.previous_encryption_public = ColBlob(st, 12);
  return d;
}

constexpr const char* kRecordColumns = "record_id,entity_id,field_path,device_id,logical_clock,sequence,compacted,encoded";

constexpr const char* kDeviceColumns =
    "device_id,signing_public,encryption_public,key_epoch,trust,last_seen_clock,revoked_after_clock,quarantined,last_synced_ms,token,"
    "revocation,rotation,previous_encryption_public";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Change records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, const model::RecordRow& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO sync_records(") + kRecordColumns + ") VALUES(?,?,?,?,?,?,?,?);";
  Statement         st(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.record_id);
  BindText(st.get(), 2, r.entity_id);
  BindText(st.get(), 3, r.field_path);
  BindText(st.get(), 4, r.device_id);
  BindU64(st.get(), 5, r.logical_clock);
  BindU64(st.get(), 6, r.sequence);
  BindBool(st.get(), 7, r.compacted);
  BindBlob(st.get(), 8, r.encoded);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateRecord(Transaction& t, const model::RecordRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE sync_records SET compacted=?,encoded=? WHERE record_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindBool(st.get(), 1, r.compacted);
  BindBlob(st.get(), 2, r.encoded);
  BindText(st.get(), 3, r.record_id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, r.record_id);
  }
  return Translate(db, rc);
}

std::optional<model::RecordRow> SqliteRepository::GetRecord(Transaction& t, const std::string& record_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM sync_records WHERE record_id=?;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, record_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecord(st.get());
}

std::vector<model::RecordRow> SqliteRepository::ListRecords(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::RecordRow> out;
  const std::string             sql = std::string("SELECT ") + kRecordColumns + " FROM sync_records ORDER BY sequence;";
  Statement                     st(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRecord(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO sync_snapshots(entity_id,deleted,encoded) VALUES(?,?,?) "
               "ON CONFLICT(entity_id) DO UPDATE SET deleted=excluded.deleted, encoded=excluded.encoded;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.entity_id);
  BindBool(st.get(), 2, r.deleted);
  BindBlob(st.get(), 3, r.encoded);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SnapshotRow> SqliteRepository::GetSnapshot(Transaction& t, const std::string& entity_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT entity_id,deleted,encoded FROM sync_snapshots WHERE entity_id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, entity_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::SnapshotRow r;
  r.entity_id = ColText(st.get(), 0);
  r.deleted   = ColBool(st.get(), 1);
  r.encoded   = ColBlob(st.get(), 2);
  return r;
}

// ------------------------------------------------------------------
// Devices
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDevice(Transaction& t, const vaultsync::model::DeviceEntry& d) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO sync_devices(") + kDeviceColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(device_id) DO UPDATE SET "
                          "signing_public=excluded.signing_public, encryption_public=excluded.encryption_public, "
                          "key_epoch=excluded.key_epoch, trust=excluded.trust, last_seen_clock=excluded.last_seen_clock, "
                          "revoked_after_clock=excluded.revoked_after_clock, quarantined=excluded.quarantined, "
                          "last_synced_ms=excluded.last_synced_ms, token=excluded.token, revocation=excluded.revocation, "
                          "rotation=excluded.rotation, previous_encryption_public=excluded.previous_encryption_public;";
  Statement st(db, sql.c_str());
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, d.device_id);
  BindBlob(st.get(), 2, d.signing_public);
  BindBlob(st.get(), 3, d.encryption_public);
  BindU64(st.get(), 4, d.key_epoch);
  sqlite3_bind_int(st.get(), 5, static_cast<int>(d.trust));
  BindU64(st.get(), 6, d.last_seen_clock);
  BindU64(st.get(), 7, d.revoked_after_clock);
  BindBool(st.get(), 8, d.quarantined);
  BindI64(st.get(), 9, d.last_synced_ms);
  BindBlob(st.get(), 10, d.token);
  BindBlob(st.get(), 11, d.revocation);
  BindBlob(st.get(), 12, d.rotation);
  BindBlob(st.get(), 13, d.previous_encryption_public);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<vaultsync::model::DeviceEntry> SqliteRepository::GetDevice(Transaction& t, const std::string& device_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kDeviceColumns + " FROM sync_devices WHERE device_id=?;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDevice(st.get());
}

std::vector<vaultsync::model::DeviceEntry> SqliteRepository::ListDevices(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<vaultsync::model::DeviceEntry> out;
  const std::string                          sql = std::string("SELECT ") + kDeviceColumns + " FROM sync_devices ORDER BY device_id;";
  Statement                                  st(db, sql.c_str());
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDevice(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Local state / peer cursors
// ------------------------------------------------------------------

Result SqliteRepository::SaveLocalState(Transaction& t, const vaultsync::model::LocalState& s) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO sync_local_state(id,device_id,logical_clock,next_sequence,key_epoch) VALUES(1,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET device_id=excluded.device_id, logical_clock=excluded.logical_clock, "
               "next_sequence=excluded.next_sequence, key_epoch=excluded.key_epoch;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, s.device_id);
  BindU64(st.get(), 2, s.logical_clock);
  BindU64(st.get(), 3, s.next_sequence);
  BindU64(st.get(), 4, s.key_epoch);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<vaultsync::model::LocalState> SqliteRepository::LoadLocalState(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT device_id,logical_clock,next_sequence,key_epoch FROM sync_local_state WHERE id=1;");
  if (!st) return std::nullopt;
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  vaultsync::model::LocalState s;
  s.device_id     = ColText(st.get(), 0);
  s.logical_clock = ColU64(st.get(), 1);
  s.next_sequence = ColU64(st.get(), 2);
  s.key_epoch     = ColU64(st.get(), 3);
  return s;
}

Result SqliteRepository::UpsertPeerCursor(Transaction& t, const model::PeerCursorRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO sync_peer_cursors(device_id,inbound_watermark,acked_clock) VALUES(?,?,?) "
               "ON CONFLICT(device_id) DO UPDATE SET inbound_watermark=excluded.inbound_watermark, acked_clock=excluded.acked_clock;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.device_id);
  BindU64(st.get(), 2, r.inbound_watermark);
  BindBlob(st.get(), 3, r.acked_clock);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::PeerCursorRow> SqliteRepository::GetPeerCursor(Transaction& t, const std::string& device_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT device_id,inbound_watermark,acked_clock FROM sync_peer_cursors WHERE device_id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, device_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::PeerCursorRow r;
  r.device_id         = ColText(st.get(), 0);
  r.inbound_watermark = ColU64(st.get(), 1);
  r.acked_clock       = ColBlob(st.get(), 2);
  return r;
}

} // namespace vaultsync::db::sqlite
