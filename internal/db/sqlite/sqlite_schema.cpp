#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace vaultsync::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS sync_records (record_id TEXT PRIMARY KEY, entity_id TEXT NOT NULL, field_path TEXT NOT NULL, device_id TEXT NOT NULL, logical_clock INTEGER NOT NULL, sequence INTEGER NOT NULL, compacted INTEGER NOT NULL DEFAULT 0, encoded BLOB NOT NULL);",
      "CREATE INDEX IF NOT EXISTS sync_records_sequence ON sync_records(sequence);",
      "CREATE INDEX IF NOT EXISTS sync_records_entity ON sync_records(entity_id);",
      "CREATE TABLE IF NOT EXISTS sync_snapshots (entity_id TEXT PRIMARY KEY, deleted INTEGER NOT NULL, encoded BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sync_devices (device_id TEXT PRIMARY KEY, signing_public BLOB NOT NULL, encryption_public BLOB NOT NULL, key_epoch INTEGER NOT NULL, trust INTEGER NOT NULL, last_seen_clock INTEGER NOT NULL, revoked_after_clock INTEGER NOT NULL, quarantined INTEGER NOT NULL, last_synced_ms INTEGER NOT NULL, token BLOB NOT NULL, revocation BLOB NOT NULL, rotation BLOB NOT NULL, previous_encryption_public BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sync_local_state (id INTEGER PRIMARY KEY CHECK (id = 1), device_id TEXT NOT NULL, logical_clock INTEGER NOT NULL, next_sequence INTEGER NOT NULL, key_epoch INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sync_peer_cursors (device_id TEXT PRIMARY KEY, inbound_watermark INTEGER NOT NULL, acked_clock BLOB NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sync_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO sync_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace vaultsync::db::sqlite
