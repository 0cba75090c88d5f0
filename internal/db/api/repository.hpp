#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/peer_cursor_row.hpp"
#include "internal/db/model/record_row.hpp"
#include "internal/db/model/snapshot_row.hpp"
#include "internal/model/device.hpp"

namespace vaultsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A batch of records, their snapshots and the local clock commit together

  The DB is the source of truth for:
    change records
    device registry
    local device counters
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Change records
  // ---------------------------------------------------------------------

  // AlreadyExists if record_id is present.
  virtual Result InsertRecord(Transaction&, const model::RecordRow&) = 0;

  // Replaces the stored row; used by compaction.
  virtual Result UpdateRecord(Transaction&, const model::RecordRow&) = 0;

  virtual std::optional<model::RecordRow> GetRecord(Transaction&, const std::string& record_id) = 0;

  // Ordered by sequence.
  virtual std::vector<model::RecordRow> ListRecords(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Entity snapshots
  // ---------------------------------------------------------------------

  virtual Result UpsertSnapshot(Transaction&, const model::SnapshotRow&) = 0;

  virtual std::optional<model::SnapshotRow> GetSnapshot(Transaction&, const std::string& entity_id) = 0;

  // ---------------------------------------------------------------------
  // Device registry
  // ---------------------------------------------------------------------

  virtual Result UpsertDevice(Transaction&, const vaultsync::model::DeviceEntry&) = 0;

  virtual std::optional<vaultsync::model::DeviceEntry> GetDevice(Transaction&, const std::string& device_id) = 0;

  virtual std::vector<vaultsync::model::DeviceEntry> ListDevices(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Local device state and peer cursors
  // ---------------------------------------------------------------------

  virtual Result SaveLocalState(Transaction&, const vaultsync::model::LocalState&) = 0;

  virtual std::optional<vaultsync::model::LocalState> LoadLocalState(Transaction&) = 0;

  virtual Result UpsertPeerCursor(Transaction&, const model::PeerCursorRow&) = 0;

  virtual std::optional<model::PeerCursorRow> GetPeerCursor(Transaction&, const std::string& device_id) = 0;
};

} // namespace vaultsync::db
