#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vaultsync::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertRecord(Transaction&, const model::RecordRow&) override;
  Result                          UpdateRecord(Transaction&, const model::RecordRow&) override;
  std::optional<model::RecordRow> GetRecord(Transaction&, const std::string&) override;
  std::vector<model::RecordRow>   ListRecords(Transaction&) override;

  Result                            UpsertSnapshot(Transaction&, const model::SnapshotRow&) override;
  std::optional<model::SnapshotRow> GetSnapshot(Transaction&, const std::string&) override;

  Result                                      UpsertDevice(Transaction&, const vaultsync::model::DeviceEntry&) override;
  std::optional<vaultsync::model::DeviceEntry> GetDevice(Transaction&, const std::string&) override;
  std::vector<vaultsync::model::DeviceEntry>   ListDevices(Transaction&) override;

  Result                                     SaveLocalState(Transaction&, const vaultsync::model::LocalState&) override;
  std::optional<vaultsync::model::LocalState> LoadLocalState(Transaction&) override;

  Result                              UpsertPeerCursor(Transaction&, const model::PeerCursorRow&) override;
  std::optional<model::PeerCursorRow> GetPeerCursor(Transaction&, const std::string&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace vaultsync::db::sqlite
