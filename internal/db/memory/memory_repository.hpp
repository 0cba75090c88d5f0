#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace vaultsync::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::RecordRow>   records;
    std::unordered_map<std::string, model::SnapshotRow> snapshots;
    std::map<std::string, vaultsync::model::DeviceEntry> devices;
    std::optional<vaultsync::model::LocalState>          local_state;
    std::unordered_map<std::string, model::PeerCursorRow> peer_cursors;
  };

  // Held for a transaction's lifetime, like BEGIN IMMEDIATE.
  std::mutex    writer_mutex_;
  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace vaultsync::db::memory
