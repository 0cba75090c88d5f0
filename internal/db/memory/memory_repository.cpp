#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace vaultsync::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertRecord(Transaction& t, const model::RecordRow& r) {
  auto& s = TX(t).Mutable();
  if (s.records.contains(r.record_id)) return Result::Err(ErrorCode::AlreadyExists, r.record_id);
  s.records[r.record_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRecord(Transaction& t, const model::RecordRow& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(r.record_id);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound, r.record_id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::RecordRow> MemoryRepository::GetRecord(Transaction& t, const std::string& record_id) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(record_id);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RecordRow> MemoryRepository::ListRecords(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::RecordRow> rows;
  rows.reserve(s.records.size());
  for (const auto& [_, row] : s.records) {
    rows.push_back(row);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return rows;
}

Result MemoryRepository::UpsertSnapshot(Transaction& t, const model::SnapshotRow& r) {
  TX(t).Mutable().snapshots[r.entity_id] = r;
  return Result::Ok();
}

std::optional<model::SnapshotRow> MemoryRepository::GetSnapshot(Transaction& t, const std::string& entity_id) {
  const auto& s  = TX(t).View();
  auto        it = s.snapshots.find(entity_id);
  if (it == s.snapshots.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertDevice(Transaction& t, const vaultsync::model::DeviceEntry& d) {
  TX(t).Mutable().devices[d.device_id] = d;
  return Result::Ok();
}

std::optional<vaultsync::model::DeviceEntry> MemoryRepository::GetDevice(Transaction& t, const std::string& device_id) {
  const auto& s  = TX(t).View();
  auto        it = s.devices.find(device_id);
  if (it == s.devices.end()) return std::nullopt;
  return it->second;
}

std::vector<vaultsync::model::DeviceEntry> MemoryRepository::ListDevices(Transaction& t) {
  std::vector<vaultsync::model::DeviceEntry> out;
  for (const auto& [_, device] : TX(t).View().devices)
    out.push_back(device);
  return out;
}

Result MemoryRepository::SaveLocalState(Transaction& t, const vaultsync::model::LocalState& state) {
  TX(t).Mutable().local_state = state;
  return Result::Ok();
}

std::optional<vaultsync::model::LocalState> MemoryRepository::LoadLocalState(Transaction& t) {
  return TX(t).View().local_state;
}

Result MemoryRepository::UpsertPeerCursor(Transaction& t, const model::PeerCursorRow& r) {
  TX(t).Mutable().peer_cursors[r.device_id] = r;
  return Result::Ok();
}

std::optional<model::PeerCursorRow> MemoryRepository::GetPeerCursor(Transaction& t, const std::string& device_id) {
  const auto& s  = TX(t).View();
  auto        it = s.peer_cursors.find(device_id);
  if (it == s.peer_cursors.end()) return std::nullopt;
  return it->second;
}

} // namespace vaultsync::db::memory
