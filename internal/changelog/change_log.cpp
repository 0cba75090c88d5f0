#include "change_log.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/resolver/conflict_resolver.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/wire/codec.hpp"

namespace vaultsync::changelog {

using observability::IntField;
using observability::StringField;

namespace {

db::model::RecordRow ToRow(const model::ChangeRecord& record, std::uint64_t sequence) {
  db::model::RecordRow row;
  row.record_id     = record.record_id;
  row.entity_id     = record.entity_id;
  row.field_path    = record.field_path;
  row.device_id     = record.device_id;
  row.logical_clock = record.logical_clock;
  row.sequence      = sequence;
  row.compacted     = record.compacted;
  row.encoded       = wire::EncodeRecord(record);
  return row;
}

db::model::SnapshotRow ToRow(const model::EntitySnapshot& snapshot) {
  return db::model::SnapshotRow{snapshot.entity_id, snapshot.deleted, wire::EncodeSnapshot(snapshot)};
}

bool DependenciesMet(const model::VectorClock& known, const model::ChangeRecord& record) {
  return known.Get(record.device_id) + 1 == record.logical_clock && known.Dominates(record.causal_deps);
}

std::string SlotName(const model::ChangeRecord& record) {
  return record.device_id + "@" + std::to_string(record.logical_clock);
}

} // namespace

ChangeLog::ChangeLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<const registry::DeviceRegistry> registry, std::string local_device_id,
                     ChangeLogOptions options, util::ClockFn clock)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      local_device_id_(std::move(local_device_id)),
      options_(options),
      clock_(std::move(clock)) {
  Load();
}

void ChangeLog::Load() {
  auto tx    = repository_->Begin();
  auto rows  = repository_->ListRecords(*tx);
  auto state = repository_->LoadLocalState(*tx);
  tx->Commit();

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& row : rows) {
    auto record = wire::DecodeRecord(row.encoded);
    record.compacted = row.compacted;

    const auto position = records_.size();
    index_[record.record_id] = position;
    slots_[{record.device_id, record.logical_clock}] = record.record_id;
    by_entity_[record.entity_id].push_back(position);
    known_.Observe(record.device_id, record.logical_clock);
    next_sequence_ = std::max(next_sequence_, row.sequence + 1);
    records_.push_back(std::move(record));
  }

  local_clock_ = known_.Get(local_device_id_);
  if (state && state->device_id == local_device_id_) {
    local_clock_ = std::max(local_clock_, state->logical_clock);
  }

  VAULTSYNC_LOG_INFO("change log loaded", {IntField("records", static_cast<int64_t>(records_.size())),
                                           IntField("local_clock", static_cast<int64_t>(local_clock_))});
}

// ------------------------------------------------------------------
// Local mutations
// ------------------------------------------------------------------

model::ChangeRecord ChangeLog::Append(const std::string& entity_id, const std::string& field_path, model::FieldValue value) {
  if (entity_id.empty() || field_path.empty()) {
    throw util::InvalidState("entity_id and field_path are required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return AppendLocked(entity_id, field_path, std::move(value));
}

model::ChangeRecord ChangeLog::Delete(const std::string& entity_id) {
  if (entity_id.empty()) {
    throw util::InvalidState("entity_id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return AppendLocked(entity_id, model::kLifecycleField, model::Tombstone{});
}

model::ChangeRecord ChangeLog::AppendLocked(const std::string& entity_id, const std::string& field_path, model::FieldValue value) {
  model::ChangeRecord record;
  record.record_id          = util::GenerateUUIDString();
  record.entity_id          = entity_id;
  record.field_path         = field_path;
  record.value              = std::move(value);
  record.device_id          = local_device_id_;
  record.logical_clock      = local_clock_ + 1;
  record.wall_clock_hint_ms = util::ToUnixMillis(clock_());
  record.causal_deps        = known_;

  auto entity_records = EntityRecords(entity_id);
  entity_records.push_back(record);
  const auto snapshot = resolver::ConflictResolver::FoldEntity(entity_id, entity_records);

  auto tx    = repository_->Begin();
  auto state = repository_->LoadLocalState(*tx).value_or(model::LocalState{});
  state.device_id     = local_device_id_;
  state.logical_clock = record.logical_clock;

  db::ThrowIfError(repository_->InsertRecord(*tx, ToRow(record, next_sequence_)), "insert record");
  db::ThrowIfError(repository_->UpsertSnapshot(*tx, ToRow(snapshot)), "upsert snapshot");
  db::ThrowIfError(repository_->SaveLocalState(*tx, state), "save local state");
  tx->Commit();

  const auto position = records_.size();
  index_[record.record_id] = position;
  slots_[{record.device_id, record.logical_clock}] = record.record_id;
  by_entity_[entity_id].push_back(position);
  known_.Observe(record.device_id, record.logical_clock);
  local_clock_ = record.logical_clock;
  ++next_sequence_;
  records_.push_back(record);
  return record;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<model::ChangeRecord> ChangeLog::RecordsSince(const model::VectorClock& known, std::size_t limit) const {
  std::lock_guard<std::mutex>      lock(mutex_);
  std::vector<model::ChangeRecord> out;
  for (const auto& record : records_) {
    if (known.Get(record.device_id) >= record.logical_clock) continue;
    out.push_back(record);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

std::size_t ChangeLog::CountSince(const model::VectorClock& known) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t                 count = 0;
  for (const auto& record : records_) {
    if (known.Get(record.device_id) < record.logical_clock) ++count;
  }
  return count;
}

std::vector<model::ChangeRecord> ChangeLog::EntityRecords(const std::string& entity_id) const {
  std::vector<model::ChangeRecord> out;
  auto                             it = by_entity_.find(entity_id);
  if (it == by_entity_.end()) return out;
  out.reserve(it->second.size());
  for (auto position : it->second) {
    out.push_back(records_[position]);
  }
  return out;
}

model::EntitySnapshot ChangeLog::Snapshot(const std::string& entity_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resolver::ConflictResolver::FoldEntity(entity_id, EntityRecords(entity_id));
}

model::VectorClock ChangeLog::Known() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return known_;
}

std::uint64_t ChangeLog::LocalClock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return local_clock_;
}

std::size_t ChangeLog::RecordCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

std::size_t ChangeLog::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::vector<model::ChangeRecord> ChangeLog::Records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

void ChangeLog::CheckReportedClock(const std::string& device_id, std::uint64_t reported_clock) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  held = known_.Get(device_id);
  if (reported_clock < held) {
    throw util::ClockRegression("device " + device_id + " reports clock " + std::to_string(reported_clock) + " below held " + std::to_string(held));
  }
}

// ------------------------------------------------------------------
// Remote ingestion
// ------------------------------------------------------------------

ChangeLog::Plan ChangeLog::BuildPlan(const std::vector<model::ChangeRecord>& incoming) const {
  Plan plan;

  // Slots claimed by not-yet-applied candidates.
  std::map<std::pair<std::string, std::uint64_t>, std::string> candidate_slots;
  std::map<std::string, model::ChangeRecord>                   candidates;

  auto admit = [&](const model::ChangeRecord& record) {
    const auto slot = std::make_pair(record.device_id, record.logical_clock);
    if (auto held = slots_.find(slot); held != slots_.end() && held->second != record.record_id) {
      throw util::ClockRegression("slot " + SlotName(record) + " already holds a different record");
    }
    if (auto claimed = candidate_slots.find(slot); claimed != candidate_slots.end() && claimed->second != record.record_id) {
      throw util::ClockRegression("slot " + SlotName(record) + " claimed by two records");
    }
    candidate_slots[slot] = record.record_id;
    candidates.emplace(record.record_id, record);
  };

  for (const auto& [_, record] : pending_) {
    admit(record);
  }
  for (const auto& record : incoming) {
    if (index_.contains(record.record_id)) {
      ++plan.duplicates;
      continue;
    }
    if (!candidates.contains(record.record_id)) {
      admit(record);
    }
  }

  // Lowest rejected clock per device; anything at or above it, or depending
  // on it, is rejected too.
  std::map<std::string, std::uint64_t> rejected_from;
  std::set<std::string>                blocked;

  auto reject = [&](std::map<std::string, model::ChangeRecord>::iterator it) {
    auto& floor = rejected_from[it->second.device_id];
    floor       = floor == 0 ? it->second.logical_clock : std::min(floor, it->second.logical_clock);
    plan.rejected.insert(it->first);
    return candidates.erase(it);
  };

  std::map<std::string, registry::OriginStatus> origin;
  // Per device, the highest clock some trusted record already depends on. A
  // trusted peer that merged a record before hearing of its origin's
  // revocation keeps it, and so does everyone it syncs with.
  model::VectorClock vouched;
  for (const auto& [record_id, record] : candidates) {
    const auto status = registry_->ClassifyOrigin(record.device_id, record.logical_clock);
    origin[record_id] = status;
    if (status == registry::OriginStatus::kAccepted) {
      vouched.Merge(record.causal_deps);
    }
  }

  for (auto it = candidates.begin(); it != candidates.end();) {
    switch (origin[it->first]) {
      case registry::OriginStatus::kRejected:
        if (vouched.Get(it->second.device_id) >= it->second.logical_clock) {
          ++plan.vouched;
          ++it;
        } else {
          it = reject(it);
        }
        break;
      case registry::OriginStatus::kUnknown:
        blocked.insert(it->first);
        ++it;
        break;
      case registry::OriginStatus::kAccepted:
        ++it;
        break;
    }
  }

  auto depends_on_rejected = [&](const model::ChangeRecord& record) {
    for (const auto& [device_id, floor] : rejected_from) {
      if (record.causal_deps.Get(device_id) >= floor || (record.device_id == device_id && record.logical_clock >= floor)) {
        return true;
      }
    }
    return false;
  };

  bool progress = !rejected_from.empty();
  while (progress) {
    progress = false;
    for (auto it = candidates.begin(); it != candidates.end();) {
      if (depends_on_rejected(it->second)) {
        it       = reject(it);
        progress = true;
      } else {
        ++it;
      }
    }
  }

  model::VectorClock simulated = known_;
  progress                     = true;
  while (progress) {
    progress = false;
    for (auto it = candidates.begin(); it != candidates.end();) {
      if (!blocked.contains(it->first) && DependenciesMet(simulated, it->second)) {
        simulated.Set(it->second.device_id, it->second.logical_clock);
        plan.apply.push_back(std::move(it->second));
        it       = candidates.erase(it);
        progress = true;
      } else {
        ++it;
      }
    }
  }

  if (candidates.size() > options_.pending_limit) {
    throw util::MissingCausalDependency("pending buffer would hold " + std::to_string(candidates.size()) + " records, limit " +
                                        std::to_string(options_.pending_limit));
  }
  if (!plan.rejected.empty()) {
    VAULTSYNC_LOG_WARN("records from revoked devices rejected", {IntField("count", static_cast<int64_t>(plan.rejected.size()))});
  }
  if (plan.vouched > 0) {
    VAULTSYNC_LOG_INFO("records from revoked devices kept, merged by trusted peers", {IntField("count", static_cast<int64_t>(plan.vouched))});
  }
  plan.pending     = std::move(candidates);
  plan.known_after = std::move(simulated);
  return plan;
}

void ChangeLog::ApplyPlan(Plan plan) {
  if (plan.apply.empty()) {
    pending_ = std::move(plan.pending);
    return;
  }

  std::map<std::string, std::vector<model::ChangeRecord>> touched;
  for (const auto& record : plan.apply) {
    if (!touched.contains(record.entity_id)) {
      touched.emplace(record.entity_id, EntityRecords(record.entity_id));
    }
    touched[record.entity_id].push_back(record);
  }

  std::vector<model::EntitySnapshot> snapshots;
  snapshots.reserve(touched.size());
  for (const auto& [entity_id, records] : touched) {
    snapshots.push_back(resolver::ConflictResolver::FoldEntity(entity_id, records));
  }

  std::uint64_t new_local_clock = local_clock_;
  for (const auto& record : plan.apply) {
    if (record.device_id == local_device_id_) {
      new_local_clock = std::max(new_local_clock, record.logical_clock);
    }
  }

  auto tx       = repository_->Begin();
  auto sequence = next_sequence_;
  for (const auto& record : plan.apply) {
    db::ThrowIfError(repository_->InsertRecord(*tx, ToRow(record, sequence++)), "insert record " + record.record_id);
  }
  for (const auto& snapshot : snapshots) {
    db::ThrowIfError(repository_->UpsertSnapshot(*tx, ToRow(snapshot)), "upsert snapshot " + snapshot.entity_id);
  }
  if (new_local_clock != local_clock_) {
    // Own records recovered from a peer after local data loss.
    auto state          = repository_->LoadLocalState(*tx).value_or(model::LocalState{});
    state.device_id     = local_device_id_;
    state.logical_clock = new_local_clock;
    db::ThrowIfError(repository_->SaveLocalState(*tx, state), "save local state");
  }
  tx->Commit();

  for (auto& record : plan.apply) {
    const auto position = records_.size();
    index_[record.record_id] = position;
    slots_[{record.device_id, record.logical_clock}] = record.record_id;
    by_entity_[record.entity_id].push_back(position);
    known_.Observe(record.device_id, record.logical_clock);
    records_.push_back(std::move(record));
  }
  next_sequence_ = sequence;
  local_clock_   = new_local_clock;
  pending_       = std::move(plan.pending);
}

IngestOutcome ChangeLog::Ingest(const model::ChangeRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.contains(record.record_id)) {
    return IngestOutcome::kDuplicate;
  }

  ApplyPlan(BuildPlan({record}));
  if (index_.contains(record.record_id)) {
    return IngestOutcome::kApplied;
  }
  return pending_.contains(record.record_id) ? IngestOutcome::kPending : IngestOutcome::kRejected;
}

StagedBatch ChangeLog::Stage(const std::string& peer_id, std::vector<model::ChangeRecord> records) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  plan = BuildPlan(records);

  StagedBatch batch;
  batch.peer_id_     = peer_id;
  batch.applicable_  = plan.apply.size();
  batch.duplicates_  = plan.duplicates;
  batch.known_after_ = plan.known_after;
  for (const auto& record : records) {
    if (plan.pending.contains(record.record_id)) ++batch.unresolved_;
    if (plan.rejected.contains(record.record_id)) ++batch.rejected_;
  }
  batch.records_ = std::move(records);
  return batch;
}

void ChangeLog::Commit(const StagedBatch& batch) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        plan    = BuildPlan(batch.records_);
  const auto                  applied = plan.apply.size();
  ApplyPlan(std::move(plan));

  VAULTSYNC_LOG_INFO("batch committed", {StringField("peer_id", batch.peer_id_), IntField("applied", static_cast<int64_t>(applied)),
                                         IntField("pending", static_cast<int64_t>(pending_.size()))});
}

// ------------------------------------------------------------------
// Compaction
// ------------------------------------------------------------------

std::size_t ChangeLog::Compact(const model::VectorClock& acked) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto is_acked = [&](const model::ChangeRecord& r) { return acked.Get(r.device_id) >= r.logical_clock; };

  std::vector<std::size_t> victims;
  for (std::size_t i = 0; i < records_.size(); ++i) {
    const auto& record = records_[i];
    if (record.compacted || !is_acked(record)) continue;
    // Lifecycle tombstones hide the field writes before them; they stay.
    if (record.field_path == model::kLifecycleField && model::IsTombstone(record.value)) continue;

    bool superseded      = false;
    bool unacked_depends = false;
    for (auto position : by_entity_[record.entity_id]) {
      const auto& other = records_[position];
      if (other.field_path == record.field_path && !other.compacted && is_acked(other) &&
          resolver::ConflictResolver::HappensBefore(record, other)) {
        superseded = true;
        break;
      }
    }
    if (!superseded) continue;

    for (const auto& other : records_) {
      if (!is_acked(other) && resolver::ConflictResolver::HappensBefore(record, other)) {
        unacked_depends = true;
        break;
      }
    }
    if (!unacked_depends) victims.push_back(i);
  }

  if (victims.empty()) {
    return 0;
  }

  auto tx = repository_->Begin();
  for (auto i : victims) {
    auto stub      = records_[i];
    stub.compacted = true;
    stub.value     = model::Tombstone{};
    auto row       = repository_->GetRecord(*tx, stub.record_id);
    if (!row) {
      throw util::NotFound("record missing during compaction: " + stub.record_id);
    }
    db::ThrowIfError(repository_->UpdateRecord(*tx, ToRow(stub, row->sequence)), "compact record " + stub.record_id);
  }
  tx->Commit();

  for (auto i : victims) {
    records_[i].compacted = true;
    records_[i].value     = model::Tombstone{};
  }

  VAULTSYNC_LOG_INFO("change log compacted", {IntField("records", static_cast<int64_t>(victims.size()))});
  return victims.size();
}

} // namespace vaultsync::changelog
