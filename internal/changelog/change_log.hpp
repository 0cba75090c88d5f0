#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/change_record.hpp"
#include "internal/registry/device_registry.hpp"
#include "internal/util/time.hpp"

namespace vaultsync::changelog {

struct ChangeLogOptions {
  // Records held back waiting for causal dependencies.
  std::size_t pending_limit = 10'000;
};

enum class IngestOutcome {
  kApplied,
  kDuplicate,
  kPending,
  // Origin revoked past its cutoff and no trusted record depends on it, or
  // depends on such a record.
  kRejected,
};

/*
  A validated remote batch that has not touched the log.

  Commit() re-validates against the log as it is at commit time, so a batch
  staged before other records arrived still commits correctly.
*/
class StagedBatch {
 public:
  const std::string& peer_id() const {
    return peer_id_;
  }
  const std::vector<model::ChangeRecord>& records() const {
    return records_;
  }

  std::size_t applicable() const {
    return applicable_;
  }
  std::size_t duplicates() const {
    return duplicates_;
  }
  std::size_t rejected() const {
    return rejected_;
  }
  // Records of this batch still missing a causal dependency.
  std::size_t unresolved() const {
    return unresolved_;
  }
  bool complete() const {
    return unresolved_ == 0;
  }
  // What the log will know once this batch commits.
  const model::VectorClock& known_after() const {
    return known_after_;
  }

 private:
  friend class ChangeLog;

  std::string                      peer_id_;
  std::vector<model::ChangeRecord> records_;
  std::size_t                      applicable_ = 0;
  std::size_t                      duplicates_ = 0;
  std::size_t                      rejected_   = 0;
  std::size_t                      unresolved_ = 0;
  model::VectorClock               known_after_;
};

/*
  Append-only log of this device's records plus replicas of other devices'.

  A single mutex serializes local appends, staging, commits and folds.
  Arrival order is always a causal order: a record is only applied once
  every record it depends on is held.
*/
class ChangeLog {
 public:
  ChangeLog(std::shared_ptr<db::Repository> repository, std::shared_ptr<const registry::DeviceRegistry> registry, std::string local_device_id,
            ChangeLogOptions options = {}, util::ClockFn clock = util::Now);

  model::ChangeRecord Append(const std::string& entity_id, const std::string& field_path, model::FieldValue value);

  // Tombstone on the entity's lifecycle field.
  model::ChangeRecord Delete(const std::string& entity_id);

  // Held records the requester does not know, dependencies first.
  // limit == 0 means unlimited; a limited result is still causally closed.
  std::vector<model::ChangeRecord> RecordsSince(const model::VectorClock& known, std::size_t limit = 0) const;
  std::size_t                      CountSince(const model::VectorClock& known) const;

  IngestOutcome Ingest(const model::ChangeRecord& record);

  // Validates without mutating anything. Records from devices not yet
  // trusted wait as pending. Throws ClockRegression or
  // MissingCausalDependency.
  StagedBatch Stage(const std::string& peer_id, std::vector<model::ChangeRecord> records) const;

  // Applies a staged batch in one storage transaction.
  void Commit(const StagedBatch& batch);

  // Throws ClockRegression if a device reports a clock below what is held.
  void CheckReportedClock(const std::string& device_id, std::uint64_t reported_clock) const;

  // Drops value payloads that no fold can observe any more. acked holds, per
  // device, the highest clock every trusted device has acknowledged.
  std::size_t Compact(const model::VectorClock& acked);

  model::EntitySnapshot            Snapshot(const std::string& entity_id) const;
  model::VectorClock               Known() const;
  std::uint64_t                    LocalClock() const;
  std::size_t                      RecordCount() const;
  std::size_t                      PendingCount() const;
  std::vector<model::ChangeRecord> Records() const;

  const std::string& local_device_id() const {
    return local_device_id_;
  }

 private:
  struct Plan {
    std::vector<model::ChangeRecord>           apply;
    std::map<std::string, model::ChangeRecord> pending;
    std::size_t                                duplicates = 0;
    std::set<std::string>                      rejected;
    std::size_t                                vouched = 0;
    model::VectorClock                         known_after;
  };

  void Load();

  Plan BuildPlan(const std::vector<model::ChangeRecord>& incoming) const;
  void ApplyPlan(Plan plan);

  model::ChangeRecord AppendLocked(const std::string& entity_id, const std::string& field_path, model::FieldValue value);

  std::vector<model::ChangeRecord> EntityRecords(const std::string& entity_id) const;

  std::shared_ptr<db::Repository>                 repository_;
  std::shared_ptr<const registry::DeviceRegistry> registry_;
  std::string                                     local_device_id_;
  ChangeLogOptions                                options_;
  util::ClockFn                                   clock_;

  mutable std::mutex mutex_;

  std::vector<model::ChangeRecord>                            records_;
  std::unordered_map<std::string, std::size_t>                index_;
  std::map<std::pair<std::string, std::uint64_t>, std::string> slots_;
  std::unordered_map<std::string, std::vector<std::size_t>>   by_entity_;
  std::map<std::string, model::ChangeRecord>                  pending_;

  model::VectorClock known_;
  std::uint64_t      local_clock_   = 0;
  std::uint64_t      next_sequence_ = 1;
};

} // namespace vaultsync::changelog
