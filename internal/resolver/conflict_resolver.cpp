#include "conflict_resolver.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace vaultsync::resolver {

namespace {

// Deduplicated, non-compacted view keyed by record id.
std::map<std::string, const model::ChangeRecord*> Usable(const std::vector<model::ChangeRecord>& records, const std::string* field_path) {
  std::map<std::string, const model::ChangeRecord*> out;
  for (const auto& record : records) {
    if (record.compacted) continue;
    if (field_path && record.field_path != *field_path) continue;
    out.emplace(record.record_id, &record);
  }
  return out;
}

const model::ChangeRecord* PickWinner(const std::map<std::string, const model::ChangeRecord*>& usable) {
  const model::ChangeRecord* best = nullptr;
  for (const auto& [_, candidate] : usable) {
    bool dominated = false;
    for (const auto& [__, other] : usable) {
      if (other != candidate && ConflictResolver::HappensBefore(*candidate, *other)) {
        dominated = true;
        break;
      }
    }
    if (dominated) continue;
    if (!best || ConflictResolver::LosesTieBreak(*best, *candidate)) {
      best = candidate;
    }
  }
  return best;
}

} // namespace

bool ConflictResolver::HappensBefore(const model::ChangeRecord& a, const model::ChangeRecord& b) {
  if (a.device_id == b.device_id) {
    return a.logical_clock < b.logical_clock;
  }
  return b.causal_deps.Get(a.device_id) >= a.logical_clock;
}

bool ConflictResolver::LosesTieBreak(const model::ChangeRecord& a, const model::ChangeRecord& b) {
  return std::tie(a.wall_clock_hint_ms, a.device_id, a.logical_clock, a.record_id) <
         std::tie(b.wall_clock_hint_ms, b.device_id, b.logical_clock, b.record_id);
}

std::optional<model::ChangeRecord> ConflictResolver::Winner(const std::vector<model::ChangeRecord>& records) {
  const auto* winner = PickWinner(Usable(records, nullptr));
  if (!winner) return std::nullopt;
  return *winner;
}

std::optional<model::FieldValue> ConflictResolver::FoldField(const std::vector<model::ChangeRecord>& records, const std::string& field_path) {
  const auto* winner = PickWinner(Usable(records, &field_path));
  if (!winner) return std::nullopt;
  return winner->value;
}

model::EntitySnapshot ConflictResolver::FoldEntity(const std::string& entity_id, const std::vector<model::ChangeRecord>& records) {
  model::EntitySnapshot snapshot;
  snapshot.entity_id = entity_id;

  std::vector<model::ChangeRecord> own;
  for (const auto& record : records) {
    if (record.entity_id == entity_id) own.push_back(record);
  }

  std::vector<const model::ChangeRecord*> tombstones;
  for (const auto& record : own) {
    if (!record.compacted && record.field_path == model::kLifecycleField && model::IsTombstone(record.value)) {
      tombstones.push_back(&record);
    }
  }

  // A write the deleting device had already seen stays deleted, even after a
  // later write brings the entity back.
  std::map<std::string, std::vector<model::ChangeRecord>> by_field;
  for (const auto& record : own) {
    const bool erased = std::any_of(tombstones.begin(), tombstones.end(), [&](const auto* t) { return HappensBefore(record, *t); });
    if (!erased) by_field[record.field_path].push_back(record);
  }

  if (const auto winner = Winner(own)) {
    snapshot.deleted = winner->field_path == model::kLifecycleField && model::IsTombstone(winner->value);
  }
  if (snapshot.deleted) {
    return snapshot;
  }

  for (const auto& [field, field_records] : by_field) {
    if (field == model::kLifecycleField) continue;
    auto value = FoldField(field_records, field);
    if (value && !model::IsTombstone(*value)) {
      snapshot.fields.emplace(field, std::move(*value));
    }
  }
  return snapshot;
}

} // namespace vaultsync::resolver
