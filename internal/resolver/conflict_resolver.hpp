#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/change_record.hpp"

namespace vaultsync::resolver {

/*
  Causal-order-aware last-writer-wins.

  A record loses to any causal descendant regardless of timestamps. Among
  causally concurrent maximal records the winner has the highest
  (wall_clock_hint, device_id); logical_clock and record_id only separate
  records that agree on both, which a correct device never produces.

  Every function is a pure function of the record set: input order and
  duplicates do not affect the result. Compacted records are skipped.
*/
class ConflictResolver {
 public:
  // True if a is causally before b.
  static bool HappensBefore(const model::ChangeRecord& a, const model::ChangeRecord& b);

  // Concurrent tie-break: true if a loses to b.
  static bool LosesTieBreak(const model::ChangeRecord& a, const model::ChangeRecord& b);

  // Winning record of an arbitrary set, or nullopt if no usable record.
  static std::optional<model::ChangeRecord> Winner(const std::vector<model::ChangeRecord>& records);

  // Resolved value of one field; records for other fields are ignored.
  static std::optional<model::FieldValue> FoldField(const std::vector<model::ChangeRecord>& records, const std::string& field_path);

  // Full entity fold. deleted is set when the entity-wide winner is the
  // lifecycle tombstone; tombstoned fields are omitted, as are field writes
  // causally before any lifecycle tombstone.
  static model::EntitySnapshot FoldEntity(const std::string& entity_id, const std::vector<model::ChangeRecord>& records);
};

} // namespace vaultsync::resolver
