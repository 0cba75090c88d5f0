#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/model/field_value.hpp"
#include "internal/model/vector_clock.hpp"

namespace vaultsync::model {

// Field path that carries an entity's deletion tombstone.
inline constexpr const char* kLifecycleField = "$entity";

struct ChangeRecord {
  std::string   record_id;
  std::string   entity_id;
  std::string   field_path;
  FieldValue    value;
  std::string   device_id;
  std::uint64_t logical_clock      = 0;
  std::int64_t  wall_clock_hint_ms = 0;
  VectorClock   causal_deps;
  bool          compacted = false;

  // causal_deps plus the record's own slot.
  VectorClock FullClock() const {
    VectorClock clock = causal_deps;
    clock.Observe(device_id, logical_clock);
    return clock;
  }

  bool operator==(const ChangeRecord&) const = default;
};

struct EntitySnapshot {
  std::string                       entity_id;
  bool                              deleted = false;
  std::map<std::string, FieldValue> fields;

  bool operator==(const EntitySnapshot&) const = default;
};

} // namespace vaultsync::model
