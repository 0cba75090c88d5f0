#pragma once

#include <string>

namespace vaultsync::db::model {

// Serialized EntitySnapshot keyed by entity.
struct SnapshotRow {
  std::string entity_id;
  bool        deleted = false;
  std::string encoded;

  bool operator==(const SnapshotRow&) const = default;
};

} // namespace vaultsync::db::model
