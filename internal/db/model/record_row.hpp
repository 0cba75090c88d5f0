#pragma once

#include <cstdint>
#include <string>

namespace vaultsync::db::model {

/*
  Persistent change record row.

  The full record is stored as a serialized ChangeRecord; the indexed columns
  duplicate the fields queries filter on. sequence is the local arrival
  order and is what ListRecords sorts by.
*/
struct RecordRow {
  std::string   record_id;
  std::string   entity_id;
  std::string   field_path;
  std::string   device_id;
  std::uint64_t logical_clock = 0;
  std::uint64_t sequence      = 0;
  bool          compacted     = false;
  std::string   encoded;

  bool operator==(const RecordRow&) const = default;
};

} // namespace vaultsync::db::model
