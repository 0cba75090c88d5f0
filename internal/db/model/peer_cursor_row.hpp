#pragma once

#include <cstdint>
#include <string>

namespace vaultsync::db::model {

/*
  Per-peer sync progress that must survive restarts.

  inbound_watermark: highest envelope sequence accepted from the peer.
  acked_clock: serialized VectorClock the peer last acknowledged.
*/
struct PeerCursorRow {
  std::string   device_id;
  std::uint64_t inbound_watermark = 0;
  std::string   acked_clock;

  bool operator==(const PeerCursorRow&) const = default;
};

} // namespace vaultsync::db::model
