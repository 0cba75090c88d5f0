#pragma once

#include <cstdint>
#include <string>

namespace vaultsync::model {

enum class TrustState : std::uint8_t {
  kPending = 0,
  kTrusted = 1,
  kRevoked = 2,
};

constexpr const char* TrustStateName(TrustState state) {
  switch (state) {
    case TrustState::kPending:
      return "pending";
    case TrustState::kTrusted:
      return "trusted";
    case TrustState::kRevoked:
      return "revoked";
  }
  return "unknown";
}

struct DeviceEntry {
  std::string   device_id;
  std::string   signing_public;
  std::string   encryption_public;
  std::uint64_t key_epoch = 0;
  TrustState    trust     = TrustState::kPending;
  // Key replaced by the last rotation; batches sealed before the peer
  // learned about it still open with this one.
  std::string previous_encryption_public;

  std::uint64_t last_seen_clock = 0;
  // Records from a revoked device above this clock are rejected.
  std::uint64_t revoked_after_clock = 0;
  bool          quarantined         = false;
  std::int64_t  last_synced_ms      = 0;

  // Serialized signed proofs, re-sent to peers inside Hello.
  std::string token;
  std::string revocation;
  std::string rotation;

  bool operator==(const DeviceEntry&) const = default;
};

// Persisted per-vault counters of the local device.
struct LocalState {
  std::string   device_id;
  std::uint64_t logical_clock = 0;
  std::uint64_t next_sequence = 1;
  std::uint64_t key_epoch     = 1;

  bool operator==(const LocalState&) const = default;
};

} // namespace vaultsync::model
