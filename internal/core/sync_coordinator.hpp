#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/changelog/change_log.hpp"
#include "internal/crypto/device_identity.hpp"
#include "internal/crypto/key_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/registry/device_registry.hpp"
#include "internal/session/envelope.hpp"
#include "internal/session/sync_session.hpp"
#include "internal/transport/replay_guard.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vaultsync::core {

struct CoordinatorOptions {
  session::SessionOptions     session;
  changelog::ChangeLogOptions log;
  std::size_t                 padding_block      = 256;
  bool                        compaction_enabled = false;
};

struct PeerSyncStatus {
  std::string         device_id;
  model::TrustState   trust         = model::TrustState::kPending;
  model::SessionState session_state = model::SessionState::kIdle;
  std::int64_t        last_synced_ms = 0;
  // Records the peer has not acknowledged yet.
  std::size_t pending_records = 0;
  std::string last_error;
  bool        quarantined = false;
};

struct SyncStatus {
  std::string                 device_id;
  std::uint64_t               local_clock     = 0;
  std::size_t                 record_count    = 0;
  std::size_t                 pending_inbound = 0;
  std::vector<PeerSyncStatus> peers;
};

/*
  SyncCoordinator

  The engine for one vault on one device. Owns the registry, the change log
  and one session per peer, and drives them from inbound batches, explicit
  triggers and Pump() ticks.

  Threading:
    - one mutex guards sessions, peer bookkeeping and the device identity
    - batches are sealed under the mutex and sent after releasing it
    - Append/Delete/Snapshot go straight to the change log
*/
class SyncCoordinator {
 public:
  SyncCoordinator(std::string vault_id, crypto::DeviceIdentity identity, std::shared_ptr<crypto::KeyStore> key_store,
                  std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport, CoordinatorOptions options = {},
                  util::ClockFn clock = util::Now);

  const std::string& device_id() const {
    return device_id_;
  }
  const std::string& vault_id() const {
    return vault_id_;
  }

  // Self-signed token for the pairing UX to hand to other devices.
  vaultsync::core::v1::DeviceToken DeviceToken() const;

  model::DeviceEntry Pair(const vaultsync::core::v1::DeviceToken& token);

  // Revokes with a cutoff at the highest record held from the device.
  void Revoke(const std::string& device_id);

  // Starts a session with every trusted peer that has none running.
  std::size_t TriggerSync();
  bool        TriggerSync(const std::string& peer_id);

  SyncStatus Status() const;

  model::ChangeRecord   Append(const std::string& entity_id, const std::string& field_path, model::FieldValue value);
  model::ChangeRecord   Delete(const std::string& entity_id);
  model::EntitySnapshot Snapshot(const std::string& entity_id) const;

  // Discards the staged batch; the log stays as it was before the session.
  bool Cancel(const std::string& peer_id);

  vaultsync::core::v1::KeyRotation RotateEncryptionKey();

  // Drains the inbox, then handles timeouts, retries and follow-ups.
  // Returns the number of batches received.
  std::size_t Pump();

  std::shared_ptr<changelog::ChangeLog> change_log() const {
    return log_;
  }
  std::shared_ptr<registry::DeviceRegistry> registry() const {
    return registry_;
  }

 private:
  struct PeerState {
    std::unique_ptr<session::SyncSession> session;
    std::uint32_t                         failures = 0;
    std::optional<util::TimePoint>        retry_at;
    bool                                  request_full = false;
    bool                                  follow_up    = false;
    // Which of our encryption keys the peer sealed to last.
    std::optional<bool>               holds_current_key;
    std::optional<model::VectorClock> acked;
    std::string                       reconciled_session;
    std::string                       last_error;
    // Set by re-pairing; the next hello may report a lower clock.
    bool skip_clock_check = false;
  };

  struct Outgoing {
    std::string                      peer_id;
    std::string                      session_id;
    vaultsync::wire::v1::SealedBatch batch;
  };

  using OutgoingList = std::vector<Outgoing>;

  PeerState& Peer(const std::string& peer_id);
  bool       StartLocked(const std::string& peer_id, OutgoingList* out);

  void Seal(const std::string& peer_id, const session::Outbound& messages, OutgoingList* out);
  void Flush(OutgoingList out);
  void OnSendFailure(const Outgoing& outgoing, const std::exception& e);

  void HandleEnvelope(const vaultsync::wire::v1::SealedBatch& batch, OutgoingList* out);
  void DropReplayed(const vaultsync::wire::v1::SealedBatch& batch);
  void Dispatch(const std::string& sender_id, PeerState& peer, const vaultsync::wire::v1::SyncMessage& message, OutgoingList* out);
  void OnInboundError(const std::string& sender_id, const std::exception& e, OutgoingList* out);

  void AttachTrust(const std::string& recipient_id, vaultsync::wire::v1::Hello* hello) const;
  void ApplyTrust(const vaultsync::wire::v1::Hello& hello);

  void AfterProgress(const std::string& peer_id, PeerState& peer);
  void FailSession(const std::string& peer_id, PeerState& peer, const std::string& reason, util::RetryClass retry_class, bool request_full,
                   OutgoingList* out);
  void Tick(OutgoingList* out);

  std::uint64_t                     NextSequence();
  std::optional<model::VectorClock> LoadAcked(const std::string& peer_id) const;
  void                              SaveAcked(const std::string& peer_id, const model::VectorClock& acked);
  void                              CompactLocked();

  std::string                       vault_id_;
  std::string                       device_id_;
  std::shared_ptr<crypto::KeyStore> key_store_;
  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<transport::Transport> transport_;
  CoordinatorOptions                options_;
  util::ClockFn                     clock_;

  std::shared_ptr<crypto::DeviceIdentity>   identity_;
  std::shared_ptr<registry::DeviceRegistry> registry_;
  std::shared_ptr<changelog::ChangeLog>     log_;
  std::unique_ptr<transport::ReplayGuard>   replay_;
  session::EnvelopeCodec                    envelope_;

  mutable std::mutex               mutex_;
  std::map<std::string, PeerState> peers_;
  std::uint64_t                    next_sequence_  = 0;
  std::uint64_t                    reserved_until_ = 0;
};

} // namespace vaultsync::core
