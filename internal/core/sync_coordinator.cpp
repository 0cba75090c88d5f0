#include "sync_coordinator.hpp"

#include <algorithm>
#include <string_view>

#include "internal/crypto/signatures.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"
#include "internal/wire/codec.hpp"

namespace vaultsync::core {

namespace wire_v1 = vaultsync::wire::v1;

using model::SessionState;
using observability::IntField;
using observability::StringField;
using observability::UIntField;

namespace {

constexpr std::uint64_t kSequenceBlock = 64;
// Envelope sequences a device with no reservation yet starts from, per
// millisecond of wall clock.
constexpr std::uint64_t kSequencesPerMilli = 1024;

// Pointwise minimum: what both clocks acknowledge.
model::VectorClock Intersect(const model::VectorClock& a, const model::VectorClock& b) {
  model::VectorClock out;
  for (const auto& [device_id, counter] : a.entries()) {
    out.Set(device_id, std::min(counter, b.Get(device_id)));
  }
  return out;
}

std::string_view MessageKind(const wire_v1::SyncMessage& message) {
  switch (message.body_case()) {
    case wire_v1::SyncMessage::kHello:
      return "hello";
    case wire_v1::SyncMessage::kRecords:
      return "records";
    case wire_v1::SyncMessage::kAck:
      return "ack";
    case wire_v1::SyncMessage::kAbort:
      return "abort";
    case wire_v1::SyncMessage::BODY_NOT_SET:
      break;
  }
  return "empty";
}

template <typename Message>
std::optional<Message> ParseProof(const std::string& bytes) {
  if (bytes.empty()) {
    return std::nullopt;
  }
  Message message;
  if (!message.ParseFromString(bytes)) {
    return std::nullopt;
  }
  return message;
}

} // namespace

SyncCoordinator::SyncCoordinator(std::string vault_id, crypto::DeviceIdentity identity, std::shared_ptr<crypto::KeyStore> key_store,
                                 std::shared_ptr<db::Repository> repository, std::shared_ptr<transport::Transport> transport,
                                 CoordinatorOptions options, util::ClockFn clock)
    : vault_id_(std::move(vault_id)),
      device_id_(identity.device_id()),
      key_store_(std::move(key_store)),
      repository_(std::move(repository)),
      transport_(std::move(transport)),
      options_(options),
      clock_(std::move(clock)),
      identity_(std::make_shared<crypto::DeviceIdentity>(std::move(identity))),
      registry_(std::make_shared<registry::DeviceRegistry>(repository_, vault_id_, device_id_)),
      log_(std::make_shared<changelog::ChangeLog>(repository_, registry_, device_id_, options_.log, clock_)),
      replay_(std::make_unique<transport::ReplayGuard>(repository_)),
      envelope_(identity_, crypto::Sealer(options_.padding_block)) {
  registry_->RegisterSelf(identity_->MakeToken(vault_id_, util::ToUnixMillis(clock_())));

  auto tx    = repository_->Begin();
  auto state = repository_->LoadLocalState(*tx).value_or(model::LocalState{});
  if (state.device_id != device_id_ || state.key_epoch != identity_->key_epoch()) {
    state.device_id = device_id_;
    state.key_epoch = identity_->key_epoch();
    db::ThrowIfError(repository_->SaveLocalState(*tx, state), "save local state");
  }
  tx->Commit();

  VAULTSYNC_LOG_INFO("sync engine ready", {StringField("device_id", device_id_), StringField("vault_id", vault_id_),
                                           IntField("local_clock", static_cast<int64_t>(log_->LocalClock()))});
}

vaultsync::core::v1::DeviceToken SyncCoordinator::DeviceToken() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return identity_->MakeToken(vault_id_, util::ToUnixMillis(clock_()));
}

SyncCoordinator::PeerState& SyncCoordinator::Peer(const std::string& peer_id) {
  auto& peer = peers_[peer_id];
  if (!peer.session) {
    peer.session = std::make_unique<session::SyncSession>(peer_id, log_, options_.session, clock_);
  }
  return peer;
}

// ------------------------------------------------------------------
// Trust management
// ------------------------------------------------------------------

model::DeviceEntry SyncCoordinator::Pair(const vaultsync::core::v1::DeviceToken& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  previous = registry_->Get(token.device_id());
  auto                        entry    = registry_->Pair(token);

  auto& peer    = peers_[entry.device_id];
  peer.failures = 0;
  peer.retry_at.reset();
  peer.last_error.clear();
  if (previous && previous->quarantined) {
    peer.skip_clock_check = true;
    peer.request_full     = true;
  }
  return entry;
}

void SyncCoordinator::Revoke(const std::string& device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!registry_->Get(device_id)) {
    throw util::NotFound("device not found: " + device_id);
  }

  vaultsync::core::v1::RevocationAssertion revocation;
  revocation.set_revoked_device_id(device_id);
  revocation.set_cutoff_clock(log_->Known().Get(device_id));
  revocation.set_issuer(device_id_);
  revocation.set_issued_at_ms(util::ToUnixMillis(clock_()));
  crypto::SignMessage(&revocation, identity_->signing().private_key);
  registry_->ApplyRevocation(revocation);

  if (auto it = peers_.find(device_id); it != peers_.end()) {
    if (it->second.session) {
      it->second.session->Fail("device revoked");
    }
    peers_.erase(it);
  }
}

vaultsync::core::v1::KeyRotation SyncCoordinator::RotateEncryptionKey() {
  std::lock_guard<std::mutex> lock(mutex_);

  // Rotate a copy so a failed save leaves the live identity untouched.
  auto next     = *identity_;
  auto rotation = next.RotateEncryptionKey();
  key_store_->Save(next.ToKeyMaterial());
  *identity_ = std::move(next);

  registry_->RegisterSelf(identity_->MakeToken(vault_id_, util::ToUnixMillis(clock_())));

  auto tx         = repository_->Begin();
  auto state      = repository_->LoadLocalState(*tx).value_or(model::LocalState{});
  state.device_id = device_id_;
  state.key_epoch = identity_->key_epoch();
  db::ThrowIfError(repository_->SaveLocalState(*tx, state), "save local state");
  tx->Commit();

  for (auto& [_, peer] : peers_) {
    peer.holds_current_key = false;
  }
  VAULTSYNC_LOG_INFO("encryption key rotated", {IntField("key_epoch", static_cast<int64_t>(identity_->key_epoch()))});
  return rotation;
}

void SyncCoordinator::AttachTrust(const std::string& recipient_id, wire_v1::Hello* hello) const {
  for (const auto& entry : registry_->List()) {
    if (entry.device_id == device_id_) {
      continue;
    }
    if (entry.trust == model::TrustState::kTrusted && !entry.quarantined && entry.device_id != recipient_id) {
      if (auto token = ParseProof<vaultsync::core::v1::DeviceToken>(entry.token)) {
        auto* assertion = hello->add_devices();
        *assertion->mutable_subject() = *token;
        assertion->set_introducer(device_id_);
        crypto::SignMessage(assertion, identity_->signing().private_key);
      }
    }
    if (auto revocation = ParseProof<vaultsync::core::v1::RevocationAssertion>(entry.revocation)) {
      *hello->add_revocations() = *revocation;
    }
    if (auto rotation = ParseProof<vaultsync::core::v1::KeyRotation>(entry.rotation)) {
      *hello->add_rotations() = *rotation;
    }
  }

  if (identity_->key_epoch() > 1) {
    auto* rotation = hello->add_rotations();
    rotation->set_device_id(device_id_);
    rotation->set_encryption_public(identity_->encryption().public_key);
    rotation->set_key_epoch(identity_->key_epoch());
    crypto::SignMessage(rotation, identity_->signing().private_key);
  }
}

void SyncCoordinator::ApplyTrust(const wire_v1::Hello& hello) {
  for (const auto& rotation : hello.rotations()) {
    try {
      registry_->ApplyKeyRotation(rotation);
    } catch (const std::exception& e) {
      VAULTSYNC_LOG_WARN("key rotation ignored", {StringField("device_id", rotation.device_id()), StringField("error", e.what())});
    }
  }
  for (const auto& assertion : hello.devices()) {
    try {
      registry_->ApplyDeviceAssertion(assertion);
    } catch (const std::exception& e) {
      VAULTSYNC_LOG_WARN("device assertion ignored", {StringField("device_id", assertion.subject().device_id()), StringField("error", e.what())});
    }
  }
  for (const auto& revocation : hello.revocations()) {
    try {
      if (registry_->ApplyRevocationAssertion(revocation)) {
        if (auto it = peers_.find(revocation.revoked_device_id()); it != peers_.end()) {
          if (it->second.session) {
            it->second.session->Fail("device revoked");
          }
          peers_.erase(it);
        }
      }
    } catch (const std::exception& e) {
      VAULTSYNC_LOG_WARN("revocation ignored", {StringField("device_id", revocation.revoked_device_id()), StringField("error", e.what())});
    }
  }
}

// ------------------------------------------------------------------
// Local data
// ------------------------------------------------------------------

model::ChangeRecord SyncCoordinator::Append(const std::string& entity_id, const std::string& field_path, model::FieldValue value) {
  return log_->Append(entity_id, field_path, std::move(value));
}

model::ChangeRecord SyncCoordinator::Delete(const std::string& entity_id) {
  return log_->Delete(entity_id);
}

model::EntitySnapshot SyncCoordinator::Snapshot(const std::string& entity_id) const {
  return log_->Snapshot(entity_id);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

std::size_t SyncCoordinator::TriggerSync() {
  observability::SpanScope span(observability::kSpanTriggerSync);
  OutgoingList             out;
  std::size_t              started = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& peer : registry_->TrustedPeers()) {
      if (StartLocked(peer.device_id, &out)) ++started;
    }
  }
  span.SetAttribute(observability::attr::kSessionsStarted, static_cast<std::int64_t>(started));
  Flush(std::move(out));
  return started;
}

bool SyncCoordinator::TriggerSync(const std::string& peer_id) {
  observability::SpanScope span(observability::kSpanTriggerSync);
  span.SetAttribute(observability::attr::kPeerId, peer_id);
  OutgoingList out;
  bool         started = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_->RequireSender(peer_id);
    started = StartLocked(peer_id, &out);
  }
  Flush(std::move(out));
  return started;
}

bool SyncCoordinator::StartLocked(const std::string& peer_id, OutgoingList* out) {
  auto& peer = Peer(peer_id);
  if (peer.session->active()) {
    return false;
  }

  const bool request_full = peer.request_full;
  peer.request_full       = false;
  peer.follow_up          = false;
  peer.retry_at.reset();

  auto messages = peer.session->Start(util::GenerateUUIDString(), request_full);
  VAULTSYNC_LOG_DEBUG("session started", {StringField("peer_id", peer_id), StringField("session_id", peer.session->session_id())});
  Seal(peer_id, messages, out);
  return true;
}

bool SyncCoordinator::Cancel(const std::string& peer_id) {
  OutgoingList out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = peers_.find(peer_id);
    if (it == peers_.end() || !it->second.session) {
      return false;
    }
    auto messages = it->second.session->Cancel();
    if (messages.empty()) {
      return false;
    }
    it->second.retry_at.reset();
    it->second.last_error = "cancelled";
    observability::Metrics::Instance().RecordSession("cancelled");
    VAULTSYNC_LOG_INFO("session cancelled", {StringField("peer_id", peer_id)});
    Seal(peer_id, messages, &out);
  }
  Flush(std::move(out));
  return true;
}

std::size_t SyncCoordinator::Pump() {
  std::size_t received = 0;
  while (auto batch = transport_->Receive()) {
    OutgoingList out;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      HandleEnvelope(*batch, &out);
    }
    Flush(std::move(out));
    ++received;
  }

  OutgoingList out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Tick(&out);
  }
  Flush(std::move(out));
  return received;
}

void SyncCoordinator::Tick(OutgoingList* out) {
  const auto now = clock_();
  for (auto& [peer_id, peer] : peers_) {
    if (!peer.session) continue;

    if (peer.session->Expired()) {
      session::Outbound resend;
      if (peer.session->Retry(&resend)) {
        VAULTSYNC_LOG_DEBUG("round trip timed out, resending", {StringField("peer_id", peer_id), IntField("attempt", peer.session->attempts())});
        Seal(peer_id, resend, out);
      } else {
        FailSession(peer_id, peer, "round trip timeout", util::RetryClass::kRetryable, false, out);
      }
      continue;
    }
    if (peer.session->active()) continue;

    const bool retry_due = peer.retry_at && now >= *peer.retry_at;
    if (!retry_due && !peer.follow_up) continue;

    auto entry = registry_->Get(peer_id);
    if (!entry || entry->trust != model::TrustState::kTrusted || entry->quarantined) {
      peer.retry_at.reset();
      peer.follow_up = false;
      continue;
    }
    StartLocked(peer_id, out);
  }
}

// ------------------------------------------------------------------
// Outbound
// ------------------------------------------------------------------

std::uint64_t SyncCoordinator::NextSequence() {
  if (next_sequence_ >= reserved_until_) {
    auto tx    = repository_->Begin();
    auto state = repository_->LoadLocalState(*tx).value_or(model::LocalState{});
    auto base  = std::max(state.next_sequence, next_sequence_);
    // A new install, or one that lost its data, starts above anything an
    // earlier install of the same identity could have sent.
    if (base <= 1) {
      const auto now_ms = util::ToUnixMillis(clock_());
      base              = std::max<std::uint64_t>(1, static_cast<std::uint64_t>(std::max<std::int64_t>(now_ms, 0)) * kSequencesPerMilli);
    }

    state.device_id     = device_id_;
    state.next_sequence = base + kSequenceBlock;
    db::ThrowIfError(repository_->SaveLocalState(*tx, state), "reserve envelope sequence numbers");
    tx->Commit();

    next_sequence_  = base;
    reserved_until_ = base + kSequenceBlock;
  }
  return next_sequence_++;
}

void SyncCoordinator::Seal(const std::string& peer_id, const session::Outbound& messages, OutgoingList* out) {
  if (messages.empty()) {
    return;
  }
  auto entry = registry_->Get(peer_id);
  if (!entry || entry->trust != model::TrustState::kTrusted) {
    return;
  }

  const auto& peer         = peers_[peer_id];
  const bool  use_previous = peer.holds_current_key ? !*peer.holds_current_key : identity_->previous_encryption().has_value();

  const std::string session_id = peer.session ? peer.session->session_id() : std::string();

  for (const auto& message : messages) {
    if (message.has_hello()) {
      auto decorated = message;
      AttachTrust(peer_id, decorated.mutable_hello());
      out->push_back({peer_id, session_id, envelope_.Seal(decorated, *entry, NextSequence(), use_previous)});
    } else {
      out->push_back({peer_id, session_id, envelope_.Seal(message, *entry, NextSequence(), use_previous)});
    }
  }
}

void SyncCoordinator::Flush(OutgoingList out) {
  for (const auto& outgoing : out) {
    try {
      transport_->Send(outgoing.peer_id, outgoing.batch);
      observability::Metrics::Instance().RecordBatch("sent", outgoing.batch.ByteSizeLong());
    } catch (const std::exception& e) {
      OnSendFailure(outgoing, e);
    }
  }
}

void SyncCoordinator::OnSendFailure(const Outgoing& outgoing, const std::exception& e) {
  const auto retry_class = util::Classify(e);
  VAULTSYNC_LOG_WARN("send failed", {StringField("peer_id", outgoing.peer_id), StringField("error", e.what()),
                                     StringField("retry_class", util::RetryClassName(retry_class))});

  OutgoingList                ignored;
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = peers_.find(outgoing.peer_id);
  if (it == peers_.end() || !it->second.session || it->second.session->session_id() != outgoing.session_id) {
    return;
  }
  auto& peer = it->second;
  if (!peer.session->active()) {
    return;
  }
  if (retry_class != util::RetryClass::kRetryable || !peer.session->NoteSendFailure()) {
    FailSession(outgoing.peer_id, peer, e.what(), retry_class, false, &ignored);
  }
}

// ------------------------------------------------------------------
// Inbound
// ------------------------------------------------------------------

void SyncCoordinator::HandleEnvelope(const wire_v1::SealedBatch& batch, OutgoingList* out) {
  observability::SpanScope span(observability::kSpanReceiveEnvelope);
  span.SetAttribute(observability::attr::kSenderId, batch.sender_id());
  span.SetAttribute(observability::attr::kSequenceNo, static_cast<std::int64_t>(batch.sequence_no()));

  if (batch.recipient_id() != device_id_) {
    VAULTSYNC_LOG_WARN("misaddressed batch dropped", {StringField("sender_id", batch.sender_id()), StringField("recipient_id", batch.recipient_id())});
    observability::Metrics::Instance().RecordBatch("rejected", batch.ByteSizeLong());
    return;
  }

  try {
    const auto sender = registry_->RequireSender(batch.sender_id());
    // A sequence already seen is dropped before any signature or decryption
    // work; Accept repeats the check once the batch has opened.
    if (!replay_->IsFresh(batch.sender_id(), batch.sequence_no())) {
      span.AddEvent("replayed");
      DropReplayed(batch);
      return;
    }
    auto opened = envelope_.Open(batch, sender);
    if (!replay_->Accept(batch.sender_id(), batch.sequence_no())) {
      span.AddEvent("replayed");
      DropReplayed(batch);
      return;
    }
    span.SetAttribute(observability::attr::kMessage, MessageKind(opened.message));
    observability::Metrics::Instance().RecordBatch("received", batch.ByteSizeLong());

    auto& peer             = Peer(batch.sender_id());
    peer.holds_current_key = opened.opened_with_current_key;
    Dispatch(batch.sender_id(), peer, opened.message, out);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    OnInboundError(batch.sender_id(), e, out);
  }
}

void SyncCoordinator::DropReplayed(const wire_v1::SealedBatch& batch) {
  VAULTSYNC_LOG_DEBUG("replayed batch dropped",
                      {StringField("sender_id", batch.sender_id()), UIntField("sequence_no", batch.sequence_no())});
  observability::Metrics::Instance().RecordBatch("rejected", batch.ByteSizeLong());
}

void SyncCoordinator::Dispatch(const std::string& sender_id, PeerState& peer, const wire_v1::SyncMessage& message, OutgoingList* out) {
  switch (message.body_case()) {
    case wire_v1::SyncMessage::kHello: {
      const auto& hello = message.hello();
      if (!peer.skip_clock_check) {
        log_->CheckReportedClock(sender_id, hello.own_clock());
      }
      ApplyTrust(hello);
      // A revocation in the hello may have been about the sender itself.
      registry_->RequireSender(sender_id);

      auto& current  = Peer(sender_id);
      auto  messages = current.session->OnHello(hello, current.request_full);
      if (!current.session->initiator() && current.session->session_id() == hello.session_id()) {
        current.request_full = false;
      }
      Seal(sender_id, messages, out);
      break;
    }
    case wire_v1::SyncMessage::kRecords:
      Seal(sender_id, peer.session->OnRecords(message.records()), out);
      AfterProgress(sender_id, peer);
      break;
    case wire_v1::SyncMessage::kAck:
      Seal(sender_id, peer.session->OnAck(message.ack()), out);
      AfterProgress(sender_id, peer);
      break;
    case wire_v1::SyncMessage::kAbort:
      if (peer.session->OnAbort(message.abort())) {
        peer.last_error = peer.session->last_error();
        observability::Metrics::Instance().RecordSession("failed");
        VAULTSYNC_LOG_WARN("session aborted by peer", {StringField("peer_id", sender_id), StringField("reason", message.abort().reason())});
        if (peer.session->initiator()) {
          ++peer.failures;
          if (!options_.session.backoff.Exhausted(peer.failures)) {
            peer.retry_at = clock_() + options_.session.backoff.Delay(peer.failures);
          }
        }
      }
      break;
    case wire_v1::SyncMessage::BODY_NOT_SET:
      throw util::InvalidState("empty sync message from " + sender_id);
  }
}

void SyncCoordinator::AfterProgress(const std::string& peer_id, PeerState& peer) {
  if (peer.session->state() != SessionState::kReconciled || peer.reconciled_session == peer.session->session_id()) {
    return;
  }
  peer.reconciled_session = peer.session->session_id();
  peer.failures           = 0;
  peer.retry_at.reset();
  peer.last_error.clear();
  peer.skip_clock_check = false;
  peer.follow_up        = peer.session->remaining() > 0;
  peer.acked            = peer.session->peer_acked();

  registry_->RecordSync(peer_id, util::ToUnixMillis(clock_()), peer.session->peer_own_clock());
  SaveAcked(peer_id, *peer.acked);

  const auto elapsed = peer.session->elapsed();
  observability::Metrics::Instance().RecordSession("reconciled");
  observability::Metrics::Instance().ObserveRoundTripMs(static_cast<double>(elapsed.count()));
  VAULTSYNC_LOG_INFO("session reconciled", {StringField("peer_id", peer_id), StringField("session_id", peer.session->session_id()),
                                            IntField("elapsed_ms", elapsed.count()),
                                            IntField("remaining", static_cast<int64_t>(peer.session->remaining()))});

  if (options_.compaction_enabled) {
    CompactLocked();
  }
}

void SyncCoordinator::OnInboundError(const std::string& sender_id, const std::exception& e, OutgoingList* out) {
  const auto retry_class = util::Classify(e);
  observability::Metrics::Instance().RecordBatch("rejected", 0);

  if (dynamic_cast<const util::UnknownOrRevokedSender*>(&e)) {
    VAULTSYNC_LOG_WARN("batch from untrusted sender dropped", {StringField("sender_id", sender_id), StringField("error", e.what())});
    if (auto it = peers_.find(sender_id); it != peers_.end() && it->second.session) {
      FailSession(sender_id, it->second, e.what(), retry_class, false, out);
    }
    return;
  }

  auto it = peers_.find(sender_id);
  if (it == peers_.end() || !it->second.session) {
    VAULTSYNC_LOG_WARN("inbound batch failed", {StringField("sender_id", sender_id), StringField("error", e.what())});
    return;
  }
  auto& peer = it->second;

  if (dynamic_cast<const util::ClockRegression*>(&e)) {
    registry_->Quarantine(sender_id, e.what());
    FailSession(sender_id, peer, e.what(), retry_class, false, out);
    return;
  }
  if (dynamic_cast<const util::MissingCausalDependency*>(&e)) {
    peer.request_full = true;
    FailSession(sender_id, peer, e.what(), retry_class, true, out);
    return;
  }
  FailSession(sender_id, peer, e.what(), retry_class, false, out);
}

void SyncCoordinator::FailSession(const std::string& peer_id, PeerState& peer, const std::string& reason, util::RetryClass retry_class,
                                  bool request_full, OutgoingList* out) {
  const bool was_active = peer.session->active();
  const bool initiator  = peer.session->initiator();
  auto       messages   = peer.session->Fail(reason, request_full);
  peer.last_error       = reason;
  if (!was_active) {
    return;
  }

  observability::Metrics::Instance().RecordSession("failed");
  VAULTSYNC_LOG_WARN("session failed", {StringField("peer_id", peer_id), StringField("reason", reason),
                                        StringField("retry_class", util::RetryClassName(retry_class))});
  Seal(peer_id, messages, out);

  if (retry_class == util::RetryClass::kRetryable && initiator) {
    ++peer.failures;
    if (options_.session.backoff.Exhausted(peer.failures)) {
      VAULTSYNC_LOG_ERROR("sync retry budget exhausted", {StringField("peer_id", peer_id), IntField("failures", peer.failures)});
      peer.retry_at.reset();
    } else {
      peer.retry_at = clock_() + options_.session.backoff.Delay(peer.failures);
    }
  }
}

// ------------------------------------------------------------------
// Acknowledgements and compaction
// ------------------------------------------------------------------

std::optional<model::VectorClock> SyncCoordinator::LoadAcked(const std::string& peer_id) const {
  auto tx     = repository_->Begin();
  auto cursor = repository_->GetPeerCursor(*tx, peer_id);
  tx->Commit();
  if (!cursor || cursor->acked_clock.empty()) {
    return std::nullopt;
  }
  return wire::DecodeClock(cursor->acked_clock);
}

void SyncCoordinator::SaveAcked(const std::string& peer_id, const model::VectorClock& acked) {
  auto tx            = repository_->Begin();
  auto cursor        = repository_->GetPeerCursor(*tx, peer_id).value_or(db::model::PeerCursorRow{peer_id, 0, {}});
  cursor.acked_clock = wire::EncodeClock(acked);
  db::ThrowIfError(repository_->UpsertPeerCursor(*tx, cursor), "save acked clock for " + peer_id);
  tx->Commit();
}

void SyncCoordinator::CompactLocked() {
  const auto peers = registry_->TrustedPeers();
  if (peers.empty()) {
    return;
  }

  std::optional<model::VectorClock> common;
  for (const auto& entry : peers) {
    auto& peer = peers_[entry.device_id];
    if (!peer.acked) {
      peer.acked = LoadAcked(entry.device_id);
    }
    if (!peer.acked) {
      return;
    }
    common = common ? Intersect(*common, *peer.acked) : *peer.acked;
  }
  log_->Compact(*common);
}

// ------------------------------------------------------------------
// Status
// ------------------------------------------------------------------

SyncStatus SyncCoordinator::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);

  SyncStatus status;
  status.device_id       = device_id_;
  status.local_clock     = log_->LocalClock();
  status.record_count    = log_->RecordCount();
  status.pending_inbound = log_->PendingCount();

  for (const auto& entry : registry_->List()) {
    if (entry.device_id == device_id_) continue;

    PeerSyncStatus peer_status;
    peer_status.device_id      = entry.device_id;
    peer_status.trust          = entry.trust;
    peer_status.quarantined    = entry.quarantined;
    peer_status.last_synced_ms = entry.last_synced_ms;

    std::optional<model::VectorClock> acked;
    if (auto it = peers_.find(entry.device_id); it != peers_.end()) {
      if (it->second.session) {
        peer_status.session_state = it->second.session->state();
      }
      peer_status.last_error = it->second.last_error;
      acked                  = it->second.acked;
    }
    if (!acked) {
      acked = LoadAcked(entry.device_id);
    }
    peer_status.pending_records = log_->CountSince(acked.value_or(model::VectorClock{}));
    status.peers.push_back(std::move(peer_status));
  }
  return status;
}

} // namespace vaultsync::core
