#include "sync_session.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/wire/codec.hpp"

namespace vaultsync::session {

namespace v1 = vaultsync::wire::v1;

using model::SessionState;
using observability::IntField;
using observability::StringField;

SyncSession::SyncSession(std::string peer_id, std::shared_ptr<changelog::ChangeLog> log, SessionOptions options, util::ClockFn clock)
    : peer_id_(std::move(peer_id)), log_(std::move(log)), options_(options), clock_(std::move(clock)) {
}

void SyncSession::Transition(SessionState next) {
  if (!model::CanTransition(state_, next)) {
    throw util::InvalidState(std::string("session transition ") + model::SessionStateName(state_) + " -> " + model::SessionStateName(next));
  }
  state_ = next;
}

void SyncSession::Reset(const std::string& session_id, bool initiator) {
  if (state_ != SessionState::kIdle) {
    Transition(SessionState::kIdle);
  }
  session_id_          = session_id;
  initiator_           = initiator;
  request_full_        = false;
  peer_known_          = {};
  peer_acked_          = {};
  peer_own_clock_      = 0;
  peer_requested_full_ = false;
  ack_received_        = false;
  remaining_           = 0;
  staged_.reset();
  early_records_.reset();
  sent_ack_.reset();
  last_sent_.clear();
  attempts_   = 0;
  last_error_.clear();
  started_at_ = clock_();
}

void SyncSession::Arm() {
  attempts_ = 0;
  deadline_ = clock_() + options_.round_trip_timeout;
}

std::chrono::milliseconds SyncSession::elapsed() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_at_);
}

// ------------------------------------------------------------------
// Message construction
// ------------------------------------------------------------------

v1::SyncMessage SyncSession::MakeHello(bool reply) const {
  v1::SyncMessage message;
  auto*           hello = message.mutable_hello();
  hello->set_session_id(session_id_);
  hello->set_own_clock(log_->LocalClock());
  hello->set_full_resync(request_full_);
  hello->set_reply(reply);
  if (!request_full_) {
    wire::ToProto(log_->Known(), hello->mutable_known());
  }
  return message;
}

v1::SyncMessage SyncSession::MakeRecords() {
  const auto records = log_->RecordsSince(peer_known_, options_.max_batch_records);
  const auto total   = log_->CountSince(peer_known_);
  remaining_         = total > records.size() ? total - records.size() : 0;

  v1::SyncMessage message;
  auto*           body = message.mutable_records();
  body->set_session_id(session_id_);
  for (const auto& record : records) {
    wire::ToProto(record, body->add_records());
  }
  return message;
}

v1::SyncMessage SyncSession::MakeAbort(const std::string& reason, bool request_full) const {
  v1::SyncMessage message;
  auto*           abort = message.mutable_abort();
  abort->set_session_id(session_id_);
  abort->set_reason(reason);
  abort->set_full_resync(request_full);
  return message;
}

// ------------------------------------------------------------------
// Handshake
// ------------------------------------------------------------------

Outbound SyncSession::Start(const std::string& session_id, bool request_full) {
  Reset(session_id, true);
  request_full_ = request_full;
  Transition(SessionState::kHandshaking);

  last_sent_ = {MakeHello(false)};
  Arm();
  return last_sent_;
}

Outbound SyncSession::OnHello(const v1::Hello& hello, bool request_full) {
  if (!hello.reply()) {
    if (hello.session_id() == session_id_ && !initiator_) {
      // The initiator did not see our reply yet.
      return active() || state_ == SessionState::kReconciled ? last_sent_ : Outbound{};
    }
    if (state_ == SessionState::kHandshaking && initiator_ && hello.session_id() > session_id_) {
      // Simultaneous start; ours has the lower id and wins.
      return {};
    }
    return Respond(hello, request_full);
  }

  if (hello.session_id() != session_id_ || !initiator_ || state_ != SessionState::kHandshaking) {
    return {};
  }
  return ApplyHelloReply(hello);
}

Outbound SyncSession::Respond(const v1::Hello& hello, bool request_full) {
  if (active()) {
    VAULTSYNC_LOG_DEBUG("session superseded by peer", {StringField("peer_id", peer_id_), StringField("old_session_id", session_id_),
                                                       StringField("session_id", hello.session_id())});
  }
  Reset(hello.session_id(), false);
  request_full_ = request_full;
  Transition(SessionState::kHandshaking);

  peer_requested_full_ = hello.full_resync();
  peer_known_          = hello.full_resync() ? model::VectorClock{} : wire::FromProto(hello.known());
  peer_own_clock_      = hello.own_clock();

  auto reply = MakeHello(true);
  Transition(SessionState::kExchanging);
  last_sent_ = {std::move(reply), MakeRecords()};
  Arm();
  return last_sent_;
}

Outbound SyncSession::ApplyHelloReply(const v1::Hello& hello) {
  peer_requested_full_ = hello.full_resync();
  peer_known_          = hello.full_resync() ? model::VectorClock{} : wire::FromProto(hello.known());
  peer_own_clock_      = hello.own_clock();

  Transition(SessionState::kExchanging);
  last_sent_ = {MakeRecords()};
  Arm();

  Outbound out = last_sent_;
  if (early_records_) {
    auto early = std::move(*early_records_);
    early_records_.reset();
    for (auto& message : StageRecords(early)) {
      out.push_back(std::move(message));
    }
  }
  return out;
}

// ------------------------------------------------------------------
// Exchange
// ------------------------------------------------------------------

Outbound SyncSession::OnRecords(const v1::Records& records) {
  if (records.session_id() != session_id_) {
    return {};
  }

  switch (state_) {
    case SessionState::kHandshaking:
      // Relay reordering: the peer's records overtook its hello reply.
      if (initiator_) {
        early_records_ = records;
      }
      return {};
    case SessionState::kExchanging:
      if (sent_ack_) {
        return {*sent_ack_};
      }
      return StageRecords(records);
    case SessionState::kReconciled:
      return sent_ack_ ? Outbound{*sent_ack_} : Outbound{};
    default:
      return {};
  }
}

Outbound SyncSession::StageRecords(const v1::Records& records) {
  std::vector<model::ChangeRecord> incoming;
  incoming.reserve(static_cast<std::size_t>(records.records_size()));
  for (const auto& record : records.records()) {
    incoming.push_back(wire::FromProto(record));
  }

  auto staged = log_->Stage(peer_id_, std::move(incoming));
  if (!staged.complete()) {
    throw util::MissingCausalDependency("batch from " + peer_id_ + " has " + std::to_string(staged.unresolved()) +
                                        " records with missing dependencies");
  }

  v1::SyncMessage ack;
  ack.mutable_ack()->set_session_id(session_id_);
  wire::ToProto(staged.known_after(), ack.mutable_ack()->mutable_known());
  sent_ack_ = ack;

  VAULTSYNC_LOG_DEBUG("batch staged", {StringField("peer_id", peer_id_), StringField("session_id", session_id_),
                                       IntField("applicable", static_cast<int64_t>(staged.applicable())),
                                       IntField("duplicates", static_cast<int64_t>(staged.duplicates()))});
  staged_ = std::move(staged);
  Arm();
  TryReconcile();
  return {std::move(ack)};
}

Outbound SyncSession::OnAck(const v1::Ack& ack) {
  if (ack.session_id() != session_id_ || state_ != SessionState::kExchanging) {
    return {};
  }
  peer_acked_   = wire::FromProto(ack.known());
  ack_received_ = true;
  TryReconcile();
  return {};
}

void SyncSession::TryReconcile() {
  if (state_ != SessionState::kExchanging || !staged_ || !ack_received_) {
    return;
  }
  log_->Commit(*staged_);
  staged_.reset();
  Transition(SessionState::kReconciled);
}

// ------------------------------------------------------------------
// Termination
// ------------------------------------------------------------------

bool SyncSession::OnAbort(const v1::Abort& abort) {
  if (abort.session_id() != session_id_ || !active()) {
    return false;
  }
  staged_.reset();
  peer_requested_full_ = abort.full_resync();
  last_error_          = "aborted by peer: " + abort.reason();
  Transition(SessionState::kFailed);
  return true;
}

Outbound SyncSession::Fail(const std::string& reason, bool request_full) {
  if (!active()) {
    if (state_ == SessionState::kIdle) {
      last_error_ = reason;
    }
    return {};
  }
  staged_.reset();
  last_error_ = reason;
  Transition(SessionState::kFailed);
  return {MakeAbort(reason, request_full)};
}

Outbound SyncSession::Cancel() {
  if (!active()) {
    return {};
  }
  staged_.reset();
  auto abort  = MakeAbort("cancelled", false);
  last_error_ = "cancelled";
  Transition(SessionState::kIdle);
  return {std::move(abort)};
}

bool SyncSession::Expired() const {
  return active() && clock_() >= deadline_;
}

bool SyncSession::Retry(Outbound* out) {
  ++attempts_;
  if (options_.backoff.Exhausted(attempts_)) {
    return false;
  }
  *out = last_sent_;
  if (sent_ack_) {
    out->push_back(*sent_ack_);
  }
  deadline_ = clock_() + options_.round_trip_timeout + options_.backoff.Delay(attempts_);
  return true;
}

bool SyncSession::NoteSendFailure() {
  ++attempts_;
  if (options_.backoff.Exhausted(attempts_)) {
    return false;
  }
  deadline_ = clock_() + options_.backoff.Delay(attempts_);
  return true;
}

} // namespace vaultsync::session
