#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/changelog/change_log.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/vector_clock.hpp"
#include "internal/session/backoff.hpp"
#include "internal/util/time.hpp"
#include "vaultsync/wire/v1/envelope.pb.h"

namespace vaultsync::session {

struct SessionOptions {
  std::chrono::milliseconds round_trip_timeout{10'000};
  BackoffPolicy             backoff;
  // 0 sends everything the peer lacks in one Records message.
  std::size_t max_batch_records = 5000;
};

using Outbound = std::vector<vaultsync::wire::v1::SyncMessage>;

/*
  One exchange with one peer.

  Idle -> Handshaking -> Exchanging -> Reconciled | Failed

  The session only decides what to send; the coordinator seals and
  transmits. Handlers are idempotent: a duplicate message re-sends the
  answer it already produced, and messages for another session id are
  ignored unless they start a new session.

  When both sides initiate at once the session with the lower id wins and
  the other side becomes the responder.
*/
class SyncSession {
 public:
  SyncSession(std::string peer_id, std::shared_ptr<changelog::ChangeLog> log, SessionOptions options, util::ClockFn clock = util::Now);

  // Idle or terminal -> Handshaking. request_full asks the peer to send
  // everything it holds.
  Outbound Start(const std::string& session_id, bool request_full);

  // request_full applies when the hello makes this side the responder.
  Outbound OnHello(const vaultsync::wire::v1::Hello& hello, bool request_full = false);

  // Throws whatever ChangeLog::Stage throws, util::InvalidState on a
  // malformed record and util::MissingCausalDependency on an incomplete batch.
  Outbound OnRecords(const vaultsync::wire::v1::Records& records);

  Outbound OnAck(const vaultsync::wire::v1::Ack& ack);

  // True if the abort applied to this session.
  bool OnAbort(const vaultsync::wire::v1::Abort& abort);

  // Drops the staged batch and returns the Abort to send, if any.
  Outbound Fail(const std::string& reason, bool request_full = false);
  Outbound Cancel();

  // Round-trip deadline passed without progress.
  bool Expired() const;

  // Re-sends the last messages; false once the retry budget is spent.
  bool Retry(Outbound* out);

  // Counts a failed transmission and pushes the deadline out by the backoff.
  // Returns false once the retry budget is spent.
  bool NoteSendFailure();

  model::SessionState state() const {
    return state_;
  }
  const std::string& session_id() const {
    return session_id_;
  }
  const std::string& peer_id() const {
    return peer_id_;
  }
  bool initiator() const {
    return initiator_;
  }
  bool active() const {
    return state_ == model::SessionState::kHandshaking || state_ == model::SessionState::kExchanging;
  }
  std::uint64_t peer_own_clock() const {
    return peer_own_clock_;
  }
  const model::VectorClock& peer_acked() const {
    return peer_acked_;
  }
  // Records the peer lacked but this session did not send.
  std::size_t remaining() const {
    return remaining_;
  }
  const std::string& last_error() const {
    return last_error_;
  }
  bool peer_requested_full() const {
    return peer_requested_full_;
  }
  std::uint32_t attempts() const {
    return attempts_;
  }
  std::chrono::milliseconds elapsed() const;

 private:
  void Transition(model::SessionState next);
  void Reset(const std::string& session_id, bool initiator);
  void Arm();

  vaultsync::wire::v1::SyncMessage MakeHello(bool reply) const;
  vaultsync::wire::v1::SyncMessage MakeRecords();
  vaultsync::wire::v1::SyncMessage MakeAbort(const std::string& reason, bool request_full) const;

  Outbound Respond(const vaultsync::wire::v1::Hello& hello, bool request_full);
  Outbound ApplyHelloReply(const vaultsync::wire::v1::Hello& hello);
  Outbound StageRecords(const vaultsync::wire::v1::Records& records);
  void     TryReconcile();

  std::string                           peer_id_;
  std::shared_ptr<changelog::ChangeLog> log_;
  SessionOptions                        options_;
  util::ClockFn                         clock_;

  model::SessionState state_ = model::SessionState::kIdle;
  std::string         session_id_;
  bool                initiator_    = false;
  bool                request_full_ = false;

  model::VectorClock peer_known_;
  model::VectorClock peer_acked_;
  std::uint64_t      peer_own_clock_      = 0;
  bool               peer_requested_full_ = false;
  bool               ack_received_        = false;
  std::size_t        remaining_           = 0;

  std::optional<changelog::StagedBatch>           staged_;
  std::optional<vaultsync::wire::v1::Records>     early_records_;
  std::optional<vaultsync::wire::v1::SyncMessage> sent_ack_;
  Outbound                                        last_sent_;

  util::TimePoint started_at_{};
  util::TimePoint deadline_{};
  std::uint32_t   attempts_ = 0;
  std::string     last_error_;
};

} // namespace vaultsync::session
