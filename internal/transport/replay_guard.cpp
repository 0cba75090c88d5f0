#include "replay_guard.hpp"

namespace vaultsync::transport {

ReplayGuard::ReplayGuard(std::shared_ptr<db::Repository> repository, std::uint64_t window)
    : repository_(std::move(repository)), window_(window == 0 ? 1 : window) {
}

ReplayGuard::Window& ReplayGuard::WindowFor(const std::string& sender_id) {
  auto it = windows_.find(sender_id);
  if (it != windows_.end()) {
    return it->second;
  }

  Window window;
  auto   tx     = repository_->Begin();
  auto   cursor = repository_->GetPeerCursor(*tx, sender_id);
  tx->Commit();
  if (cursor) {
    window.highest  = cursor->inbound_watermark;
    window.restored = cursor->inbound_watermark;
  }
  return windows_.emplace(sender_id, std::move(window)).first->second;
}

bool ReplayGuard::FreshLocked(const Window& window, std::uint64_t sequence_no) const {
  if (sequence_no == 0) {
    return false;
  }
  if (sequence_no > window.highest) {
    return true;
  }
  if (sequence_no <= window.restored || window.highest - sequence_no >= window_) {
    return false;
  }
  return !window.accepted.contains(sequence_no);
}

bool ReplayGuard::IsFresh(const std::string& sender_id, std::uint64_t sequence_no) {
  std::lock_guard<std::mutex> lock(mutex_);
  return FreshLocked(WindowFor(sender_id), sequence_no);
}

bool ReplayGuard::Accept(const std::string& sender_id, std::uint64_t sequence_no) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto&                       window = WindowFor(sender_id);
  if (!FreshLocked(window, sequence_no)) {
    return false;
  }

  window.accepted.insert(sequence_no);
  if (sequence_no > window.highest) {
    window.highest = sequence_no;

    auto tx     = repository_->Begin();
    auto cursor = repository_->GetPeerCursor(*tx, sender_id).value_or(db::model::PeerCursorRow{sender_id, 0, {}});
    cursor.inbound_watermark = sequence_no;
    db::ThrowIfError(repository_->UpsertPeerCursor(*tx, cursor), "persist replay watermark for " + sender_id);
    tx->Commit();
  }
  while (!window.accepted.empty() && window.highest - *window.accepted.begin() >= window_) {
    window.accepted.erase(window.accepted.begin());
  }
  return true;
}

} // namespace vaultsync::transport
