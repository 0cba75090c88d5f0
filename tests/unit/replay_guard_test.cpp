#include "internal/transport/replay_guard.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using vaultsync::transport::ReplayGuard;

void TestInOrderAndReplay() {
  auto        repository = std::make_shared<vaultsync::db::memory::MemoryRepository>();
  ReplayGuard guard(repository);

  assert(!guard.IsFresh("peer", 0));
  assert(guard.Accept("peer", 1));
  assert(guard.Accept("peer", 2));
  assert(!guard.Accept("peer", 2));
  assert(!guard.IsFresh("peer", 1));

  // Windows are per sender.
  assert(guard.Accept("other", 1));
}

void TestReorderInsideWindow() {
  auto        repository = std::make_shared<vaultsync::db::memory::MemoryRepository>();
  ReplayGuard guard(repository, 4);

  assert(guard.Accept("peer", 10));
  assert(guard.IsFresh("peer", 7));
  assert(!guard.IsFresh("peer", 6));
  assert(guard.Accept("peer", 8));
  assert(!guard.Accept("peer", 8));
  assert(guard.Accept("peer", 7));

  assert(guard.Accept("peer", 20));
  assert(!guard.IsFresh("peer", 16));
  assert(guard.IsFresh("peer", 17));
}

void TestWatermarkSurvivesRestart() {
  auto repository = std::make_shared<vaultsync::db::memory::MemoryRepository>();
  {
    ReplayGuard guard(repository);
    assert(guard.Accept("peer", 5));
    assert(guard.Accept("peer", 3));
  }

  ReplayGuard restarted(repository);
  assert(!restarted.IsFresh("peer", 5));
  assert(!restarted.IsFresh("peer", 4));
  assert(restarted.Accept("peer", 6));

  auto tx     = repository->Begin();
  auto cursor = repository->GetPeerCursor(*tx, "peer");
  tx->Commit();
  assert(cursor.has_value());
  assert(cursor->inbound_watermark == 6);
}

} // namespace

int main() {
  TestInOrderAndReplay();
  TestReorderInsideWindow();
  TestWatermarkSurvivesRestart();

  std::cout << "vaultsync_unit_replay_guard: pass\n";
  return 0;
}
