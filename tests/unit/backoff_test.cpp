#include "internal/session/backoff.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono_literals;
using vaultsync::session::BackoffPolicy;

void TestDoublingWithCap() {
  BackoffPolicy policy;
  policy.base      = 100ms;
  policy.max_delay = 1000ms;

  assert(policy.Delay(0) == 0ms);
  assert(policy.Delay(1) == 100ms);
  assert(policy.Delay(2) == 200ms);
  assert(policy.Delay(4) == 800ms);
  assert(policy.Delay(5) == 1000ms);
  assert(policy.Delay(60) == 1000ms);
}

void TestAttemptBudget() {
  BackoffPolicy policy;
  policy.max_attempts = 3;
  assert(!policy.Exhausted(2));
  assert(policy.Exhausted(3));
  assert(policy.Exhausted(4));
}

} // namespace

int main() {
  TestDoublingWithCap();
  TestAttemptBudget();

  std::cout << "vaultsync_unit_backoff: pass\n";
  return 0;
}
