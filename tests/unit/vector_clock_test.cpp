#include "internal/model/vector_clock.hpp"

#include <cassert>
#include <iostream>

#include "internal/wire/codec.hpp"

namespace {

using vaultsync::model::CausalOrder;
using vaultsync::model::VectorClock;

void TestMissingEntriesReadAsZero() {
  VectorClock clock;
  assert(clock.Get("a") == 0);
  clock.Set("a", 0);
  assert(clock.empty());

  VectorClock with_zero({{"a", 0}, {"b", 2}});
  assert(with_zero == VectorClock({{"b", 2}}));
}

void TestObserveOnlyRaises() {
  VectorClock clock;
  clock.Observe("a", 3);
  clock.Observe("a", 1);
  assert(clock.Get("a") == 3);
}

void TestCompare() {
  VectorClock a({{"x", 1}, {"y", 2}});
  VectorClock b({{"x", 2}, {"y", 2}});
  VectorClock c({{"x", 0}, {"y", 3}});

  assert(a.Compare(b) == CausalOrder::kBefore);
  assert(b.Compare(a) == CausalOrder::kAfter);
  assert(a.Compare(a) == CausalOrder::kEqual);
  assert(b.Compare(c) == CausalOrder::kConcurrent);
  assert(VectorClock{}.Compare(a) == CausalOrder::kBefore);
}

void TestMergeIsPointwiseMax() {
  VectorClock a({{"x", 4}, {"y", 1}});
  VectorClock b({{"y", 6}, {"z", 2}});
  a.Merge(b);
  assert(a == VectorClock({{"x", 4}, {"y", 6}, {"z", 2}}));
  assert(a.Dominates(b));
}

void TestEncodingIsCanonical() {
  VectorClock a;
  a.Set("zeta", 1);
  a.Set("alpha", 9);
  VectorClock b;
  b.Set("alpha", 9);
  b.Set("zeta", 1);

  assert(vaultsync::wire::EncodeClock(a) == vaultsync::wire::EncodeClock(b));
  assert(vaultsync::wire::DecodeClock(vaultsync::wire::EncodeClock(a)) == a);
}

} // namespace

int main() {
  TestMissingEntriesReadAsZero();
  TestObserveOnlyRaises();
  TestCompare();
  TestMergeIsPointwiseMax();
  TestEncodingIsCanonical();

  std::cout << "vaultsync_unit_vector_clock: pass\n";
  return 0;
}
