#include "vector_clock.hpp"

#include <algorithm>

namespace vaultsync::model {

VectorClock::VectorClock(Entries entries) {
  for (auto& [device, counter] : entries) {
    if (counter > 0) {
      entries_.emplace(device, counter);
    }
  }
}

std::uint64_t VectorClock::Get(const std::string& device_id) const {
  auto it = entries_.find(device_id);
  return it == entries_.end() ? 0 : it->second;
}

void VectorClock::Set(const std::string& device_id, std::uint64_t counter) {
  if (counter == 0) {
    entries_.erase(device_id);
    return;
  }
  entries_[device_id] = counter;
}

void VectorClock::Observe(const std::string& device_id, std::uint64_t counter) {
  if (counter > Get(device_id)) {
    entries_[device_id] = counter;
  }
}

void VectorClock::Merge(const VectorClock& other) {
  for (const auto& [device, counter] : other.entries_) {
    Observe(device, counter);
  }
}

bool VectorClock::Dominates(const VectorClock& other) const {
  return std::all_of(other.entries_.begin(), other.entries_.end(),
                     [this](const auto& entry) { return Get(entry.first) >= entry.second; });
}

CausalOrder VectorClock::Compare(const VectorClock& other) const {
  const bool ge = Dominates(other);
  const bool le = other.Dominates(*this);
  if (ge && le) return CausalOrder::kEqual;
  if (ge) return CausalOrder::kAfter;
  if (le) return CausalOrder::kBefore;
  return CausalOrder::kConcurrent;
}

} // namespace vaultsync::model
