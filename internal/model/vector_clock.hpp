#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace vaultsync::model {

enum class CausalOrder {
  kBefore,
  kAfter,
  kEqual,
  kConcurrent,
};

/*
  Highest logical clock seen per device.

  Missing entries read as zero; zero entries are never stored so that two
  clocks describing the same knowledge compare equal structurally.
*/
class VectorClock {
 public:
  using Entries = std::map<std::string, std::uint64_t>;

  VectorClock() = default;
  explicit VectorClock(Entries entries);

  std::uint64_t Get(const std::string& device_id) const;
  void          Set(const std::string& device_id, std::uint64_t counter);

  // Raises the entry to counter if it is higher.
  void Observe(const std::string& device_id, std::uint64_t counter);

  // Pointwise maximum.
  void Merge(const VectorClock& other);

  // True if every entry of this is >= the matching entry of other.
  bool Dominates(const VectorClock& other) const;

  CausalOrder Compare(const VectorClock& other) const;

  const Entries& entries() const {
    return entries_;
  }
  bool empty() const {
    return entries_.empty();
  }

  bool operator==(const VectorClock&) const = default;

 private:
  Entries entries_;
};

} // namespace vaultsync::model
