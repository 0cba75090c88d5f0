#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace vaultsync::model {

struct Tombstone {
  bool operator==(const Tombstone&) const = default;
};

// Fixed-point decimal: amount = units / 10^scale.
struct Money {
  std::int64_t  units = 0;
  std::uint32_t scale = 0;
  std::string   currency;

  bool operator==(const Money&) const = default;
};

struct Timestamp {
  std::int64_t unix_ms = 0;

  bool operator==(const Timestamp&) const = default;
};

using FieldValue = std::variant<Tombstone, std::string, std::int64_t, Money, bool, Timestamp>;

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline bool IsTombstone(const FieldValue& value) {
  return std::holds_alternative<Tombstone>(value);
}

// Type tag only; values are never rendered into logs.
inline const char* TypeName(const FieldValue& value) {
  return std::visit(Overloaded{
                        [](const Tombstone&) { return "tombstone"; },
                        [](const std::string&) { return "text"; },
                        [](std::int64_t) { return "integer"; },
                        [](const Money&) { return "money"; },
                        [](bool) { return "boolean"; },
                        [](const Timestamp&) { return "timestamp"; },
                    },
                    value);
}

} // namespace vaultsync::model
