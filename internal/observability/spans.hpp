#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#ifndef VAULTSYNC_VERSION
#define VAULTSYNC_VERSION "0.0.0"
#endif

namespace vaultsync::runtime::config {
class ObservabilityConfig;
}

namespace vaultsync::observability {

inline constexpr std::string_view kVersion = VAULTSYNC_VERSION;

/*
  The exporting process as OTLP resource attributes: service.name is the
  binary, service.version the build, and vaultsync.vault_id the vault a sync
  daemon serves (empty for the relay, which sees no vault).
*/
struct ServiceInfo {
  std::string name;
  std::string version{kVersion};
  std::string vault_id;
};

// Span names.
inline constexpr std::string_view kSpanTriggerSync     = "vaultsync.sync.trigger";
inline constexpr std::string_view kSpanReceiveEnvelope = "vaultsync.envelope.receive";
inline constexpr std::string_view kSpanRelayPut        = "vaultsync.relay.put";
inline constexpr std::string_view kSpanRelayFetch      = "vaultsync.relay.fetch";

// Span attribute keys.
namespace attr {
inline constexpr std::string_view kPeerId          = "vaultsync.peer_id";
inline constexpr std::string_view kSenderId        = "vaultsync.envelope.sender_id";
inline constexpr std::string_view kRecipientId     = "vaultsync.envelope.recipient_id";
inline constexpr std::string_view kSequenceNo      = "vaultsync.envelope.sequence_no";
inline constexpr std::string_view kMessage         = "vaultsync.message";
inline constexpr std::string_view kSessionsStarted = "vaultsync.sync.sessions_started";
inline constexpr std::string_view kBatches         = "vaultsync.relay.batches";
inline constexpr std::string_view kRoute           = "rpc.method";
} // namespace attr

// No-ops returning false when built without ENABLE_OTEL or when the config
// leaves the signal disabled.
bool InitializeTracing(const vaultsync::runtime::config::ObservabilityConfig& config, const ServiceInfo& service);
bool InitializeMetrics(const vaultsync::runtime::config::ObservabilityConfig& config, const ServiceInfo& service);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // Admin and relay RPCs.
  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // outcome: reconciled, failed, cancelled
  void RecordSession(std::string_view outcome);
  void ObserveRoundTripMs(double latency_ms);
  // direction: sent, received, rejected
  void RecordBatch(std::string_view direction, std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  friend bool InitializeMetrics(const vaultsync::runtime::config::ObservabilityConfig& config, const ServiceInfo& service);

  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vaultsync::runtime::config::ObservabilityConfig&, const ServiceInfo&) {
  return false;
}

inline bool InitializeMetrics(const vaultsync::runtime::config::ObservabilityConfig&, const ServiceInfo&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordSession(std::string_view) {
}

inline void Metrics::ObserveRoundTripMs(double) {
}

inline void Metrics::RecordBatch(std::string_view, std::uint64_t) {
}
#endif

} // namespace vaultsync::observability
