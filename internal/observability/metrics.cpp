#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/resource.hpp"

namespace vaultsync::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char*   kMeterName               = "vaultsync.sync";
constexpr std::uint64_t kDefaultExportIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

/*
  Instruments are created against whatever meter provider is global when
  Bind() runs: the no-op one until InitializeMetrics installs the exporting
  provider and binds again.
*/
struct Metrics::Impl {
  std::mutex mutex;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> session_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      round_trip_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> batch_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> batch_bytes;

  void Bind(std::string_view version) {
    auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kMeterName, std::string(version));

    std::lock_guard<std::mutex> lock(mutex);
    request_count      = meter->CreateUInt64Counter("vaultsync.rpc.count", "1", "Admin and relay RPCs by route and outcome");
    request_latency_ms = meter->CreateDoubleHistogram("vaultsync.rpc.latency_ms", "ms", "Admin and relay RPC latency");
    session_count      = meter->CreateUInt64Counter("vaultsync.session.count", "1", "Finished sync sessions by outcome");
    round_trip_ms      = meter->CreateDoubleHistogram("vaultsync.session.round_trip_ms", "ms", "Hello to Ack round trip");
    batch_count        = meter->CreateUInt64Counter("vaultsync.batch.count", "1", "Sealed batches by direction");
    batch_bytes        = meter->CreateUInt64Counter("vaultsync.batch.bytes", "By", "Sealed batch bytes by direction");
  }
};

bool InitializeMetrics(const vaultsync::runtime::config::ObservabilityConfig& config, const ServiceInfo& service) {
  if (!config.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) {
    options.endpoint = config.otlp_endpoint();
  }
  options.use_ssl_credentials = false;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(config.export_interval_ms() > 0 ? config.export_interval_ms() : kDefaultExportIntervalMs);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(otlp::OtlpGrpcMetricExporterFactory::Create(options), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           MakeResource(service));
  AddMetricReaderCompat(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  Metrics::Instance().impl_->Bind(service.version);
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->Bind(kVersion);
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string                          method(route);
  const std::initializer_list<AttributePair> attributes = {{attr::kRoute.data(), method}, {"success", success}};
  std::lock_guard<std::mutex>                lock(impl_->mutex);
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const std::string                          method(route);
  const std::initializer_list<AttributePair> attributes = {{attr::kRoute.data(), method}};
  std::lock_guard<std::mutex>                lock(impl_->mutex);
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordSession(std::string_view outcome) {
  const std::string                          value(outcome);
  const std::initializer_list<AttributePair> attributes = {{"outcome", value}};
  std::lock_guard<std::mutex>                lock(impl_->mutex);
  AddWithAttributes(impl_->session_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRoundTripMs(double latency_ms) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  RecordWithAttributes(impl_->round_trip_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordBatch(std::string_view direction, std::uint64_t bytes) {
  const std::string                          value(direction);
  const std::initializer_list<AttributePair> attributes = {{"direction", value}};
  std::lock_guard<std::mutex>                lock(impl_->mutex);
  AddWithAttributes(impl_->batch_count, static_cast<std::uint64_t>(1), attributes);
  AddWithAttributes(impl_->batch_bytes, bytes, attributes);
}

} // namespace vaultsync::observability

#endif
