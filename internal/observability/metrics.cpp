#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define LEDGER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define LEDGER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace ledger::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using MetricsConfig = ledger::runtime::config::ObservabilityConfig::MetricsConfig;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Labels        = std::initializer_list<AttributePair>;

constexpr std::uint64_t kDefaultExportIntervalMs = 5000;

opentelemetry::nostd::string_view Label(std::string_view value) {
  return {value.data(), value.size()};
}

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Flipped by InitializeMetrics; the instruments are created once, lazily, by Instance().
struct Toggles {
  std::atomic<bool> requests{true};
  std::atomic<bool> locks{true};
  std::atomic<bool> ledger{true};
  std::atomic<bool> latency_histograms{true};
  std::atomic<bool> route_labels{true};
};

Toggles g_toggles;

resource::Resource MakeResource() {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : ResourceAttributes()) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return resource::Resource::Create(attrs);
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = settings.use_tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions MakeReaderOptions(const MetricsConfig& metrics) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const auto interval = metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : kDefaultExportIntervalMs;
  options.export_interval_millis = std::chrono::milliseconds(std::max(metrics.min_collection_interval_ms(), interval));
  if (metrics.export_timeout_ms() > 0) {
    // The SDK rejects a timeout longer than the interval.
    options.export_timeout_millis = std::min(options.export_interval_millis, std::chrono::milliseconds(metrics.export_timeout_ms()));
  }
  return options;
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(std::unique_ptr<sdkmetrics::PushMetricExporter>        exporter,
                                                     const sdkmetrics::PeriodicExportingMetricReaderOptions& options) {
#ifdef LEDGER_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

// opentelemetry-cpp changed these signatures between releases.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Labels labels) {
  if (!instrument) return;
  if constexpr (requires { instrument->Add(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Add(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, labels);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Labels labels) {
  if (!instrument) return;
  if constexpr (requires { instrument->Record(value, labels, opentelemetry::context::Context{}); }) {
    instrument->Record(value, labels, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, labels);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      lock_acquisition_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_timeouts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_extensions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scheduler_transitions;
};

bool InitializeMetrics(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metrics = observability.metrics();
  auto reader = MakeReader(MakeExporter(ResolveOtlpSettings(config, OtlpSignal::kMetrics)), MakeReaderOptions(metrics));

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), MakeResource());
  AttachReader(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_toggles.requests           = metrics.request_metrics_enabled();
  g_toggles.locks              = metrics.lock_metrics_enabled();
  g_toggles.ledger             = metrics.ledger_metrics_enabled();
  g_toggles.latency_histograms = metrics.request_latency_histograms_enabled();
  g_toggles.route_labels       = metrics.route_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) return;
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("ledger-core", "1.0.0");
  auto& meter  = *impl_->meter;

  impl_->requests              = meter.CreateUInt64Counter("ledger.rpc.requests", "1", "gRPC calls by route and outcome");
  impl_->request_latency_ms    = meter.CreateDoubleHistogram("ledger.rpc.latency_ms", "ms", "gRPC handler latency");
  impl_->lock_acquisition_ms   = meter.CreateDoubleHistogram("ledger.lock.acquisition_ms", "ms", "Time spent acquiring a resource lock");
  impl_->lock_timeouts         = meter.CreateUInt64Counter("ledger.lock.timeouts", "1", "Lock acquisitions that ran out of retries");
  impl_->lock_extensions       = meter.CreateUInt64Counter("ledger.lock.extensions", "1", "Lock ttl extensions by outcome");
  impl_->operations            = meter.CreateUInt64Counter("ledger.balance.operations", "1", "Balance operations by kind and outcome");
  impl_->scheduler_transitions = meter.CreateUInt64Counter("ledger.scheduler.transitions", "1", "Exclusion rows changed by the expiry job");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_toggles.requests) return;

  if (g_toggles.route_labels) {
    Add(impl_->requests, std::uint64_t{1}, {{"route", Label(route)}, {"success", success}});
  } else {
    Add(impl_->requests, std::uint64_t{1}, {{"success", success}});
  }
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_toggles.requests || !g_toggles.latency_histograms) return;

  if (g_toggles.route_labels) {
    Record(impl_->request_latency_ms, latency_ms, {{"route", Label(route)}});
  } else {
    Record(impl_->request_latency_ms, latency_ms, {});
  }
}

void Metrics::ObserveLockAcquisitionMs(std::string_view resource_kind, double latency_ms, bool success) {
  if (!g_toggles.locks) return;

  Record(impl_->lock_acquisition_ms, latency_ms, {{"resource", Label(resource_kind)}, {"success", success}});
  if (!success) {
    Add(impl_->lock_timeouts, std::uint64_t{1}, {{"resource", Label(resource_kind)}});
  }
}

void Metrics::RecordLockExtension(std::string_view resource_kind, bool success) {
  if (!g_toggles.locks) return;
  Add(impl_->lock_extensions, std::uint64_t{1}, {{"resource", Label(resource_kind)}, {"success", success}});
}

void Metrics::RecordLedgerOperation(std::string_view kind, std::string_view outcome) {
  if (!g_toggles.ledger) return;
  Add(impl_->operations, std::uint64_t{1}, {{"kind", Label(kind)}, {"outcome", Label(outcome)}});
}

void Metrics::RecordSchedulerTransitions(std::string_view step, std::uint64_t count) {
  if (!g_toggles.ledger || count == 0) return;
  Add(impl_->scheduler_transitions, count, {{"step", Label(step)}});
}

} // namespace ledger::observability

#endif
