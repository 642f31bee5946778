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
#define RELEASECTL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define RELEASECTL_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace releasectl::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr const char* kInstrumentationName = "releasectl";

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = detail::ResolveEndpoint(config, detail::Signal::kMetrics);

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(config.metrics_interval_ms);
  // The export timeout must not exceed the interval.
  options.export_timeout_millis = std::min(options.export_timeout_millis, options.export_interval_millis);
#ifdef RELEASECTL_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(config), options);
#endif
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Add(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, std::initializer_list<AttributePair> attributes) {
  if constexpr (requires { instrument->Record(value, attributes, opentelemetry::context::Context{}); }) {
    instrument->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    instrument->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconcile_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      reconcile_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requeue_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;

  std::atomic<std::int64_t> queue_depth{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           detail::BuildResource(config));
  AddMetricReaderCompat(g_provider, MakeReader(config));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const releasectl::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }
  return InitializeMetrics(detail::FromRuntimeConfig(config));
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use, so
// InitializeMetrics must run before the first Instance() call.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationName, "0.1.0");

  impl_->reconcile_count = impl_->meter->CreateUInt64Counter("releasectl.reconcile.count", "Reconcile attempts by action and outcome", "1");
  impl_->reconcile_duration_ms =
      impl_->meter->CreateDoubleHistogram("releasectl.reconcile.duration", "Reconcile duration by action", "ms");
  impl_->requeue_count     = impl_->meter->CreateUInt64Counter("releasectl.queue.requeues", "Rate limited re-adds", "1");
  impl_->request_count     = impl_->meter->CreateUInt64Counter("releasectl.admin.requests", "Admin requests by route and outcome", "1");
  impl_->queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("releasectl.queue.depth", "Keys waiting in the work queue", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        observer->Observe(impl->queue_depth.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordReconcile(std::string_view action, bool success) {
  if (!impl_->reconcile_count) {
    return;
  }
  const std::string action_name(action);
  Add(impl_->reconcile_count, std::uint64_t{1}, {{"action", action_name}, {"success", success}});
}

void Metrics::ObserveReconcileDurationMs(std::string_view action, double duration_ms) {
  if (!impl_->reconcile_duration_ms) {
    return;
  }
  const std::string action_name(action);
  Record(impl_->reconcile_duration_ms, duration_ms, {{"action", action_name}});
}

void Metrics::RecordRequeue() {
  if (impl_->requeue_count) {
    Add(impl_->requeue_count, std::uint64_t{1}, {});
  }
}

void Metrics::SetQueueDepth(std::uint64_t depth) {
  impl_->queue_depth = static_cast<std::int64_t>(depth);
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_->request_count) {
    return;
  }
  const std::string route_name(route);
  Add(impl_->request_count, std::uint64_t{1}, {{"route", route_name}, {"success", success}});
}

} // namespace releasectl::observability

#endif
