#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace linecheck::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;
using Counter    = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = target.tls;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// AddMetricReader switched from shared_ptr to unique_ptr across SDK releases.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// Histogram::Record without a context only exists in the ABI v2 API.
template <typename Histogram>
void RecordLatency(const Histogram& histogram, double value, Attributes attributes) {
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

void Increment(const Counter& counter, Attributes attributes = {}) {
  if (counter) {
    counter->Add(1, attributes);
  }
}

} // namespace

struct LineMetrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter                                                          rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> rpc_latency_ms;
  Counter                                                          scan_count;
  Counter                                                          line_lock_count;
  Counter                                                          pin_failure_count;
  Counter                                                          broadcast_drop_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> subscriber_gauge;

  std::atomic<std::int64_t> subscribers{0};

  static void ObserveSubscribers(metrics_api::ObserverResult result, void* state) {
    using Int64Result = opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>;
    if (opentelemetry::nostd::holds_alternative<Int64Result>(result)) {
      opentelemetry::nostd::get<Int64Result>(result)->Observe(static_cast<Impl*>(state)->subscribers.load());
    }
  }
};

bool InitializeMetrics(const linecheck::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = ResolveExportTarget(config.observability(), ExportSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(2000);

  resource::ResourceAttributes attributes = {{"service.name", "linecheckd"}, {"linecheck.line", config.line().name()}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attributes));
  AttachReader(*g_provider, sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(target), reader_options));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

// Instruments bind to the provider installed at first use, so InitializeMetrics
// must run before the services are built.
LineMetrics::LineMetrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("linecheck", "0.1.0");
  auto& meter  = *impl_->meter;

  impl_->rpc_count            = meter.CreateUInt64Counter("linecheck.rpc.count", "Line and admin calls by route and outcome", "1");
  impl_->rpc_latency_ms       = meter.CreateDoubleHistogram("linecheck.rpc.latency_ms", "Line and admin call latency", "ms");
  impl_->scan_count           = meter.CreateUInt64Counter("linecheck.scan.count", "Scans recorded against the active job", "1");
  impl_->line_lock_count      = meter.CreateUInt64Counter("linecheck.line.lock_count", "Times the line halted on a mismatch", "1");
  impl_->pin_failure_count    = meter.CreateUInt64Counter("linecheck.pin.failure_count", "Rejected supervisor PIN attempts", "1");
  impl_->broadcast_drop_count = meter.CreateUInt64Counter("linecheck.broadcast.drop_count", "Events evicted from full subscriber queues", "1");
  impl_->subscriber_gauge     = meter.CreateInt64ObservableGauge("linecheck.broadcast.subscribers", "Open watch streams", "1");
  impl_->subscriber_gauge->AddCallback(&Impl::ObserveSubscribers, impl_.get());
}

LineMetrics& LineMetrics::Instance() {
  static LineMetrics instance;
  return instance;
}

void LineMetrics::RecordRpc(std::string_view route, bool ok, double latency_ms) {
  const std::string route_name(route);
  Increment(impl_->rpc_count, {{"route", route_name}, {"ok", ok}});
  if (impl_->rpc_latency_ms) {
    RecordLatency(impl_->rpc_latency_ms, latency_ms, {{"route", route_name}});
  }
}

void LineMetrics::RecordScan(bool pass) {
  Increment(impl_->scan_count, {{"status", pass ? "pass" : "fail"}});
}

void LineMetrics::RecordLineLock() {
  Increment(impl_->line_lock_count);
}

void LineMetrics::RecordPinFailure(bool locked_out) {
  Increment(impl_->pin_failure_count, {{"locked_out", locked_out}});
}

void LineMetrics::RecordBroadcastDrop() {
  Increment(impl_->broadcast_drop_count);
}

void LineMetrics::SetSubscriberCount(std::int64_t count) {
  impl_->subscribers.store(count);
}

} // namespace linecheck::observability

#endif
