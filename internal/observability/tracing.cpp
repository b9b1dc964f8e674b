#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace linecheck::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

using TracerPtr = opentelemetry::nostd::shared_ptr<trace_api::Tracer>;

std::mutex                                g_tracing_mutex;
std::shared_ptr<sdktrace::TracerProvider> g_provider;
TracerPtr                                 g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ExportTarget& target) {
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = target.tls;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Falls back to whatever global provider is installed, so spans opened in
// tests or before InitializeTracing resolve to the no-op tracer.
TracerPtr CurrentTracer() {
  std::lock_guard<std::mutex> lock(g_tracing_mutex);
  if (g_tracer) {
    return g_tracer;
  }
  return trace_api::Provider::GetTracerProvider()->GetTracer("linecheck");
}

} // namespace

bool InitializeTracing(const linecheck::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target    = ResolveExportTarget(config.observability(), ExportSignal::kTraces);
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(target), sdktrace::BatchSpanProcessorOptions{});

  resource::ResourceAttributes attributes = {{"service.name", "linecheckd"}, {std::string(kAttrLine), config.line().name()}};
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes));

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  std::lock_guard<std::mutex> lock(g_tracing_mutex);
  g_provider = std::move(provider);
  g_tracer   = g_provider->GetTracer("linecheck", "0.1.0");
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    std::lock_guard<std::mutex> lock(g_tracing_mutex);
    provider = std::move(g_provider);
    g_tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (tracer) {
    impl_ = std::make_unique<Impl>(tracer->StartSpan(std::string(name)));
  }
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace linecheck::observability

#endif
