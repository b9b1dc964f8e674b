#include "internal/observability/otlp_export.hpp"

#include <cstdlib>
#include <string_view>

#include "config/config.pb.h"

namespace linecheck::observability {
namespace {

std::string_view SignalPath(ExportSignal signal) {
  return signal == ExportSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

const char* SignalEnv(ExportSignal signal) {
  return signal == ExportSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

} // namespace

ExportTarget ResolveExportTarget(const linecheck::runtime::config::ObservabilityConfig& config, ExportSignal signal) {
  ExportTarget target;
  target.http = config.transport() == linecheck::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (auto per_signal = NonEmptyEnv(SignalEnv(signal)); !per_signal.empty()) {
    target.endpoint = std::move(per_signal);
  } else if (auto base = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT"); !base.empty()) {
    // the shared endpoint names the collector root; HTTP needs the signal path appended
    if (target.http) {
      while (!base.empty() && base.back() == '/') {
        base.pop_back();
      }
      base += SignalPath(signal);
    }
    target.endpoint = std::move(base);
  } else if (target.http) {
    target.endpoint = "http://localhost:4318" + std::string(SignalPath(signal));
  } else {
    target.endpoint = "localhost:4317";
  }

  target.tls = target.endpoint.rfind("https://", 0) == 0;
  return target;
}

} // namespace linecheck::observability
