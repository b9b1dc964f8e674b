#pragma once

#include <string>

namespace linecheck::runtime::config {
class ObservabilityConfig;
}

namespace linecheck::observability {

enum class ExportSignal {
  kTraces,
  kMetrics,
};

/*
  Where one OTLP signal is shipped.
  http selects the OTLP/HTTP protobuf exporter, otherwise OTLP/gRPC.
*/
struct ExportTarget {
  std::string endpoint;
  bool        http{false};
  bool        tls{false};
};

// Configured endpoint wins, then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then a collector on localhost.
ExportTarget ResolveExportTarget(const linecheck::runtime::config::ObservabilityConfig& config, ExportSignal signal);

} // namespace linecheck::observability
