#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace linecheck::runtime::config {
class RuntimeConfig;
}

namespace linecheck::observability {

// Span attribute keys shared by the services.
inline constexpr std::string_view kAttrRoute      = "linecheck.route";
inline constexpr std::string_view kAttrLine       = "linecheck.line";
inline constexpr std::string_view kAttrJobId      = "linecheck.job_id";
inline constexpr std::string_view kAttrScanStatus = "linecheck.scan.status";

// Installs an OTLP tracer provider when observability.tracing_enabled is set.
// Returns false when tracing stays off.
bool InitializeTracing(const linecheck::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span bound to the current context for its lifetime.
  Without ENABLE_OTEL, or before InitializeTracing, every call is a no-op.
*/
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

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const linecheck::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

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
#endif

} // namespace linecheck::observability
