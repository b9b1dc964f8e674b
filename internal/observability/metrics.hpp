#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace linecheck::runtime::config {
class RuntimeConfig;
}

namespace linecheck::observability {

// Installs an OTLP meter provider when observability.metrics_enabled is set.
bool InitializeMetrics(const linecheck::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide line instruments:
    linecheck.rpc.count / linecheck.rpc.latency_ms   per route and outcome
    linecheck.scan.count                             per pass/fail
    linecheck.line.lock_count                        lock engagements
    linecheck.pin.failure_count                      rejected PINs, tagged with lockout
    linecheck.broadcast.drop_count                   events evicted from slow subscribers
    linecheck.broadcast.subscribers                  live watch streams (gauge)
*/
class LineMetrics {
 public:
  static LineMetrics& Instance();

  void RecordRpc(std::string_view route, bool ok, double latency_ms);
  void RecordScan(bool pass);
  void RecordLineLock();
  void RecordPinFailure(bool locked_out);
  void RecordBroadcastDrop();
  void SetSubscriberCount(std::int64_t count);

 private:
  LineMetrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const linecheck::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline LineMetrics::LineMetrics() = default;

inline LineMetrics& LineMetrics::Instance() {
  static LineMetrics instance;
  return instance;
}

inline void LineMetrics::RecordRpc(std::string_view, bool, double) {
}

inline void LineMetrics::RecordScan(bool) {
}

inline void LineMetrics::RecordLineLock() {
}

inline void LineMetrics::RecordPinFailure(bool) {
}

inline void LineMetrics::RecordBroadcastDrop() {
}

inline void LineMetrics::SetSubscriberCount(std::int64_t) {
}
#endif

} // namespace linecheck::observability
