#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"

namespace linecheck::service {

// Wraps one service call in a span plus per-route count/latency metrics.
// Failures are logged and rethrown unchanged.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  linecheck::observability::SpanScope span(route);
  span.SetAttribute(linecheck::observability::kAttrRoute, route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool ok) {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at);
    linecheck::observability::LineMetrics::Instance().RecordRpc(route, ok, elapsed.count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    LINECHECK_LOG_ERROR("RPC failed", {linecheck::observability::StringField("route", route), linecheck::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace linecheck::service
