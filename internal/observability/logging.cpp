#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace linecheck::observability {
namespace {

constexpr const char* kLoggerName     = "linecheck";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

struct LogContext {
  std::mutex  mutex;
  std::string line_name;
  bool        trace_ids{false};
};

LogContext& Context() {
  static LogContext context;
  return context;
}

std::string EnvOr(const char* name, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(name); value && *value) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

void AppendField(std::string& out, std::string_view key, std::string_view value) {
  out.push_back(' ');
  out.append(key);
  out.push_back('=');
  if (!value.empty() && value.find_first_of(" =\"") == std::string_view::npos) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const opentelemetry::nostd::span<const uint8_t, N>& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
  }
  return out;
}

void AppendTraceIds(std::string& out) {
  auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }
  AppendField(out, "trace_id", Hex(context.trace_id().Id()));
  AppendField(out, "span_id", Hex(context.span_id().Id()));
}
#else
void AppendTraceIds(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const linecheck::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(EnvOr("LINECHECK_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("LINECHECK_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  auto&                       context = Context();
  std::lock_guard<std::mutex> lock(context.mutex);
  context.line_name = config.line().name();
  context.trace_ids = config.logging().include_trace_context();
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatLogRecord(std::string_view message, std::initializer_list<LogField> fields) {
  std::string out(message);
  for (const auto& field : fields) {
    AppendField(out, field.key, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  auto record = FormatLogRecord(message, fields);

  auto& context   = Context();
  bool  trace_ids = false;
  {
    std::lock_guard<std::mutex> lock(context.mutex);
    if (!context.line_name.empty()) {
      AppendField(record, "line", context.line_name);
    }
    trace_ids = context.trace_ids;
  }
  if (trace_ids) {
    AppendTraceIds(record);
  }

  spdlog::log(level, "{}", record);
}

} // namespace linecheck::observability
