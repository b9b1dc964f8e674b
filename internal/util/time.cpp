#include "time.hpp"

#include <ctime>
#include <stdexcept>

namespace linecheck::util {
namespace {

std::tm ToLocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  if (localtime_r(&t, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed");
  }
  return local;
}

std::string Format(TimePoint tp, const char* fmt) {
  const std::tm local = ToLocalTm(tp);
  char          buf[32];
  const auto    n = std::strftime(buf, sizeof(buf), fmt, &local);
  return std::string(buf, n);
}

} // namespace

TimePoint SystemTimeSource::Now() const {
  return Clock::now();
}

ManualTimeSource::ManualTimeSource(TimePoint start) : now_(start) {
}

TimePoint ManualTimeSource::Now() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return now_;
}

void ManualTimeSource::Set(TimePoint tp) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ = tp;
}

void ManualTimeSource::Advance(Clock::duration d) {
  std::lock_guard<std::mutex> lock(mutex_);
  now_ += d;
}

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string LocalDate(TimePoint tp) {
  return Format(tp, "%Y-%m-%d");
}

int LocalHour(TimePoint tp) {
  return ToLocalTm(tp).tm_hour;
}

std::string LocalCompactStamp(TimePoint tp) {
  return Format(tp, "%Y%m%d_%H%M%S");
}

TimePoint FromLocal(int year, int month, int day, int hour, int minute, int second) {
  std::tm local{};
  local.tm_year  = year - 1900;
  local.tm_mon   = month - 1;
  local.tm_mday  = day;
  local.tm_hour  = hour;
  local.tm_min   = minute;
  local.tm_sec   = second;
  local.tm_isdst = -1;

  const std::time_t t = std::mktime(&local);
  if (t == static_cast<std::time_t>(-1)) {
    throw std::runtime_error("mktime failed");
  }
  return Clock::from_time_t(t);
}

} // namespace linecheck::util
