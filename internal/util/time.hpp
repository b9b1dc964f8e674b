#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace linecheck::util {

/*
  Time utilities. Every component reads the current time through a
  TimeSource so tests can drive the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

class TimeSource {
 public:
  virtual ~TimeSource()          = default;
  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start);

  TimePoint Now() const override;
  void      Set(TimePoint tp);
  void      Advance(Clock::duration d);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Local calendar date as YYYY-MM-DD.
std::string LocalDate(TimePoint tp);
// Local hour of day, 0..23.
int LocalHour(TimePoint tp);
// YYYYMMDD_HHMMSS in local time.
std::string LocalCompactStamp(TimePoint tp);

TimePoint FromLocal(int year, int month, int day, int hour, int minute = 0, int second = 0);

} // namespace linecheck::util
