#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

namespace linecheck::core {
class JobStore;
class VerificationEngine;
} // namespace linecheck::core
namespace linecheck::lock {
class LineLockGuard;
}
namespace linecheck::broadcast {
class BroadcastHub;
}
namespace linecheck::hardware {
class SignalDevice;
}
namespace linecheck::util {
class TimeSource;
}

namespace linecheck::service {

struct LineSettings {
  std::string line_name         = "Line 1";
  uint32_t    report_first_hour = 8;
  uint32_t    report_last_hour  = 20;
};

/*
  Dependency container shared by all services.

  line_mutex is the line's exclusive section: every state-changing
  operation holds it uniquely across read-decide-write-publish, reads
  hold it shared.
*/
struct ServiceContext {
  std::shared_ptr<linecheck::core::JobStore>           jobs;
  std::shared_ptr<linecheck::core::VerificationEngine> engine;
  std::shared_ptr<linecheck::lock::LineLockGuard>      guard;
  std::shared_ptr<linecheck::broadcast::BroadcastHub>  hub;
  std::shared_ptr<linecheck::hardware::SignalDevice>   device;
  std::shared_ptr<linecheck::util::TimeSource>         clock;
  std::shared_ptr<std::shared_mutex>                   line_mutex;
  LineSettings                                         settings;
};

} // namespace linecheck::service
