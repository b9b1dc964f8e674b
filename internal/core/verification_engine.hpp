#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "internal/core/job_store.hpp"
#include "internal/hardware/signal_device.hpp"
#include "internal/lock/line_lock_guard.hpp"

namespace linecheck::core {

struct ScanOutcome {
  db::model::ScanRecord              scan;
  db::model::JobRecord               job;
  std::vector<db::model::ScanRecord> recent; // most recent first
  bool                               line_locked = false;
};

/*
  VerificationEngine

  Decides PASS/FAIL for one scan against the active job, records it and
  drives the line signals. A FAIL engages the line lock before Process()
  returns; the recorded scan is never rolled back.

  Precondition order: active job, line unlocked, scan input well formed.
  Not thread-safe; the caller holds the line's exclusive section.
*/
class VerificationEngine {
 public:
  VerificationEngine(std::shared_ptr<JobStore> jobs, std::shared_ptr<lock::LineLockGuard> guard, std::shared_ptr<hardware::SignalDevice> device);

  ScanOutcome Process(std::string_view raw_barcode);

 private:
  std::shared_ptr<JobStore>               jobs_;
  std::shared_ptr<lock::LineLockGuard>    guard_;
  std::shared_ptr<hardware::SignalDevice> device_;
};

} // namespace linecheck::core
