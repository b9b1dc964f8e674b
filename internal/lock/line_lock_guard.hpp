#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "internal/hardware/signal_device.hpp"
#include "internal/util/time.hpp"
#include "linecheck/v1/types.pb.h"

namespace linecheck::lock {

struct LockSettings {
  std::string          supervisor_pin;
  uint32_t             max_attempts = 5;
  std::chrono::seconds lockout{15 * 60};
};

struct LockSnapshot {
  linecheck::v1::LockState state               = linecheck::v1::LOCK_STATE_UNLOCKED;
  bool                     locked              = false;
  uint32_t                 failed_attempts     = 0;
  uint64_t                 lockout_remaining_s = 0;

  linecheck::v1::LineLockStatus ToProto() const;
};

// Touches every byte regardless of where the first mismatch is.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

/*
  LineLockGuard

  UNLOCKED -> LOCKED            on Engage() (every FAIL scan), halts the line
  LOCKED   -> UNLOCKED          on Resume() with the right PIN, resumes the line
  any      -> PIN_LOCKED_OUT    after max_attempts wrong PINs
  PIN_LOCKED_OUT -> previous    once the lockout elapses; the counter resets

  Resume() and AuthorizeEndJob() share one attempt counter. During a
  lockout both fail with util::RateLimitedError before the PIN is looked at.
  The attempt counter and lockout live in memory only; the lock itself is
  persisted by the caller and handed back through Restore() at startup.
*/
class LineLockGuard {
 public:
  LineLockGuard(LockSettings settings, std::shared_ptr<util::TimeSource> clock, std::shared_ptr<hardware::SignalDevice> device);

  // Returns false when the line was already locked.
  bool Engage();

  // Checks the PIN, runs `release` and unlocks. When `release` throws the
  // line stays locked. Returns false when the line was not locked.
  bool Resume(std::string_view candidate, const std::function<void()>& release = {});

  // Adopts a persisted lock without a PIN check; halts the line when locked.
  void Restore(bool locked);

  // Checks the PIN without touching the lock.
  void AuthorizeEndJob(std::string_view candidate);

  bool         IsLocked() const;
  LockSnapshot Snapshot() const;

 private:
  void CheckPinLocked(std::string_view candidate, std::string_view purpose);
  void ExpireLockoutLocked(util::TimePoint now);

  LockSettings                            settings_;
  std::shared_ptr<util::TimeSource>       clock_;
  std::shared_ptr<hardware::SignalDevice> device_;

  mutable std::mutex             mutex_;
  bool                           locked_          = false;
  uint32_t                       failed_attempts_ = 0;
  std::optional<util::TimePoint> lockout_until_;
};

} // namespace linecheck::lock
