#include "internal/lock/line_lock_guard.hpp"

#include <string>

#include "internal/core/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace linecheck::lock {

using observability::IntField;
using observability::StringField;

namespace {

uint64_t CeilSeconds(util::Clock::duration d) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
  if (ms <= 0) return 0;
  return static_cast<uint64_t>((ms + 999) / 1000);
}

} // namespace

linecheck::v1::LineLockStatus LockSnapshot::ToProto() const {
  linecheck::v1::LineLockStatus status;
  status.set_state(state);
  status.set_failed_pin_attempts(failed_attempts);
  status.set_lockout_remaining_seconds(lockout_remaining_s);
  return status;
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  const std::size_t n    = a.size() > b.size() ? a.size() : b.size();
  unsigned          diff = static_cast<unsigned>(a.size() ^ b.size());
  for (std::size_t i = 0; i < n; ++i) {
    const unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned>(ca ^ cb);
  }
  return diff == 0;
}

LineLockGuard::LineLockGuard(LockSettings settings, std::shared_ptr<util::TimeSource> clock, std::shared_ptr<hardware::SignalDevice> device)
    : settings_(std::move(settings)), clock_(std::move(clock)), device_(std::move(device)) {
  if (settings_.max_attempts == 0) {
    settings_.max_attempts = 1;
  }
}

bool LineLockGuard::Engage() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool                  was_locked = locked_;
  locked_                                = true;
  hardware::InvokeSignal(*device_, hardware::Signal::kHalt);
  if (!was_locked) {
    observability::LineMetrics::Instance().RecordLineLock();
    LINECHECK_LOG_WARN("line locked");
  }
  return !was_locked;
}

bool LineLockGuard::Resume(std::string_view candidate, const std::function<void()>& release) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckPinLocked(candidate, "resume");
  if (release) {
    release();
  }

  const bool was_locked = locked_;
  locked_               = false;
  hardware::InvokeSignal(*device_, hardware::Signal::kResume);
  LINECHECK_LOG_INFO("line unlocked", {observability::BoolField("was_locked", was_locked)});
  return was_locked;
}

void LineLockGuard::Restore(bool locked) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (locked_ == locked) {
    return;
  }
  locked_ = locked;
  hardware::InvokeSignal(*device_, locked ? hardware::Signal::kHalt : hardware::Signal::kResume);
  LINECHECK_LOG_WARN("line lock restored", {observability::BoolField("locked", locked)});
}

void LineLockGuard::AuthorizeEndJob(std::string_view candidate) {
  std::lock_guard<std::mutex> lock(mutex_);
  CheckPinLocked(candidate, "end_job");
}

bool LineLockGuard::IsLocked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return locked_;
}

LockSnapshot LineLockGuard::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto                  now = clock_->Now();

  LockSnapshot snapshot;
  snapshot.locked          = locked_;
  snapshot.failed_attempts = failed_attempts_;

  if (lockout_until_ && now < *lockout_until_) {
    snapshot.state               = linecheck::v1::LOCK_STATE_PIN_LOCKED_OUT;
    snapshot.lockout_remaining_s = CeilSeconds(*lockout_until_ - now);
    return snapshot;
  }
  if (lockout_until_) {
    // elapsed but not yet observed by a PIN check
    snapshot.failed_attempts = 0;
  }
  snapshot.state = locked_ ? linecheck::v1::LOCK_STATE_LOCKED : linecheck::v1::LOCK_STATE_UNLOCKED;
  return snapshot;
}

void LineLockGuard::ExpireLockoutLocked(util::TimePoint now) {
  if (lockout_until_ && now >= *lockout_until_) {
    lockout_until_.reset();
    failed_attempts_ = 0;
    LINECHECK_LOG_INFO("PIN lockout expired");
  }
}

void LineLockGuard::CheckPinLocked(std::string_view candidate, std::string_view purpose) {
  const auto now = clock_->Now();
  ExpireLockoutLocked(now);

  if (lockout_until_) {
    const auto remaining = CeilSeconds(*lockout_until_ - now);
    throw util::RateLimitedError("too many failed PIN attempts; try again in " + std::to_string(remaining) + " seconds", remaining);
  }

  core::ValidatePinFormat(candidate);

  if (ConstantTimeEquals(candidate, settings_.supervisor_pin)) {
    failed_attempts_ = 0;
    return;
  }

  ++failed_attempts_;
  const bool locked_out = failed_attempts_ >= settings_.max_attempts;
  observability::LineMetrics::Instance().RecordPinFailure(locked_out);

  if (locked_out) {
    lockout_until_ = now + settings_.lockout;
    LINECHECK_LOG_WARN("PIN lockout engaged",
                       {StringField("purpose", purpose), IntField("attempts", failed_attempts_), IntField("lockout_seconds", settings_.lockout.count())});
    throw util::InvalidPinError("invalid PIN; too many failed attempts, locked out for " + std::to_string(settings_.lockout.count()) + " seconds");
  }

  const auto remaining = settings_.max_attempts - failed_attempts_;
  LINECHECK_LOG_WARN("invalid supervisor PIN", {StringField("purpose", purpose), IntField("attempts", failed_attempts_)});
  throw util::InvalidPinError("invalid PIN; " + std::to_string(remaining) + " attempt(s) remaining");
}

} // namespace linecheck::lock
