#include "internal/lock/line_lock_guard.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/hardware/simulated_signal_device.hpp"
#include "internal/util/errors.hpp"

namespace {

using linecheck::hardware::SimulatedSignalDevice;
using linecheck::lock::ConstantTimeEquals;
using linecheck::lock::LineLockGuard;
using linecheck::lock::LockSettings;
using linecheck::util::InvalidPinError;
using linecheck::util::ManualTimeSource;
using linecheck::util::RateLimitedError;
using linecheck::util::ValidationError;

struct Fixture {
  std::shared_ptr<ManualTimeSource>      clock  = std::make_shared<ManualTimeSource>(linecheck::util::FromLocal(2026, 3, 2, 9, 0));
  std::shared_ptr<SimulatedSignalDevice> device = std::make_shared<SimulatedSignalDevice>();
  LineLockGuard                          guard{LockSettings{.supervisor_pin = "4321", .max_attempts = 3, .lockout = std::chrono::seconds(60)}, clock,
                          device};
};

bool WrongPin(LineLockGuard& guard, const char* pin) {
  try {
    guard.Resume(pin);
  } catch (const InvalidPinError&) {
    return true;
  }
  return false;
}

void TestConstantTimeEquals() {
  assert(ConstantTimeEquals("4321", "4321"));
  assert(!ConstantTimeEquals("4321", "4322"));
  assert(!ConstantTimeEquals("4321", "43210"));
  assert(!ConstantTimeEquals("", "1"));
  assert(ConstantTimeEquals("", ""));
}

void TestEngageAndResume() {
  Fixture f;
  assert(!f.guard.IsLocked());
  assert(f.guard.Snapshot().state == linecheck::v1::LOCK_STATE_UNLOCKED);

  assert(f.guard.Engage());
  assert(!f.guard.Engage());
  assert(f.guard.IsLocked());
  assert(f.device->Halted());
  assert(f.guard.Snapshot().state == linecheck::v1::LOCK_STATE_LOCKED);

  assert(f.guard.Resume("4321"));
  assert(!f.guard.IsLocked());
  assert(!f.device->Halted());

  // correct PIN on an unlocked line is accepted and reports no transition
  assert(!f.guard.Resume("4321"));
}

void TestMalformedPinDoesNotCount() {
  Fixture f;
  f.guard.Engage();

  bool rejected = false;
  try {
    f.guard.Resume("12");
  } catch (const ValidationError&) {
    rejected = true;
  }
  assert(rejected);
  assert(f.guard.Snapshot().failed_attempts == 0);
  assert(f.guard.IsLocked());
}

void TestLockoutAfterMaxAttempts() {
  Fixture f;
  f.guard.Engage();

  assert(WrongPin(f.guard, "0000"));
  assert(f.guard.Snapshot().failed_attempts == 1);
  assert(WrongPin(f.guard, "0000"));
  assert(WrongPin(f.guard, "0000"));

  auto snapshot = f.guard.Snapshot();
  assert(snapshot.state == linecheck::v1::LOCK_STATE_PIN_LOCKED_OUT);
  assert(snapshot.lockout_remaining_s == 60);
  assert(snapshot.locked);

  // even the right PIN is refused during the lockout
  f.clock->Advance(std::chrono::seconds(20));
  bool limited = false;
  try {
    f.guard.Resume("4321");
  } catch (const RateLimitedError& e) {
    limited = true;
    assert(e.RetryAfterSeconds() == 40);
  }
  assert(limited);
  assert(f.guard.IsLocked());

  f.clock->Advance(std::chrono::seconds(40));
  snapshot = f.guard.Snapshot();
  assert(snapshot.state == linecheck::v1::LOCK_STATE_LOCKED);
  assert(snapshot.failed_attempts == 0);

  assert(f.guard.Resume("4321"));
  assert(f.guard.Snapshot().state == linecheck::v1::LOCK_STATE_UNLOCKED);
}

void TestEndJobSharesTheAttemptCounter() {
  Fixture f;

  bool invalid = false;
  try {
    f.guard.AuthorizeEndJob("9999");
  } catch (const InvalidPinError&) {
    invalid = true;
  }
  assert(invalid);
  assert(WrongPin(f.guard, "9999"));
  assert(f.guard.Snapshot().failed_attempts == 2);

  // a correct PIN resets the counter and leaves the lock alone
  f.guard.AuthorizeEndJob("4321");
  assert(f.guard.Snapshot().failed_attempts == 0);
  assert(!f.guard.IsLocked());
}

void TestRestoreAdoptsPersistedLock() {
  Fixture f;
  f.guard.Restore(true);
  assert(f.guard.IsLocked());
  assert(f.device->Halted());
  assert(f.guard.Snapshot().failed_attempts == 0);

  f.guard.Restore(false);
  assert(!f.guard.IsLocked());
  assert(!f.device->Halted());
}

void TestFailedReleaseKeepsTheLock() {
  Fixture f;
  f.guard.Engage();

  bool threw = false;
  try {
    f.guard.Resume("4321", [] { throw std::runtime_error("write failed"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(f.guard.IsLocked());
  assert(f.device->Halted());

  // a wrong PIN never reaches the release step
  bool released = false;
  bool rejected = false;
  try {
    f.guard.Resume("1111", [&] { released = true; });
  } catch (const InvalidPinError&) {
    rejected = true;
  }
  assert(rejected);
  assert(!released);

  assert(f.guard.Resume("4321", [&] { released = true; }));
  assert(released);
  assert(!f.guard.IsLocked());
}

} // namespace

int main() {
  TestConstantTimeEquals();
  TestEngageAndResume();
  TestMalformedPinDoesNotCount();
  TestLockoutAfterMaxAttempts();
  TestEndJobSharesTheAttemptCounter();
  TestRestoreAdoptsPersistedLock();
  TestFailedReleaseKeepsTheLock();

  std::cout << "linecheck_unit_line_lock_guard: pass\n";
  return 0;
}
