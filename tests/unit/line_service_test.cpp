#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"
#include "tests/support/line_fixture.hpp"

namespace {

using linecheck::testing::FailingRepository;
using linecheck::testing::kSupervisorPin;
using linecheck::testing::LineFixture;
using linecheck::util::ConflictError;
using linecheck::util::InvalidInputError;
using linecheck::util::InvalidPinError;
using linecheck::util::LineLockedError;
using linecheck::util::NoActiveJobError;
using linecheck::util::NotFoundError;
using linecheck::util::PersistenceError;
using linecheck::util::RateLimitedError;
using namespace linecheck::v1;

constexpr std::chrono::milliseconds kWait{200};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestScanBeforeStartIsRejected() {
  LineFixture f;
  assert(Throws<NoActiveJobError>([&] { f.Scan("ABC123"); }));
  assert(!f.Status().has_active_job());
}

void TestPassFailLockAndResume() {
  LineFixture f;
  f.Start("JOB-1", "ABC123", 2);

  auto pass = f.Scan("ABC123");
  assert(pass.scan().status() == SCAN_STATUS_PASS);
  assert(pass.job().job().total_pieces() == 2);
  assert(pass.line().state() == LOCK_STATE_UNLOCKED);
  assert(f.device->PassSignals() == 1);

  auto fail = f.Scan("XYZ");
  assert(fail.scan().status() == SCAN_STATUS_FAIL);
  assert(fail.scan().expected() == "ABC123");
  assert(fail.line().state() == LOCK_STATE_LOCKED);
  assert(fail.job().job().fail_count() == 1);
  assert(fail.job().pass_rate() == 50.0);
  assert(f.device->FailSignals() == 1);
  assert(f.device->Halted());

  // the good label is refused until a supervisor unlocks the line
  assert(Throws<LineLockedError>([&] { f.Scan("ABC123"); }));
  assert(f.Status().active_job().job().total_scans() == 2);

  assert(Throws<InvalidPinError>([&] { f.VerifyPin("0000"); }));
  auto resumed = f.VerifyPin(kSupervisorPin);
  assert(resumed.line().state() == LOCK_STATE_UNLOCKED);
  assert(!f.device->Halted());

  auto after = f.Scan("ABC123");
  assert(after.scan().status() == SCAN_STATUS_PASS);
  assert(after.job().job().total_pieces() == 4);
  assert(after.recent_scans_size() == 3);
  assert(after.recent_scans(0).id() == after.scan().id());
}

void TestEmptyScanDoesNotCount() {
  LineFixture f;
  f.Start("JOB-1", "ABC123");
  assert(Throws<InvalidInputError>([&] { f.Scan("   "); }));
  assert(f.Status().active_job().job().total_scans() == 0);
  assert(!f.guard->IsLocked());
}

void TestPinLockoutAndRecovery() {
  LineFixture f;
  f.Start("JOB-1", "ABC123");
  f.Scan("XYZ");

  for (int i = 0; i < 5; ++i) {
    assert(Throws<InvalidPinError>([&] { f.VerifyPin("9999"); }));
  }

  bool limited = false;
  try {
    f.VerifyPin(kSupervisorPin);
  } catch (const RateLimitedError& e) {
    limited = true;
    assert(e.RetryAfterSeconds() == 15 * 60);
  }
  assert(limited);
  assert(f.Status().line().state() == LOCK_STATE_PIN_LOCKED_OUT);

  // the lockout covers ending the job too
  assert(Throws<RateLimitedError>([&] { f.End(); }));

  f.clock->Advance(std::chrono::minutes(15));
  assert(f.Status().line().state() == LOCK_STATE_LOCKED);
  assert(f.VerifyPin(kSupervisorPin).line().state() == LOCK_STATE_UNLOCKED);
}

void TestEndJobUpdatesShift() {
  LineFixture f;
  f.Start("JOB-1", "ABC123", 3);
  for (int i = 0; i < 9; ++i) f.Scan("ABC123");
  f.Scan("WRONG");
  f.VerifyPin(kSupervisorPin);

  auto before = f.Status().shift();
  assert(before.total_shippers() == 0);

  f.clock->Advance(std::chrono::minutes(42));
  auto ended = f.End();
  assert(ended.summary().job_id() == "JOB-1");
  assert(ended.summary().total_scans() == 10);
  assert(ended.summary().pass_count() == 9);
  assert(ended.summary().pass_rate() == 90.0);
  assert(ended.summary().elapsed() == "42:00");
  assert(ended.shift().total_shippers() == before.total_shippers() + 9);
  assert(ended.shift().total_pieces() == 27);
  assert(ended.shift().jobs_completed() == 1);

  auto status = f.Status();
  assert(!status.has_active_job());
  assert(status.shift().total_shippers() == 9);

  auto job = f.line->GetJob([] {
    GetJobRequest req;
    req.set_job_id("JOB-1");
    return req;
  }());
  assert(!job.job().job().is_active());
  assert(job.job().job().has_end_time());
  assert(job.scans_size() == 10);
}

void TestEndJobChecks() {
  LineFixture f;
  assert(Throws<NotFoundError>([&] { f.End(); }));

  f.Start("JOB-1", "ABC123");
  assert(Throws<InvalidPinError>([&] { f.End("1111"); }));
  assert(f.Status().has_active_job());

  // a second start while one is active is refused
  assert(Throws<ConflictError>([&] { f.Start("JOB-2", "ABC123"); }));
  f.End();
  f.Start("JOB-2", "ABC123");
  assert(f.Status().active_job().job().job_id() == "JOB-2");
}

void TestConcurrentStartJobHasOneWinner() {
  LineFixture f;

  std::atomic<int>         started{0};
  std::atomic<int>         conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        f.Start("JOB-" + std::to_string(i), "ABC123");
        ++started;
      } catch (const ConflictError&) {
        ++conflicts;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(started == 1);
  assert(conflicts == 7);
  assert(f.line->ListJobs(ListJobsRequest{}).total() == 1);
}

void TestConcurrentScansKeepCountersConsistent() {
  LineFixture f;
  f.Start("JOB-1", "ABC123", 5);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 25; ++j) f.Scan("ABC123");
    });
  }
  for (auto& t : threads) t.join();

  const auto job = f.Status().active_job().job();
  assert(job.total_scans() == 100);
  assert(job.pass_count() == 100);
  assert(job.total_pieces() == 500);
}

void TestSubscribersSeeEventsInOrder() {
  LineFixture f;
  auto        sub = f.line->Subscribe();

  f.Start("JOB-1", "ABC123");
  f.Scan("ABC123");
  f.Scan("BAD");
  f.VerifyPin(kSupervisorPin);
  f.End();

  std::vector<LineEvent> events;
  while (auto event = sub->Next(kWait)) {
    events.push_back(*event);
    if (events.size() == 7) break;
  }
  assert(events.size() == 7);
  for (std::size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence() == i + 1);
  }
  assert(events[0].has_job_started());
  assert(events[1].has_scan() && events[1].scan().scan().status() == SCAN_STATUS_PASS);
  assert(events[2].has_scan() && events[2].scan().line().state() == LOCK_STATE_LOCKED);
  assert(events[3].has_line_state() && events[3].line_state().state() == LOCK_STATE_LOCKED);
  assert(events[4].has_line_state() && events[4].line_state().state() == LOCK_STATE_UNLOCKED);
  assert(events[5].has_job_ended() && events[5].job_ended().summary().total_scans() == 2);
  assert(events[6].has_shift_update() && events[6].shift_update().jobs_completed() == 1);
}

void TestHourlyStatsAndJobViewHours() {
  LineFixture f; // 09:00
  f.Start("JOB-1", "ABC123", 4);
  f.Scan("ABC123");
  f.clock->Advance(std::chrono::hours(1));
  f.Scan("ABC123");
  auto view = f.Scan("ABC123").job();
  assert(view.this_hour().shippers() == 2 && view.this_hour().pieces() == 8);
  assert(view.previous_hour().shippers() == 1);

  auto hourly = f.line->GetHourlyStats(GetHourlyStatsRequest{});
  assert(hourly.date() == "2026-03-02");
  assert(hourly.hours_size() == 13);
  assert(hourly.hours(0).hour() == 8 && hourly.hours(0).pieces() == 0);
  assert(hourly.hours(1).hour() == 9 && hourly.hours(1).pieces() == 4);
  assert(hourly.hours(2).hour() == 10 && hourly.hours(2).pieces() == 8 && hourly.hours(2).cumulative_pieces() == 12);

  GetHourlyStatsRequest other;
  other.set_date("2026-03-01");
  auto empty = f.line->GetHourlyStats(other);
  assert(empty.hours(12).cumulative_pieces() == 0);
}

void TestListAndGetJobs() {
  LineFixture f;
  for (int i = 0; i < 3; ++i) {
    f.Start("JOB-" + std::to_string(i), "ABC123");
    f.End();
    f.clock->Advance(std::chrono::minutes(5));
  }

  ListJobsRequest req;
  req.set_page_size(2);
  auto page = f.line->ListJobs(req);
  assert(page.total() == 3 && page.pages() == 2 && page.page() == 1);
  assert(page.jobs(0).job().job_id() == "JOB-2");

  GetJobRequest missing;
  missing.set_job_id("NOPE");
  assert(Throws<NotFoundError>([&] { f.line->GetJob(missing); }));
}

void TestStatusReportsLineAndHardware() {
  LineFixture f;
  auto        status = f.Status();
  assert(status.line_name() == "Line 1");
  assert(status.hardware_enabled());
  assert(status.line().state() == LOCK_STATE_UNLOCKED);
  assert(status.shift().date() == "2026-03-02");
  assert(status.has_server_time());
}

void TestLockSurvivesRestart() {
  auto repo = std::make_shared<linecheck::db::memory::MemoryRepository>();
  {
    LineFixture before(repo);
    before.Start("JOB-1", "ABC123");
    before.Scan("XYZ");
    assert(before.Status().line().state() == LOCK_STATE_LOCKED);
  }

  LineFixture after(repo);
  assert(after.Status().line().state() == LOCK_STATE_LOCKED);
  assert(after.device->Halted());
  assert(Throws<LineLockedError>([&] { after.Scan("ABC123"); }));
  assert(after.Status().active_job().job().total_scans() == 1);

  after.VerifyPin(kSupervisorPin);
  assert(!after.device->Halted());

  LineFixture released(repo);
  assert(released.Status().line().state() == LOCK_STATE_UNLOCKED);
  assert(released.Scan("ABC123").scan().status() == SCAN_STATUS_PASS);
}

void TestLockSurvivesEndJobAndRestart() {
  auto repo = std::make_shared<linecheck::db::memory::MemoryRepository>();
  {
    LineFixture before(repo);
    before.Start("JOB-1", "ABC123");
    before.Scan("XYZ");
    before.End();
    assert(before.Status().line().state() == LOCK_STATE_LOCKED);
  }

  // the next job inherits the held lock
  LineFixture after(repo);
  assert(after.Status().line().state() == LOCK_STATE_LOCKED);
  after.Start("JOB-2", "ABC123");
  assert(Throws<LineLockedError>([&] { after.Scan("ABC123"); }));
  assert(after.jobs->ActiveJob()->is_locked);
}

void TestImportedLockIsHeld() {
  LineFixture source;
  source.Start("JOB-1", "ABC123");
  source.Scan("XYZ");
  const auto exported = source.admin->ExportState(ExportStateRequest{}).snapshot();
  assert(exported.jobs(0).is_locked());

  LineFixture target(std::make_shared<linecheck::db::memory::MemoryRepository>(), source.clock->Now());
  auto        sub = target.line->Subscribe();

  ImportStateRequest req;
  *req.mutable_snapshot() = exported;
  target.admin->ImportState(req);

  assert(target.Status().line().state() == LOCK_STATE_LOCKED);
  assert(target.device->Halted());
  assert(Throws<LineLockedError>([&] { target.Scan("ABC123"); }));

  auto restored = sub->Next(kWait);
  assert(restored && restored->has_state_restored());
  auto line = sub->Next(kWait);
  assert(line && line->has_line_state());
  assert(line->line_state().state() == LOCK_STATE_LOCKED);
}

void TestImportDoesNotReleaseHeldLock() {
  LineFixture source;
  source.Start("JOB-1", "ABC123");
  const auto exported = source.admin->ExportState(ExportStateRequest{}).snapshot();

  LineFixture target(std::make_shared<linecheck::db::memory::MemoryRepository>(), source.clock->Now());
  target.Start("OTHER", "000");
  target.Scan("111");

  ImportStateRequest req;
  *req.mutable_snapshot() = exported;
  target.admin->ImportState(req);

  assert(target.Status().line().state() == LOCK_STATE_LOCKED);
  assert(target.jobs->ActiveJob()->is_locked);
}

void TestFailedPassWriteLeavesLineUntouched() {
  auto        repo = std::make_shared<FailingRepository>();
  LineFixture f(repo);
  f.Start("JOB-1", "ABC123", 3);
  f.Scan("ABC123");

  const auto job_before    = *f.jobs->ActiveJob();
  const auto recent_before = f.jobs->RecentScans();
  auto       sub           = f.line->Subscribe();

  repo->fail_hour_bucket = true;
  assert(Throws<PersistenceError>([&] { f.Scan("ABC123"); }));

  assert(*f.jobs->ActiveJob() == job_before);
  assert(f.jobs->RecentScans() == recent_before);
  assert(f.jobs->Export().scans.size() == 1);
  assert(f.jobs->HourBuckets("2026-03-02").front().shippers == 1);
  assert(!f.guard->IsLocked());
  assert(f.device->PassSignals() == 1);
  assert(!sub->Next(std::chrono::milliseconds(20)));

  repo->fail_hour_bucket = false;
  auto retry             = f.Scan("ABC123");
  assert(retry.scan().id() == 2);
  assert(retry.job().job().total_pieces() == 6);
}

void TestFailedFailWriteDoesNotLock() {
  auto        repo = std::make_shared<FailingRepository>();
  LineFixture f(repo);
  f.Start("JOB-1", "ABC123");

  repo->fail_update_job = true;
  assert(Throws<PersistenceError>([&] { f.Scan("XYZ"); }));
  repo->fail_update_job = false;

  assert(!f.guard->IsLocked());
  assert(!f.device->Halted());
  assert(f.device->FailSignals() == 0);
  assert(f.jobs->ActiveJob()->total_scans == 0);
  assert(!f.jobs->ActiveJob()->is_locked);
  assert(f.jobs->RecentScans().empty());
  assert(f.jobs->Export().scans.empty());
}

void TestEventStreamOpensWithSnapshot() {
  LineFixture f;
  f.Start("JOB-1", "ABC123");
  f.Scan("ABC123");

  auto stream = f.line->OpenEventStream();
  assert(stream.snapshot.has_snapshot());
  assert(stream.snapshot.sequence() == f.hub->LastSequence());
  assert(stream.snapshot.snapshot().active_job().job().total_scans() == 1);
  assert(stream.snapshot.snapshot().line().state() == LOCK_STATE_UNLOCKED);
  assert(!stream.subscription->Next(std::chrono::milliseconds(20)));

  f.Scan("XYZ");
  auto scan = stream.subscription->Next(kWait);
  assert(scan && scan->has_scan());
  assert(scan->sequence() == stream.snapshot.sequence() + 1);
  auto locked = stream.subscription->Next(kWait);
  assert(locked && locked->has_line_state());
}

void TestEventStreamHasNoGapOrOverlap() {
  LineFixture f;
  f.Start("JOB-1", "ABC123");

  constexpr uint64_t kScans = 40;
  std::thread        writer([&] {
    for (uint64_t i = 0; i < kScans; ++i) {
      f.Scan("ABC123");
    }
  });

  auto     stream   = f.line->OpenEventStream();
  uint64_t seen     = stream.snapshot.snapshot().active_job().job().total_scans();
  uint64_t sequence = stream.snapshot.sequence();
  while (seen < kScans) {
    auto event = stream.subscription->Next(std::chrono::seconds(2));
    assert(event && event->has_scan());
    assert(event->sequence() == ++sequence);
    assert(event->scan().job().job().total_scans() == ++seen);
  }
  writer.join();
  assert(stream.subscription->Dropped() == 0);
}

} // namespace

int main() {
  TestScanBeforeStartIsRejected();
  TestPassFailLockAndResume();
  TestEmptyScanDoesNotCount();
  TestPinLockoutAndRecovery();
  TestEndJobUpdatesShift();
  TestEndJobChecks();
  TestConcurrentStartJobHasOneWinner();
  TestConcurrentScansKeepCountersConsistent();
  TestSubscribersSeeEventsInOrder();
  TestHourlyStatsAndJobViewHours();
  TestListAndGetJobs();
  TestStatusReportsLineAndHardware();
  TestLockSurvivesRestart();
  TestLockSurvivesEndJobAndRestart();
  TestImportedLockIsHeld();
  TestImportDoesNotReleaseHeldLock();
  TestFailedPassWriteLeavesLineUntouched();
  TestFailedFailWriteDoesNotLock();
  TestEventStreamOpensWithSnapshot();
  TestEventStreamHasNoGapOrOverlap();

  std::cout << "linecheck_unit_line_service: pass\n";
  return 0;
}
