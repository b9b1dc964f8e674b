#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace linecheck::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           InsertJob(Transaction&, const model::JobRecord&) override;
  Result                           UpdateJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord>  GetJob(Transaction&, const std::string& job_id) override;
  std::optional<model::JobRecord>  GetActiveJob(Transaction&) override;
  std::vector<model::JobRecord>    ListJobs(Transaction&, uint64_t offset, uint64_t limit) override;
  uint64_t                         CountJobs(Transaction&) override;

  Result                         InsertScan(Transaction&, model::ScanRecord&) override;
  std::vector<model::ScanRecord> ListRecentScans(Transaction&, const std::string& job_id, uint64_t limit) override;
  std::vector<model::ScanRecord> ListAllScans(Transaction&) override;

  Result IncrementHourBucket(Transaction&, const model::HourBucketRecord&) override;
  Result InsertHourBucket(Transaction&, const model::HourBucketRecord&) override;
  std::optional<model::HourBucketRecord> GetHourBucket(Transaction&, const std::string& job_id, const std::string& date,
                                                       uint32_t hour) override;
  std::vector<model::HourBucketRecord>   ListHourBuckets(Transaction&, const std::string& date) override;
  std::vector<model::HourBucketRecord>   ListAllHourBuckets(Transaction&) override;

  Result                                UpsertShiftStat(Transaction&, const model::ShiftStatRecord&) override;
  std::optional<model::ShiftStatRecord> GetShiftStat(Transaction&, const std::string& date) override;
  std::vector<model::ShiftStatRecord>   ListShiftStats(Transaction&) override;

  Result DeleteAll(Transaction&) override;

 private:
  friend class MemoryTransaction;

  using BucketKey = std::tuple<std::string, std::string, uint32_t>;

  struct State {
    std::map<std::string, model::JobRecord>        jobs;
    std::vector<model::ScanRecord>                 scans;
    std::map<BucketKey, model::HourBucketRecord>   hour_buckets;
    std::map<std::string, model::ShiftStatRecord>  shift_stats;
    uint64_t                                       next_scan_id = 1;
  };

  using Undo = std::function<void(State&)>;

  // Undo that puts `table[key]` back as it was, or erases a row this write adds.
  template <typename Map>
  static Undo RestoreRow(Map State::*table, const Map& current, const typename Map::key_type& key);

  std::mutex mutex_;
  State      committed_;
};

} // namespace linecheck::db::memory
