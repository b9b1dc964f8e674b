#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace linecheck::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertJob(Transaction&, const model::JobRecord&) override;
  Result                          UpdateJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string& job_id) override;
  std::optional<model::JobRecord> GetActiveJob(Transaction&) override;
  std::vector<model::JobRecord>   ListJobs(Transaction&, uint64_t offset, uint64_t limit) override;
  uint64_t                        CountJobs(Transaction&) override;

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace linecheck::db::sqlite
