#include "internal/core/record_mapping.hpp"

#include <chrono>

#include "internal/util/time.hpp"

namespace linecheck::core {

google::protobuf::Timestamp TimestampFromMillis(uint64_t ms) {
  return util::ToProto(util::TimePoint{std::chrono::milliseconds(ms)});
}

uint64_t MillisFromTimestamp(const google::protobuf::Timestamp& ts) {
  return util::ToUnixMillis(util::FromProto(ts));
}

linecheck::v1::Job ToProto(const db::model::JobRecord& record) {
  linecheck::v1::Job job;
  job.set_job_id(record.job_id);
  job.set_expected_barcode(record.expected_barcode);
  job.set_pieces_per_shipper(record.pieces_per_shipper);
  job.set_target_quantity(record.target_quantity);
  *job.mutable_start_time() = TimestampFromMillis(record.start_time_ms);
  if (record.end_time_ms) {
    *job.mutable_end_time() = TimestampFromMillis(*record.end_time_ms);
  }
  job.set_is_active(record.is_active);
  job.set_total_scans(record.total_scans);
  job.set_pass_count(record.pass_count);
  job.set_fail_count(record.fail_count);
  job.set_total_pieces(record.total_pieces);
  job.set_is_locked(record.is_locked);
  return job;
}

linecheck::v1::Scan ToProto(const db::model::ScanRecord& record) {
  linecheck::v1::Scan scan;
  scan.set_id(record.id);
  scan.set_job_id(record.job_id);
  scan.set_barcode(record.barcode);
  scan.set_expected(record.expected);
  scan.set_status(record.status);
  *scan.mutable_timestamp() = TimestampFromMillis(record.timestamp_ms);
  return scan;
}

linecheck::v1::HourBucket ToProto(const db::model::HourBucketRecord& record) {
  linecheck::v1::HourBucket bucket;
  bucket.set_job_id(record.job_id);
  bucket.set_date(record.date);
  bucket.set_hour(record.hour);
  bucket.set_shippers(record.shippers);
  bucket.set_pieces(record.pieces);
  return bucket;
}

linecheck::v1::ShiftStat ToProto(const db::model::ShiftStatRecord& record) {
  linecheck::v1::ShiftStat shift;
  shift.set_date(record.date);
  shift.set_total_shippers(record.total_shippers);
  shift.set_total_pieces(record.total_pieces);
  shift.set_total_pass(record.total_pass);
  shift.set_total_fail(record.total_fail);
  shift.set_jobs_completed(record.jobs_completed);
  return shift;
}

db::model::JobRecord FromProto(const linecheck::v1::Job& job) {
  db::model::JobRecord record;
  record.job_id             = job.job_id();
  record.expected_barcode   = job.expected_barcode();
  record.pieces_per_shipper = job.pieces_per_shipper();
  record.target_quantity    = job.target_quantity();
  record.start_time_ms      = MillisFromTimestamp(job.start_time());
  if (job.has_end_time()) {
    record.end_time_ms = MillisFromTimestamp(job.end_time());
  }
  record.is_active    = job.is_active();
  record.total_scans  = job.total_scans();
  record.pass_count   = job.pass_count();
  record.fail_count   = job.fail_count();
  record.total_pieces = job.total_pieces();
  record.is_locked    = job.is_locked();
  return record;
}

db::model::ScanRecord FromProto(const linecheck::v1::Scan& scan) {
  db::model::ScanRecord record;
  record.id           = scan.id();
  record.job_id       = scan.job_id();
  record.barcode      = scan.barcode();
  record.expected     = scan.expected();
  record.status       = scan.status();
  record.timestamp_ms = MillisFromTimestamp(scan.timestamp());
  return record;
}

db::model::HourBucketRecord FromProto(const linecheck::v1::HourBucket& bucket) {
  return db::model::HourBucketRecord{
      .job_id = bucket.job_id(), .date = bucket.date(), .hour = bucket.hour(), .shippers = bucket.shippers(), .pieces = bucket.pieces()};
}

db::model::ShiftStatRecord FromProto(const linecheck::v1::ShiftStat& shift) {
  return db::model::ShiftStatRecord{.date           = shift.date(),
                                    .total_shippers = shift.total_shippers(),
                                    .total_pieces   = shift.total_pieces(),
                                    .total_pass     = shift.total_pass(),
                                    .total_fail     = shift.total_fail(),
                                    .jobs_completed = shift.jobs_completed()};
}

} // namespace linecheck::core
