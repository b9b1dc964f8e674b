#include "pg_schema.hpp"

namespace linecheck::db::postgres {

void BootstrapSchema(PgPool& pool) {
  auto       lease = pool.Acquire();
  pqxx::work tx(lease.Connection());

  tx.exec(
      "CREATE TABLE IF NOT EXISTS jobs (job_id TEXT PRIMARY KEY, expected_barcode TEXT NOT NULL, pieces_per_shipper BIGINT NOT NULL, "
      "target_quantity BIGINT NOT NULL, start_time_ms BIGINT NOT NULL, end_time_ms BIGINT, is_active BOOLEAN NOT NULL, "
      "total_scans BIGINT NOT NULL DEFAULT 0, pass_count BIGINT NOT NULL DEFAULT 0, fail_count BIGINT NOT NULL DEFAULT 0, "
      "total_pieces BIGINT NOT NULL DEFAULT 0, is_locked BOOLEAN NOT NULL DEFAULT FALSE);");
  tx.exec("ALTER TABLE jobs ADD COLUMN IF NOT EXISTS is_locked BOOLEAN NOT NULL DEFAULT FALSE;");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS jobs_single_active ON jobs(is_active) WHERE is_active;");
  tx.exec("CREATE INDEX IF NOT EXISTS jobs_start_time ON jobs(start_time_ms DESC, job_id DESC);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS scans (id BIGSERIAL PRIMARY KEY, job_id TEXT NOT NULL REFERENCES jobs(job_id), barcode TEXT NOT NULL, "
      "expected TEXT NOT NULL, status SMALLINT NOT NULL, timestamp_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS scans_job ON scans(job_id, id);");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS hour_buckets (job_id TEXT NOT NULL REFERENCES jobs(job_id), date TEXT NOT NULL, hour INTEGER NOT NULL, "
      "shippers BIGINT NOT NULL DEFAULT 0, pieces BIGINT NOT NULL DEFAULT 0, PRIMARY KEY (job_id, date, hour));");
  tx.exec(
      "CREATE TABLE IF NOT EXISTS shift_stats (date TEXT PRIMARY KEY, total_shippers BIGINT NOT NULL DEFAULT 0, total_pieces BIGINT NOT NULL DEFAULT 0, "
      "total_pass BIGINT NOT NULL DEFAULT 0, total_fail BIGINT NOT NULL DEFAULT 0, jobs_completed BIGINT NOT NULL DEFAULT 0);");

  tx.exec("SELECT job_id,expected_barcode,pieces_per_shipper,target_quantity,start_time_ms,end_time_ms,is_active,is_locked FROM jobs LIMIT 1;");
  tx.exec("SELECT id,job_id,barcode,expected,status,timestamp_ms FROM scans LIMIT 1;");
  tx.commit();
}

} // namespace linecheck::db::postgres
