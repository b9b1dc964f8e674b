#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace linecheck::db::model {

struct JobRecord {
  std::string             job_id;
  std::string             expected_barcode;
  int64_t                 pieces_per_shipper = 1;
  int64_t                 target_quantity    = 0;
  uint64_t                start_time_ms      = 0;
  std::optional<uint64_t> end_time_ms;
  bool                    is_active = false;

  uint64_t total_scans  = 0;
  uint64_t pass_count   = 0;
  uint64_t fail_count   = 0;
  uint64_t total_pieces = 0;

  // Line halted by a FAIL on this job and not yet released by a supervisor PIN.
  bool is_locked = false;

  bool operator==(const JobRecord&) const = default;
};

} // namespace linecheck::db::model
