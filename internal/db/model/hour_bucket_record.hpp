#pragma once

#include <cstdint>
#include <string>

namespace linecheck::db::model {

// Keyed by (job_id, date, hour); date is the local YYYY-MM-DD.
struct HourBucketRecord {
  std::string job_id;
  std::string date;
  uint32_t    hour     = 0;
  uint64_t    shippers = 0;
  uint64_t    pieces   = 0;

  bool operator==(const HourBucketRecord&) const = default;
};

} // namespace linecheck::db::model
