#pragma once

#include <cstdint>
#include <string>

namespace linecheck::db::model {

struct ShiftStatRecord {
  std::string date;
  uint64_t    total_shippers = 0;
  uint64_t    total_pieces   = 0;
  uint64_t    total_pass     = 0;
  uint64_t    total_fail     = 0;
  uint64_t    jobs_completed = 0;

  bool operator==(const ShiftStatRecord&) const = default;
};

} // namespace linecheck::db::model
