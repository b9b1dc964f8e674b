#pragma once

#include <cstdint>
#include <string>

#include "linecheck/v1/types.pb.h"

namespace linecheck::db::model {

struct ScanRecord {
  uint64_t               id = 0; // assigned by the repository when 0
  std::string            job_id;
  std::string            barcode;
  std::string            expected;
  linecheck::v1::ScanStatus status       = linecheck::v1::SCAN_STATUS_UNSPECIFIED;
  uint64_t               timestamp_ms = 0;

  bool operator==(const ScanRecord&) const = default;
};

} // namespace linecheck::db::model
