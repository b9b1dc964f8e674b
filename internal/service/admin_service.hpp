#pragma once

#include <cstdint>

#include "linecheck/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace linecheck::service {

inline constexpr uint32_t kSnapshotFormatVersion = 1;

/*
  State export/import. Import is destructive and runs inside the line's
  exclusive section; the snapshot is validated in full before anything
  is deleted.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  linecheck::v1::ExportStateResponse ExportState(const linecheck::v1::ExportStateRequest& req);
  linecheck::v1::ImportStateResponse ImportState(const linecheck::v1::ImportStateRequest& req);

 private:
  ServiceContext ctx_;
};

// Throws util::ValidationError describing the first inconsistency.
void ValidateSnapshot(const linecheck::v1::StateSnapshot& snapshot);

} // namespace linecheck::service
