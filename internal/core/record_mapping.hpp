#pragma once

#include <cstdint>

#include "internal/db/model/hour_bucket_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/scan_record.hpp"
#include "internal/db/model/shift_stat_record.hpp"
#include "linecheck/v1/types.pb.h"

namespace linecheck::core {

google::protobuf::Timestamp TimestampFromMillis(uint64_t ms);
uint64_t                    MillisFromTimestamp(const google::protobuf::Timestamp& ts);

linecheck::v1::Job        ToProto(const db::model::JobRecord& record);
linecheck::v1::Scan       ToProto(const db::model::ScanRecord& record);
linecheck::v1::HourBucket ToProto(const db::model::HourBucketRecord& record);
linecheck::v1::ShiftStat  ToProto(const db::model::ShiftStatRecord& record);

db::model::JobRecord        FromProto(const linecheck::v1::Job& job);
db::model::ScanRecord       FromProto(const linecheck::v1::Scan& scan);
db::model::HourBucketRecord FromProto(const linecheck::v1::HourBucket& bucket);
db::model::ShiftStatRecord  FromProto(const linecheck::v1::ShiftStat& shift);

} // namespace linecheck::core
