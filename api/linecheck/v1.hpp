#pragma once

#include "linecheck/v1/types.pb.h"
#include "linecheck/v1/events.pb.h"

#include "linecheck/v1/line_service.pb.h"
#include "linecheck/v1/admin_service.pb.h"

#include "linecheck/v1/line_service.grpc.pb.h"
#include "linecheck/v1/admin_service.grpc.pb.h"
