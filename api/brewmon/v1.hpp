#pragma once

#include "brewmon/v1/delivery.pb.h"
#include "brewmon/v1/monitor.pb.h"

#include "brewmon/services/v1/delivery_report_service.pb.h"
#include "brewmon/services/v1/monitor_control_service.pb.h"

#include "brewmon/services/v1/delivery_report_service.grpc.pb.h"
#include "brewmon/services/v1/monitor_control_service.grpc.pb.h"

namespace brewmon::v1 {
using namespace ::brewmon::services::v1;
}
