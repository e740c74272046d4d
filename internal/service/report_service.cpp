#include "report_service.hpp"

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/monitor/poll_cycle.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace brewmon::service {

using namespace brewmon::v1;

namespace {

uint32_t ResolvePageSize(uint32_t requested) {
  if (requested == 0) return kDefaultPageSize;
  if (requested > kMaxPageSize) {
    throw util::InvalidArgument("limit must be at most " + std::to_string(kMaxPageSize));
  }
  return requested;
}

void ToProto(const db::model::DeliveryRecord& record, Delivery* out) {
  out->set_id(record.id);
  out->set_coffee_type(record.coffee_type);
  out->set_group_number(record.group_number);
  out->set_status(record.status);
  out->set_trigger_type(record.trigger_type);
  *out->mutable_started_at() = util::MillisToProto(record.started_at_ms);
  if (record.completed_at_ms != 0) {
    *out->mutable_completed_at() = util::MillisToProto(record.completed_at_ms);
  }
  out->set_error_message(record.error_message);
  out->set_retroactive(record.retroactive);
}

void ToProto(const db::model::MaintenanceLogRecord& record, MaintenanceLogEntry* out) {
  out->set_id(record.id);
  out->set_log_type(record.log_type);
  out->set_group_number(record.group_number);
  out->set_message(record.message);
  out->set_resolved(record.resolved);
  *out->mutable_created_at() = util::MillisToProto(record.created_at_ms);
}

} // namespace

ReportService::ReportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListManualDeliveriesResponse ReportService::ListManualDeliveries(const ListManualDeliveriesRequest& req) {
  return ObserveRpc("ReportService.ListManualDeliveries", [&] {
    if (req.group_number() > monitor::kMaxGroupCount) {
      throw util::InvalidArgument("group_number must be between 1 and " + std::to_string(monitor::kMaxGroupCount));
    }
    if (!DeliveryStatus_IsValid(req.status())) {
      throw util::InvalidArgument("unknown delivery status " + std::to_string(req.status()));
    }

    db::DeliveryFilter filter;
    filter.trigger_type = TRIGGER_TYPE_MANUAL;
    if (req.group_number() != 0) filter.group_number = req.group_number();
    if (req.status() != DELIVERY_STATUS_UNSPECIFIED) filter.status = req.status();

    db::Pagination page;
    page.limit  = ResolvePageSize(req.limit());
    page.offset = req.offset();

    auto tx      = ctx_.repository->Begin();
    auto records = ctx_.repository->ListDeliveries(*tx, filter, page);
    auto total   = ctx_.repository->CountDeliveries(*tx, filter);
    tx->Rollback();

    ListManualDeliveriesResponse resp;
    for (const auto& record : records) {
      ToProto(record, resp.add_deliveries());
    }
    resp.set_total_count(total);
    return resp;
  });
}

ListMaintenanceLogsResponse ReportService::ListMaintenanceLogs(const ListMaintenanceLogsRequest& req) {
  return ObserveRpc("ReportService.ListMaintenanceLogs", [&] {
    const auto limit = ResolvePageSize(req.limit());

    auto tx      = ctx_.repository->Begin();
    auto entries = ctx_.repository->ListMaintenanceLogs(*tx, limit);
    tx->Rollback();

    ListMaintenanceLogsResponse resp;
    for (const auto& entry : entries) {
      ToProto(entry, resp.add_entries());
    }
    return resp;
  });
}

} // namespace brewmon::service
