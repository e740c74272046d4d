#include "delivery_tracker.hpp"

#include <string>

#include "internal/hardware/register_snapshot.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace brewmon::monitor {

using db::model::DeliveryRecord;
using namespace brewmon::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kHardwareUnavailableMessage = "hardware unavailable";

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (!result) {
    throw util::RecordStoreWriteFailed(what + ": " + db::ErrorCodeName(result.code) + " " + result.message);
  }
}

const char* LogTypeFor(const std::string& coffee_type) {
  return coffee_type == hardware::kPurgeCoffeeType ? db::model::kLogPurge : db::model::kLogManualDelivery;
}

std::string GroupText(std::uint32_t group) {
  return "group " + std::to_string(group);
}

} // namespace

const char* TrackerActionName(TrackerAction action) {
  switch (action) {
    case TrackerAction::kNone:
      return "none";
    case TrackerAction::kCreated:
      return "created";
    case TrackerAction::kCompleted:
      return "completed";
    case TrackerAction::kRetroactive:
      return "retroactive";
    case TrackerAction::kFailed:
      return "failed";
    case TrackerAction::kDuplicate:
      return "duplicate";
    case TrackerAction::kNotOwned:
      return "not_owned";
    case TrackerAction::kReconciled:
      return "reconciled";
    case TrackerAction::kFailureEnded:
      return "failure_ended";
  }
  return "unknown";
}

DeliveryTracker::DeliveryTracker(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

TrackerOutcome DeliveryTracker::Apply(const TransitionEvent& event) {
  if (event.kind == TransitionKind::kNoChange && !(event.baseline && !event.active)) {
    return {};
  }

  try {
    auto           tx = repository_->Begin();
    TrackerOutcome outcome;
    switch (event.kind) {
      case TransitionKind::kPressStarted:
        try {
          outcome = OnPressStarted(*tx, event);
        } catch (const util::DuplicateOpenRecord& e) {
          BREWMON_LOG_WARN("duplicate start ignored", {IntField("group", event.group_id), StringField("error", e.what())});
          auto open = repository_->FindOpenDelivery(*tx, event.group_id);
          tx->Rollback();
          return {TrackerAction::kDuplicate, open};
        }
        break;
      case TransitionKind::kPressCompleted:
        outcome = OnPressCompleted(*tx, event);
        break;
      case TransitionKind::kReadFailed:
        outcome = OnReadFailed(*tx, event);
        break;
      case TransitionKind::kNoChange:
        outcome = OnIdleBaseline(*tx, event);
        break;
    }

    if (outcome.action == TrackerAction::kNone || outcome.action == TrackerAction::kNotOwned) {
      tx->Rollback();
    } else {
      tx->Commit();
    }
    return outcome;
  } catch (const util::RecordStoreWriteFailed&) {
    throw;
  } catch (const std::exception& e) {
    throw util::RecordStoreWriteFailed(std::string("record store: ") + e.what());
  }
}

TrackerOutcome DeliveryTracker::OnPressStarted(db::Transaction& tx, const TransitionEvent& event) {
  if (auto open = repository_->FindOpenDelivery(tx, event.group_id)) {
    throw util::DuplicateOpenRecord(GroupText(event.group_id) + " already has open delivery " + std::to_string(open->id));
  }

  const auto at_ms = util::ToUnixMillis(event.observed_at);

  DeliveryRecord record;
  record.coffee_type   = event.coffee_type_hint.value_or(hardware::kUnknownCoffeeType);
  record.group_number  = event.group_id;
  record.status        = DELIVERY_STATUS_STARTED;
  record.trigger_type  = TRIGGER_TYPE_MANUAL;
  record.started_at_ms = at_ms;
  ThrowIfError(repository_->CreateDelivery(tx, record), "create delivery");

  WriteLog(tx, LogTypeFor(record.coffee_type), record.group_number,
           "Manual " + record.coffee_type + " delivery started via physical button on group " + std::to_string(record.group_number), at_ms);

  BREWMON_LOG_INFO("manual delivery started", {IntField("group", record.group_number), StringField("coffee_type", record.coffee_type),
                                              IntField("delivery_id", static_cast<std::int64_t>(record.id))});
  return {TrackerAction::kCreated, record};
}

TrackerOutcome DeliveryTracker::OnPressCompleted(db::Transaction& tx, const TransitionEvent& event) {
  const auto at_ms = util::ToUnixMillis(event.observed_at);
  auto       open  = repository_->FindOpenDelivery(tx, event.group_id);

  if (!open && event.interrupted) {
    if (auto failed = FindInterruptedDelivery(tx, event.group_id)) {
      failed->completed_at_ms = at_ms;
      ThrowIfError(repository_->UpdateDelivery(tx, *failed), "end failed delivery");

      WriteLog(tx, LogTypeFor(failed->coffee_type), failed->group_number,
               "Manual " + failed->coffee_type + " delivery on group " + std::to_string(failed->group_number) + " ended after connection loss",
               at_ms);

      BREWMON_LOG_INFO("failed delivery ended", {IntField("group", failed->group_number), IntField("delivery_id", static_cast<std::int64_t>(failed->id))});
      return {TrackerAction::kFailureEnded, failed};
    }
  }

  if (!open) {
    DeliveryRecord record;
    record.coffee_type     = event.coffee_type_hint.value_or(hardware::kUnknownCoffeeType);
    record.group_number    = event.group_id;
    record.status          = DELIVERY_STATUS_COMPLETED;
    record.trigger_type    = TRIGGER_TYPE_MANUAL;
    record.started_at_ms   = at_ms;
    record.completed_at_ms = at_ms;
    record.retroactive     = true;
    ThrowIfError(repository_->CreateDelivery(tx, record), "create retroactive delivery");

    WriteLog(tx, LogTypeFor(record.coffee_type), record.group_number,
             "Manual " + record.coffee_type + " delivery completed on group " + std::to_string(record.group_number) + " (start not observed)",
             at_ms);

    BREWMON_LOG_WARN("completion without observed start", {IntField("group", record.group_number), StringField("coffee_type", record.coffee_type),
                                                          IntField("delivery_id", static_cast<std::int64_t>(record.id))});
    return {TrackerAction::kRetroactive, record};
  }

  if (open->trigger_type != TRIGGER_TYPE_MANUAL) {
    BREWMON_LOG_DEBUG("open delivery owned by another trigger", {IntField("group", event.group_id), IntField("delivery_id", static_cast<std::int64_t>(open->id)),
                                                                 StringField("trigger_type", db::model::TriggerToString(open->trigger_type))});
    return {TrackerAction::kNotOwned, open};
  }

  open->status          = DELIVERY_STATUS_COMPLETED;
  open->completed_at_ms = at_ms;
  ThrowIfError(repository_->UpdateDelivery(tx, *open), "complete delivery");

  WriteLog(tx, LogTypeFor(open->coffee_type), open->group_number,
           "Manual " + open->coffee_type + " delivery completed on group " + std::to_string(open->group_number), at_ms);

  BREWMON_LOG_INFO("manual delivery completed", {IntField("group", open->group_number), StringField("coffee_type", open->coffee_type),
                                                IntField("delivery_id", static_cast<std::int64_t>(open->id)),
                                                IntField("duration_ms", static_cast<std::int64_t>(at_ms - open->started_at_ms))});
  return {TrackerAction::kCompleted, open};
}

TrackerOutcome DeliveryTracker::OnReadFailed(db::Transaction& tx, const TransitionEvent& event) {
  auto open = repository_->FindOpenDelivery(tx, event.group_id);
  if (!open) {
    return {};
  }

  const auto at_ms     = util::ToUnixMillis(event.observed_at);
  open->status         = DELIVERY_STATUS_FAILED;
  open->error_message  = kHardwareUnavailableMessage;
  ThrowIfError(repository_->UpdateDelivery(tx, *open), "fail delivery");

  WriteLog(tx, db::model::kLogConnectionIssue, open->group_number,
           open->coffee_type + " delivery on group " + std::to_string(open->group_number) + " failed: " + kHardwareUnavailableMessage +
               (event.error.empty() ? "" : " (" + event.error + ")"),
           at_ms);

  BREWMON_LOG_WARN("delivery failed", {IntField("group", open->group_number), IntField("delivery_id", static_cast<std::int64_t>(open->id)),
                                      StringField("error", event.error)});
  return {TrackerAction::kFailed, open};
}

TrackerOutcome DeliveryTracker::OnIdleBaseline(db::Transaction& tx, const TransitionEvent& event) {
  auto open = repository_->FindOpenDelivery(tx, event.group_id);
  if (!open || open->trigger_type != TRIGGER_TYPE_MANUAL) {
    return {};
  }

  const auto at_ms      = util::ToUnixMillis(event.observed_at);
  open->status          = DELIVERY_STATUS_COMPLETED;
  open->completed_at_ms = at_ms;
  open->retroactive     = true;
  ThrowIfError(repository_->UpdateDelivery(tx, *open), "close stale delivery");

  WriteLog(tx, LogTypeFor(open->coffee_type), open->group_number,
           "Manual " + open->coffee_type + " delivery completed on group " + std::to_string(open->group_number) + " (end not observed)", at_ms);

  BREWMON_LOG_WARN("open delivery closed on idle baseline", {IntField("group", open->group_number), StringField("coffee_type", open->coffee_type),
                                                             IntField("delivery_id", static_cast<std::int64_t>(open->id))});
  return {TrackerAction::kReconciled, open};
}

std::optional<DeliveryRecord> DeliveryTracker::FindInterruptedDelivery(db::Transaction& tx, std::uint32_t group) {
  db::DeliveryFilter filter;
  filter.trigger_type = TRIGGER_TYPE_MANUAL;
  filter.group_number = group;

  db::Pagination page;
  page.limit = 1;

  auto latest = repository_->ListDeliveries(tx, filter, page);
  if (latest.empty()) return std::nullopt;

  auto& record = latest.front();
  if (record.status != DELIVERY_STATUS_FAILED || record.error_message != kHardwareUnavailableMessage || record.completed_at_ms != 0) {
    return std::nullopt;
  }
  return record;
}

void DeliveryTracker::WriteLog(db::Transaction& tx, const char* log_type, std::uint32_t group, const std::string& message, std::uint64_t at_ms) {
  db::model::MaintenanceLogRecord entry;
  entry.log_type      = log_type;
  entry.group_number  = group;
  entry.message       = message;
  entry.created_at_ms = at_ms;
  ThrowIfError(repository_->InsertMaintenanceLog(tx, entry), "maintenance log");
}

std::uint64_t DeliveryTracker::CountOpenManual() {
  try {
    auto               tx = repository_->Begin();
    db::DeliveryFilter filter;
    filter.trigger_type = TRIGGER_TYPE_MANUAL;

    filter.status = DELIVERY_STATUS_STARTED;
    auto count    = repository_->CountDeliveries(*tx, filter);
    filter.status = DELIVERY_STATUS_IN_PROGRESS;
    count += repository_->CountDeliveries(*tx, filter);

    tx->Rollback();
    return count;
  } catch (const std::exception& e) {
    throw util::RecordStoreWriteFailed(std::string("record store: ") + e.what());
  }
}

} // namespace brewmon::monitor
