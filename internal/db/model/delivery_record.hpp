#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "brewmon/v1.hpp"

namespace brewmon::db::model {

/*
  Persistent delivery row (table coffee_delivery).

  - At most one open row (Started/InProgress) per group_number.
  - Timestamps are unix milliseconds; completed_at_ms = 0 means unset.
  - retroactive marks completions whose start was never observed.
*/

struct DeliveryRecord {
  std::uint64_t id = 0;

  std::string   coffee_type;
  std::uint32_t group_number = 0;

  brewmon::v1::DeliveryStatus status       = brewmon::v1::DELIVERY_STATUS_UNSPECIFIED;
  brewmon::v1::TriggerType    trigger_type = brewmon::v1::TRIGGER_TYPE_UNSPECIFIED;

  std::uint64_t started_at_ms   = 0;
  std::uint64_t completed_at_ms = 0;

  std::string error_message;
  bool        retroactive = false;
};

inline bool IsOpen(brewmon::v1::DeliveryStatus status) {
  return status == brewmon::v1::DELIVERY_STATUS_STARTED || status == brewmon::v1::DELIVERY_STATUS_IN_PROGRESS;
}

// Persisted text forms. Stable: reporting tools read these columns directly.

inline const char* StatusToString(brewmon::v1::DeliveryStatus status) {
  switch (status) {
    case brewmon::v1::DELIVERY_STATUS_STARTED:
      return "started";
    case brewmon::v1::DELIVERY_STATUS_IN_PROGRESS:
      return "in_progress";
    case brewmon::v1::DELIVERY_STATUS_COMPLETED:
      return "completed";
    case brewmon::v1::DELIVERY_STATUS_FAILED:
      return "failed";
    default:
      return "unspecified";
  }
}

inline brewmon::v1::DeliveryStatus StatusFromString(std::string_view text) {
  if (text == "started") return brewmon::v1::DELIVERY_STATUS_STARTED;
  if (text == "in_progress") return brewmon::v1::DELIVERY_STATUS_IN_PROGRESS;
  if (text == "completed") return brewmon::v1::DELIVERY_STATUS_COMPLETED;
  if (text == "failed") return brewmon::v1::DELIVERY_STATUS_FAILED;
  return brewmon::v1::DELIVERY_STATUS_UNSPECIFIED;
}

inline const char* TriggerToString(brewmon::v1::TriggerType trigger) {
  switch (trigger) {
    case brewmon::v1::TRIGGER_TYPE_API:
      return "api";
    case brewmon::v1::TRIGGER_TYPE_MANUAL:
      return "manual";
    case brewmon::v1::TRIGGER_TYPE_AUTOMATIC:
      return "automatic";
    default:
      return "unspecified";
  }
}

inline brewmon::v1::TriggerType TriggerFromString(std::string_view text) {
  if (text == "api") return brewmon::v1::TRIGGER_TYPE_API;
  if (text == "manual") return brewmon::v1::TRIGGER_TYPE_MANUAL;
  if (text == "automatic") return brewmon::v1::TRIGGER_TYPE_AUTOMATIC;
  return brewmon::v1::TRIGGER_TYPE_UNSPECIFIED;
}

} // namespace brewmon::db::model
