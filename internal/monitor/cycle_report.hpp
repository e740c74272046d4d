#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace brewmon::monitor {

enum class CycleOutcome {
  kDisabled,
  kSkipped,
  kCompleted,
  kDisconnected,
};

enum class ActivityType {
  kDeliveryStarted,
  kDeliveryCompleted,
  kDeliveryFailed,
  kError,
};

const char* CycleOutcomeName(CycleOutcome outcome);
const char* ActivityTypeName(ActivityType type);

struct CycleActivity {
  ActivityType  type         = ActivityType::kError;
  std::uint32_t group_number = 0;
  std::string   coffee_type;
  std::uint64_t delivery_id = 0;
  std::string   message;
};

struct CycleReport {
  CycleOutcome               outcome = CycleOutcome::kDisabled;
  util::TimePoint            timestamp{};
  std::vector<CycleActivity> activities;
  std::uint64_t              open_deliveries = 0;
};

} // namespace brewmon::monitor
