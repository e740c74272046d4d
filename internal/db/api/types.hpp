#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "brewmon/v1.hpp"

namespace brewmon::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

/*
  Delivery query filter. Unset fields match everything.
  Results are ordered newest first (started_at, then id).
*/
struct DeliveryFilter {
  std::optional<brewmon::v1::TriggerType>    trigger_type;
  std::optional<std::uint32_t>               group_number;
  std::optional<brewmon::v1::DeliveryStatus> status;
};

} // namespace brewmon::db
