#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace brewmon::hardware {

enum class ActivityState {
  kIdle,
  kActive,
};

/*
  Per-group status at one instant. Ephemeral; the detector keeps only the
  latest one per group.
*/
struct RegisterSnapshot {
  std::uint32_t              group_id = 0;
  ActivityState              activity_state = ActivityState::kIdle;
  std::optional<std::string> coffee_type_hint;
  util::TimePoint            timestamp{};

  bool IsActive() const {
    return activity_state == ActivityState::kActive;
  }
};

/*
  Selection/status word layout (one 16-bit word per group).

  Bits 0..6 are the dose lamps in priority order; any of them set means
  the group is delivering. Higher bits are ignored.
*/
namespace status_bits {
inline constexpr std::uint16_t kSingleShort  = 1u << 0;
inline constexpr std::uint16_t kSingleMedium = 1u << 1;
inline constexpr std::uint16_t kSingleLong   = 1u << 2;
inline constexpr std::uint16_t kDoubleShort  = 1u << 3;
inline constexpr std::uint16_t kDoubleMedium = 1u << 4;
inline constexpr std::uint16_t kDoubleLong   = 1u << 5;
inline constexpr std::uint16_t kPurge        = 1u << 6;

inline constexpr std::uint16_t kActivityMask = 0x7f;
} // namespace status_bits

inline constexpr const char* kUnknownCoffeeType = "unknown";
inline constexpr const char* kPurgeCoffeeType   = "purge";

// Name of the first set dose bit, or nullopt if none is set.
std::optional<std::string> CoffeeTypeFromStatusWord(std::uint16_t word);

RegisterSnapshot DecodeStatusWord(std::uint32_t group_id, std::uint16_t word, util::TimePoint timestamp);

// Inverse of CoffeeTypeFromStatusWord; 0 for unknown names.
std::uint16_t StatusWordForCoffeeType(const std::string& coffee_type);

} // namespace brewmon::hardware
