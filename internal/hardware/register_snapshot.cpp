#include "register_snapshot.hpp"

#include <array>
#include <utility>

namespace brewmon::hardware {

namespace {

constexpr std::array<std::pair<std::uint16_t, const char*>, 7> kDoseBits = {{
    {status_bits::kSingleShort, "single_short"},
    {status_bits::kSingleMedium, "single_medium"},
    {status_bits::kSingleLong, "single_long"},
    {status_bits::kDoubleShort, "double_short"},
    {status_bits::kDoubleMedium, "double_medium"},
    {status_bits::kDoubleLong, "double_long"},
    {status_bits::kPurge, kPurgeCoffeeType},
}};

} // namespace

std::optional<std::string> CoffeeTypeFromStatusWord(std::uint16_t word) {
  for (const auto& [bit, name] : kDoseBits) {
    if (word & bit) return std::string(name);
  }
  return std::nullopt;
}

RegisterSnapshot DecodeStatusWord(std::uint32_t group_id, std::uint16_t word, util::TimePoint timestamp) {
  RegisterSnapshot snapshot;
  snapshot.group_id         = group_id;
  snapshot.activity_state   = (word & status_bits::kActivityMask) ? ActivityState::kActive : ActivityState::kIdle;
  snapshot.coffee_type_hint = CoffeeTypeFromStatusWord(word);
  snapshot.timestamp        = timestamp;
  return snapshot;
}

std::uint16_t StatusWordForCoffeeType(const std::string& coffee_type) {
  for (const auto& [bit, name] : kDoseBits) {
    if (coffee_type == name) return bit;
  }
  return 0;
}

} // namespace brewmon::hardware
