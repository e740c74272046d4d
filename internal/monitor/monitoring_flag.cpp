#include "monitoring_flag.hpp"

namespace brewmon::monitor {

namespace {

constexpr std::uint64_t kEnabledBit = 1;

} // namespace

MonitoringFlag::MonitoringFlag(bool enabled) : word_(enabled ? ((1u << 1) | kEnabledBit) : 0) {
}

bool MonitoringFlag::Enable() {
  auto current = word_.load(std::memory_order_acquire);
  for (;;) {
    if (current & kEnabledBit) return false;
    // next epoch, enabled
    const auto next = (((current >> 1) + 1) << 1) | kEnabledBit;
    if (word_.compare_exchange_weak(current, next, std::memory_order_acq_rel, std::memory_order_acquire)) return true;
  }
}

bool MonitoringFlag::Disable() {
  auto previous = word_.fetch_and(~kEnabledBit, std::memory_order_acq_rel);
  return (previous & kEnabledBit) != 0;
}

bool MonitoringFlag::IsEnabled() const {
  return (word_.load(std::memory_order_acquire) & kEnabledBit) != 0;
}

MonitoringFlag::State MonitoringFlag::Load() const {
  const auto word = word_.load(std::memory_order_acquire);
  return {(word & kEnabledBit) != 0, word >> 1};
}

} // namespace brewmon::monitor
