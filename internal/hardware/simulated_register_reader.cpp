#include "simulated_register_reader.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace brewmon::hardware {

SimulatedRegisterReader::SimulatedRegisterReader(std::optional<std::uint32_t> group_count, ClockFn clock)
    : clock_(clock ? std::move(clock) : ClockFn(&util::Now)), group_count_(group_count) {
}

RegisterSnapshot SimulatedRegisterReader::Read(std::uint32_t group_id) {
  std::unique_lock lock(mutex_);

  if (blocked_) {
    ++blocked_reads_;
    cv_.wait(lock, [this] { return !blocked_; });
    --blocked_reads_;
  }

  ++read_count_;

  if (!available_) {
    throw util::HardwareUnavailable("machine not connected");
  }
  if (auto it = group_available_.find(group_id); it != group_available_.end() && !it->second) {
    throw util::HardwareUnavailable("group " + std::to_string(group_id) + " not responding");
  }

  std::uint16_t word = 0;
  if (auto it = words_.find(group_id); it != words_.end()) {
    word = it->second;
  }
  return DecodeStatusWord(group_id, word, clock_());
}

std::optional<std::uint32_t> SimulatedRegisterReader::GroupCount() {
  std::scoped_lock lock(mutex_);
  if (!available_) {
    throw util::HardwareUnavailable("machine not connected");
  }
  return group_count_;
}

void SimulatedRegisterReader::SetStatusWord(std::uint32_t group_id, std::uint16_t word) {
  std::scoped_lock lock(mutex_);
  words_[group_id] = word;
}

void SimulatedRegisterReader::SetIdle(std::uint32_t group_id) {
  SetStatusWord(group_id, 0);
}

void SimulatedRegisterReader::SetDelivering(std::uint32_t group_id, const std::string& coffee_type) {
  SetStatusWord(group_id, StatusWordForCoffeeType(coffee_type));
}

void SimulatedRegisterReader::SetAvailable(bool available) {
  std::scoped_lock lock(mutex_);
  available_ = available;
}

void SimulatedRegisterReader::SetGroupAvailable(std::uint32_t group_id, bool available) {
  std::scoped_lock lock(mutex_);
  group_available_[group_id] = available;
}

void SimulatedRegisterReader::Block() {
  std::scoped_lock lock(mutex_);
  blocked_ = true;
}

void SimulatedRegisterReader::Release() {
  {
    std::scoped_lock lock(mutex_);
    blocked_ = false;
  }
  cv_.notify_all();
}

std::uint32_t SimulatedRegisterReader::BlockedReads() const {
  std::scoped_lock lock(mutex_);
  return blocked_reads_;
}

std::uint64_t SimulatedRegisterReader::ReadCount() const {
  std::scoped_lock lock(mutex_);
  return read_count_;
}

} // namespace brewmon::hardware
