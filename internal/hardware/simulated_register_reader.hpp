#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "register_reader.hpp"

namespace brewmon::hardware {

/*
  Settable register bank.

  Thread-safe; words can be changed while a cycle is reading. Groups
  never set read as idle. Individual groups or the whole bank can be
  marked unavailable, and reads can be held open with Block()/Release()
  to exercise overlapping cycles.
*/
class SimulatedRegisterReader final : public RegisterReader {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit SimulatedRegisterReader(std::optional<std::uint32_t> group_count = std::nullopt, ClockFn clock = {});

  RegisterSnapshot             Read(std::uint32_t group_id) override;
  std::optional<std::uint32_t> GroupCount() override;

  void SetStatusWord(std::uint32_t group_id, std::uint16_t word);
  void SetIdle(std::uint32_t group_id);
  // Sets the dose bit for coffee_type (unknown names set no bit).
  void SetDelivering(std::uint32_t group_id, const std::string& coffee_type);

  void SetAvailable(bool available);
  void SetGroupAvailable(std::uint32_t group_id, bool available);

  // While blocked, Read() waits until Release().
  void Block();
  void Release();
  // Number of Read() calls currently waiting on Block().
  std::uint32_t BlockedReads() const;

  std::uint64_t ReadCount() const;

 private:
  ClockFn                      clock_;
  std::optional<std::uint32_t> group_count_;

  mutable std::mutex                       mutex_;
  std::condition_variable                  cv_;
  std::map<std::uint32_t, std::uint16_t>   words_;
  std::map<std::uint32_t, bool>            group_available_;
  bool                                     available_     = true;
  bool                                     blocked_       = false;
  std::uint32_t                            blocked_reads_ = 0;
  std::uint64_t                            read_count_    = 0;
};

} // namespace brewmon::hardware
