#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace brewmon::monitor {

inline constexpr std::uint32_t kMinPollIntervalMs = 250;
inline constexpr std::uint32_t kMaxPollIntervalMs = 60000;

/*
  Background cadence driver.

  Calls tick every interval until Stop(). An exception escaping tick is
  handed to on_error and the ticker keeps going. Stop() wakes a sleeping
  ticker immediately and waits for the current tick to finish.
*/
class CycleTicker {
 public:
  using TickFn  = std::function<void()>;
  using ErrorFn = std::function<void(const std::exception&)>;

  CycleTicker(std::chrono::milliseconds interval, TickFn tick, ErrorFn on_error);
  ~CycleTicker();

  CycleTicker(const CycleTicker&)            = delete;
  CycleTicker& operator=(const CycleTicker&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_.load();
  }

  std::uint64_t Ticks() const {
    return ticks_.load();
  }

 private:
  void Run();

  std::chrono::milliseconds interval_;
  TickFn                    tick_;
  ErrorFn                   on_error_;

  std::thread               thread_;
  std::atomic<bool>         running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::mutex                mutex_;
  std::condition_variable   cv_;
};

} // namespace brewmon::monitor
