#include "internal/monitor/cycle_ticker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using brewmon::monitor::CycleTicker;

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

void TestTicksUntilStopped() {
  std::atomic<int> calls{0};
  CycleTicker      ticker(std::chrono::milliseconds(5), [&] { ++calls; }, {});

  assert(!ticker.Running());
  ticker.Start();
  assert(ticker.Running());
  assert(WaitFor([&] { return calls.load() >= 3; }, std::chrono::seconds(5)));

  ticker.Stop();
  assert(!ticker.Running());
  const auto after_stop = calls.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(calls.load() == after_stop);
  assert(ticker.Ticks() == static_cast<uint64_t>(after_stop));
}

void TestStopWakesLongSleep() {
  std::atomic<int> calls{0};
  CycleTicker      ticker(std::chrono::minutes(10), [&] { ++calls; }, {});

  ticker.Start();
  assert(WaitFor([&] { return calls.load() == 1; }, std::chrono::seconds(5)));

  const auto started = std::chrono::steady_clock::now();
  ticker.Stop();
  assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
}

void TestErrorsAreHandedOffAndTickingContinues() {
  std::atomic<int> calls{0};
  std::atomic<int> errors{0};
  std::string      last_error;
  std::atomic<bool> error_seen{false};

  CycleTicker ticker(
      std::chrono::milliseconds(5),
      [&] {
        if (++calls % 2 == 1) throw std::runtime_error("register read timed out");
      },
      [&](const std::exception& e) {
        if (!error_seen.exchange(true)) last_error = e.what();
        ++errors;
      });

  ticker.Start();
  assert(WaitFor([&] { return calls.load() >= 4; }, std::chrono::seconds(5)));
  ticker.Stop();

  assert(errors.load() >= 2);
  assert(last_error == "register read timed out");
}

void TestThrowingErrorHandlerDoesNotStopTicker() {
  std::atomic<int> calls{0};
  CycleTicker      ticker(
      std::chrono::milliseconds(5),
      [&] {
        ++calls;
        throw std::runtime_error("cycle failed");
      },
      [](const std::exception&) { throw std::runtime_error("log store down"); });

  ticker.Start();
  assert(WaitFor([&] { return calls.load() >= 3; }, std::chrono::seconds(5)));
  ticker.Stop();
}

void TestStartAndStopAreIdempotent() {
  std::atomic<int> calls{0};
  CycleTicker      ticker(std::chrono::milliseconds(5), [&] { ++calls; }, {});

  ticker.Stop();
  ticker.Start();
  ticker.Start();
  assert(WaitFor([&] { return calls.load() >= 1; }, std::chrono::seconds(5)));
  ticker.Stop();
  ticker.Stop();
  assert(!ticker.Running());
}

} // namespace

int main() {
  TestTicksUntilStopped();
  TestStopWakesLongSleep();
  TestErrorsAreHandedOffAndTickingContinues();
  TestThrowingErrorHandlerDoesNotStopTicker();
  TestStartAndStopAreIdempotent();

  std::cout << "brewmon_unit_cycle_ticker: pass\n";
  return 0;
}
