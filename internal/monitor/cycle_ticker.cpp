#include "cycle_ticker.hpp"

#include "internal/observability/logging.hpp"

namespace brewmon::monitor {

CycleTicker::CycleTicker(std::chrono::milliseconds interval, TickFn tick, ErrorFn on_error)
    : interval_(interval), tick_(std::move(tick)), on_error_(std::move(on_error)) {
}

CycleTicker::~CycleTicker() {
  Stop();
}

void CycleTicker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&CycleTicker::Run, this);
  BREWMON_LOG_INFO("cycle ticker started", {observability::IntField("interval_ms", interval_.count())});
}

void CycleTicker::Stop() {
  {
    std::scoped_lock lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  BREWMON_LOG_INFO("cycle ticker stopped", {observability::IntField("ticks", static_cast<std::int64_t>(ticks_.load()))});
}

void CycleTicker::Run() {
  while (running_) {
    try {
      tick_();
    } catch (const std::exception& e) {
      BREWMON_LOG_ERROR("monitoring error", {observability::StringField("error", e.what())});
      if (on_error_) {
        try {
          on_error_(e);
        } catch (const std::exception& handler_error) {
          BREWMON_LOG_ERROR("monitoring error handler failed", {observability::StringField("error", handler_error.what())});
        }
      }
    }
    ++ticks_;

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
  }
}

} // namespace brewmon::monitor
