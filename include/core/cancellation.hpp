#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <stop_token>

namespace asset_agent::core {

// Blocks until the deadline passes or stop is requested. Returns false when stopped.
template <typename Clock, typename Duration>
bool sleep_until(const std::stop_token& stop, const std::chrono::time_point<Clock, Duration>& deadline) {
  std::mutex mutex;
  std::condition_variable_any wakeup;
  std::unique_lock<std::mutex> lock(mutex);
  wakeup.wait_until(lock, stop, deadline, [] { return false; });
  return !stop.stop_requested();
}

template <typename Rep, typename Period>
bool sleep_for(const std::stop_token& stop, const std::chrono::duration<Rep, Period>& duration) {
  return sleep_until(stop, std::chrono::steady_clock::now() + duration);
}

// Fixed-rate tick source. The first tick fires one period after construction and
// ticks that were missed while the caller was busy are dropped, not queued.
class PeriodicTimer {
 public:
  // Throws std::invalid_argument unless period is positive.
  explicit PeriodicTimer(const std::chrono::steady_clock::duration period)
      : period_(period), next_wakeup_(std::chrono::steady_clock::now() + period) {
    if (period <= std::chrono::steady_clock::duration::zero()) {
      throw std::invalid_argument("timer period must be positive");
    }
  }

  bool wait(const std::stop_token& stop) {
    if (!sleep_until(stop, next_wakeup_)) {
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    next_wakeup_ += period_;
    while (next_wakeup_ <= now) {
      next_wakeup_ += period_;
    }
    return true;
  }

  [[nodiscard]] std::chrono::steady_clock::duration period() const noexcept { return period_; }

 private:
  std::chrono::steady_clock::duration period_;
  std::chrono::steady_clock::time_point next_wakeup_;
};

}  // namespace asset_agent::core
