#pragma once
/**
 * @file stop_signal.hpp
 * @brief Level-triggered, idempotent stop flag with interruptible waits.
 *
 * Every long-lived thread in aqlink owns one. `set()` may be called any
 * number of times from any thread; once set it stays set. Waits return
 * early as soon as the flag is raised.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace aqlink {

class StopSignal {
public:
  void set() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      flag_.store(true);
    }
    cv_.notify_all();
  }

  bool is_set() const { return flag_.load(); }

  /// Sleep up to @p d. Returns true if the signal was raised (before or during the wait).
  template <class Rep, class Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& d) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [this] { return flag_.load(); });
  }

  /// Sleep until @p t. Returns true if the signal was raised.
  template <class Clock, class Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& t) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_until(lk, t, [this] { return flag_.load(); });
  }

private:
  std::atomic<bool> flag_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace aqlink
