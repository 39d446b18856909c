/**
 * @file bounded_queue.hpp
 * @brief Thread-safe, capacity-bounded FIFO with a drop-oldest overflow policy.
 *
 * @details
 * ## Role
 * The sampling queue sits between the sampling threads (producers) and the
 * delivery loop (single consumer). It is the last stop *before* the
 * durability boundary: anything in here is lost on crash, and anything in
 * here may be dropped under pressure. That is acceptable; fresh data beats
 * stale data when the broker has been unreachable for a while.
 *
 * ## Overflow policy
 * `push_drop_oldest()` evicts exactly one item from the front when the queue
 * is full, then appends. Check, evict and append happen under one lock, so
 * concurrent producers can never push the size past `capacity()` and never
 * drop more than one item per push.
 *
 * ## Blocking
 * Only `pop()` blocks, and only up to the caller's timeout. Producers never
 * block.
 */
#ifndef AQLINK_BOUNDED_QUEUE_HPP
#define AQLINK_BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace aqlink {

template <typename T>
class BoundedQueue {
public:
  /// @throws std::invalid_argument if capacity is zero.
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("BoundedQueue capacity must be > 0");
  }

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /**
   * @brief Append @p item, first evicting the oldest item if full.
   * @return true if an older item was dropped to make room.
   */
  bool push_drop_oldest(T item) {
    bool dropped = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (items_.size() >= capacity_) {
        items_.pop_front();
        ++dropped_;
        dropped = true;
      }
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return dropped;
  }

  /**
   * @brief Append only if there is room.
   * @return false if the queue was full (nothing changed).
   */
  bool try_push(T item) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (items_.size() >= capacity_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  /// Remove the oldest item, waiting up to @p timeout for one to arrive.
  template <class Rep, class Period>
  bool pop(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this] { return !items_.empty(); })) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  bool try_pop(T& out) {
    std::lock_guard<std::mutex> lk(mu_);
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
  }

  bool empty() const { return size() == 0; }
  std::size_t capacity() const { return capacity_; }

  /// Items evicted by push_drop_oldest() since construction.
  uint64_t dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<T> items_;
  uint64_t dropped_{0};
};

/// Serialized SensorReadings waiting for the delivery loop.
using SampleQueue = BoundedQueue<std::string>;

} // namespace aqlink

#endif // AQLINK_BOUNDED_QUEUE_HPP
