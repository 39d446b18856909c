/**
 * @page aq-delivery aqlink Delivery Loop
 * @file delivery_loop.hpp
 * @brief Single consumer that drains the sampling queue into the buffered publisher.
 *
 * @details
 * OWNERSHIP
 * ---------
 * The loop receives a *factory* for its BufferedPublisher, not the publisher
 * itself. The factory runs inside the loop thread, which is what keeps the
 * SQLite handle confined to the one thread that uses it. If the factory
 * throws or returns null, the failure is logged and the loop retries it on
 * the backoff schedule.
 *
 * ORDER
 * -----
 * ```
 *   backlog (front) ── non-empty ──► next envelope
 *        │ empty
 *        ▼
 *   queue.pop(poll_interval) ── timeout ──► re-check stop, loop
 *        │ payload
 *        ▼
 *   publisher.deliver(env)
 *        ├─ ok   ─► backoff.next_delay(true)
 *        └─ fail ─► backlog.push_front(env); wait next_delay(false)
 * ```
 * A failed envelope goes back to the front, so it is retried before anything
 * newer and keeps its buffer row id. With `resume_unsent` set, rows left
 * unsent by a previous run seed the backlog once the publisher exists.
 *
 * STATES
 * ------
 * Idle to Running to Draining to Stopped. Draining is the short window in which
 * the loop has seen the stop signal and is closing its publisher.
 * Backoff waits are interrupted by `stop()`.
 */
#ifndef AQLINK_DELIVERY_LOOP_HPP
#define AQLINK_DELIVERY_LOOP_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "aqlink/backoff.hpp"
#include "aqlink/bounded_queue.hpp"
#include "aqlink/buffered_publisher.hpp"
#include "aqlink/stop_signal.hpp"

namespace aqlink {

using OutboundFactory = std::function<std::unique_ptr<BufferedPublisher>()>;

struct DeliveryLoopOptions {
  std::chrono::milliseconds poll_interval{1000};
  bool resume_unsent{true};
};

class DeliveryLoop {
public:
  enum class State { Idle, Running, Draining, Stopped };

  DeliveryLoop(SampleQueue& queue,
               OutboundFactory factory,
               std::unique_ptr<BackoffPolicy> backoff,
               DeliveryLoopOptions opts = {});

  /// Stops and joins (unbounded) if the owner did not.
  ~DeliveryLoop();

  DeliveryLoop(const DeliveryLoop&) = delete;
  DeliveryLoop& operator=(const DeliveryLoop&) = delete;

  void start();

  /// Idempotent; safe from any thread.
  void stop();

  /// @return true if the thread finished within @p timeout and was joined.
  bool join_for(std::chrono::milliseconds timeout);

  State state() const { return state_.load(); }

  uint64_t delivered() const       { return delivered_.load(); }
  uint64_t failed_attempts() const { return failed_.load(); }
  std::size_t backlog_size() const { return backlog_size_.load(); }

private:
  void run();
  std::unique_ptr<BufferedPublisher> build_publisher();
  void pause_after_failure();

  SampleQueue& queue_;
  OutboundFactory factory_;
  std::unique_ptr<BackoffPolicy> backoff_;
  DeliveryLoopOptions opts_;

  std::thread thread_;
  StopSignal stop_;
  StopSignal done_;
  std::atomic<State> state_{State::Idle};

  std::atomic<uint64_t> delivered_{0};
  std::atomic<uint64_t> failed_{0};
  std::atomic<std::size_t> backlog_size_{0};
};

const char* to_string(DeliveryLoop::State s);

} // namespace aqlink

#endif // AQLINK_DELIVERY_LOOP_HPP
