/**
 * @file sensor_thread.hpp
 * @brief Periodic sampling thread: driver -> SensorReading -> SampleQueue.
 *
 * @details
 * ## Timing
 * Ticks are scheduled on a fixed grid: `next = previous + interval`, never
 * `now + interval`. A slow sensor read (retries, serial timeouts) therefore
 * delays one sample but does not shift every later one. If a read overruns
 * a whole interval the following ticks fire back-to-back until the thread is
 * on the grid again.
 *
 * ## Per tick
 * ```
 *   driver() ── nullopt ──► skip (empty cycle)
 *       │
 *       └─ reading ──► SensorReading{wall ts, device_id} ──► to_string()
 *                                                         ──► queue.push_drop_oldest()
 * ```
 * Anything the driver throws is logged and counted; the cycle is skipped and
 * the thread keeps going.
 *
 * ## Stop
 * Cooperative. `stop()` raises a level-triggered signal that also interrupts
 * the wait between ticks. `join_for()` gives the owner a bounded join.
 */
#ifndef AQLINK_SENSOR_THREAD_HPP
#define AQLINK_SENSOR_THREAD_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "aqlink/bounded_queue.hpp"
#include "aqlink/reading.hpp"
#include "aqlink/stop_signal.hpp"

namespace aqlink {

class SensorThread {
public:
  /// Returns a reading, or nullopt for "nothing this cycle".
  using Driver = std::function<std::optional<PmReading>()>;

  SensorThread(std::string name,
               std::chrono::milliseconds interval,
               std::string device_id,
               Driver driver,
               SampleQueue& out);

  /// Stops and joins (unbounded) if the owner did not.
  ~SensorThread();

  SensorThread(const SensorThread&) = delete;
  SensorThread& operator=(const SensorThread&) = delete;

  void start();

  /// Idempotent; safe from any thread.
  void stop();

  /**
   * @brief Wait up to @p timeout for the thread to finish, then join it.
   * @return true if the thread is no longer running.
   */
  bool join_for(std::chrono::milliseconds timeout);

  const std::string& name() const { return name_; }

  uint64_t samples() const      { return samples_.load(); }
  uint64_t empty_cycles() const { return empty_cycles_.load(); }
  uint64_t faults() const       { return faults_.load(); }

private:
  void run();
  void sample_once();

  std::string name_;
  std::chrono::milliseconds interval_;
  std::string device_id_;
  Driver driver_;
  SampleQueue& out_;

  std::thread thread_;
  StopSignal stop_;
  StopSignal done_;

  std::atomic<uint64_t> samples_{0};
  std::atomic<uint64_t> empty_cycles_{0};
  std::atomic<uint64_t> faults_{0};
};

} // namespace aqlink

#endif // AQLINK_SENSOR_THREAD_HPP
