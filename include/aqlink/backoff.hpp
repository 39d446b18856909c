/**
 * @file backoff.hpp
 * @brief Retry pacing for the delivery loop.
 *
 * @details
 * ExponentialBackoff doubles a running delay on every failure, capped at
 * `max`, and applies multiplicative jitter to the value it returns:
 * ```
 *   failure: current = min(current * 2, max)
 *            return current * (1 + U(-jitter, +jitter))
 *   success: current = base
 *            return 0
 * ```
 * With the defaults (1 s, 60 s, 0.5) the first failure waits 1 to 3 s and
 * the sixth and later ones 30 to 90 s.
 */
#ifndef AQLINK_BACKOFF_HPP
#define AQLINK_BACKOFF_HPP

#include <chrono>
#include <cstdint>
#include <random>

namespace aqlink {

using Seconds = std::chrono::duration<double>;

class BackoffPolicy {
public:
  virtual ~BackoffPolicy() = default;

  /// Report the outcome of an attempt; returns how long to wait before the next.
  virtual Seconds next_delay(bool success) = 0;
};

class ExponentialBackoff : public BackoffPolicy {
public:
  /// @throws std::invalid_argument on base <= 0, max < base or jitter outside [0, 1].
  explicit ExponentialBackoff(Seconds base = Seconds(1.0),
                              Seconds max = Seconds(60.0),
                              double jitter = 0.5,
                              uint32_t seed = std::random_device{}());

  Seconds next_delay(bool success) override;

  /// Un-jittered delay the next failure will grow from.
  Seconds current() const { return current_; }

  Seconds base() const { return base_; }
  Seconds max() const { return max_; }
  double jitter() const { return jitter_; }

private:
  Seconds base_;
  Seconds max_;
  double  jitter_;
  Seconds current_;
  std::mt19937 rng_;
};

} // namespace aqlink

#endif // AQLINK_BACKOFF_HPP
