// -----------------------------------------------------------------------------
// backoff.cpp: exponential backoff with jitter
// -----------------------------------------------------------------------------
#include "aqlink/backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace aqlink {

ExponentialBackoff::ExponentialBackoff(Seconds base, Seconds max, double jitter, uint32_t seed)
: base_(base), max_(max), jitter_(jitter), current_(base), rng_(seed) {
  if (base_.count() <= 0.0) throw std::invalid_argument("backoff base must be > 0");
  if (max_ < base_)         throw std::invalid_argument("backoff max must be >= base");
  if (jitter_ < 0.0 || jitter_ > 1.0) throw std::invalid_argument("backoff jitter must be in [0, 1]");
}

Seconds ExponentialBackoff::next_delay(bool success) {
  if (success) {
    current_ = base_;
    return Seconds(0.0);
  }

  current_ = std::min(current_ * 2.0, max_);
  if (jitter_ == 0.0) return current_;

  std::uniform_real_distribution<double> dist(-jitter_, jitter_);
  return current_ * (1.0 + dist(rng_));
}

} // namespace aqlink
