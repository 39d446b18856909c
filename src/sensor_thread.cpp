// -----------------------------------------------------------------------------
// sensor_thread.cpp: periodic sampler
//
// API & timing model: see include/aqlink/sensor_thread.hpp
// -----------------------------------------------------------------------------
#include "aqlink/sensor_thread.hpp"

#include <glog/logging.h>

#include <exception>
#include <stdexcept>
#include <utility>

namespace aqlink {

SensorThread::SensorThread(std::string name,
                           std::chrono::milliseconds interval,
                           std::string device_id,
                           Driver driver,
                           SampleQueue& out)
: name_(std::move(name)),
  interval_(interval),
  device_id_(std::move(device_id)),
  driver_(std::move(driver)),
  out_(out) {
  if (interval_.count() <= 0) throw std::invalid_argument("SensorThread interval must be > 0");
  if (!driver_) throw std::invalid_argument("SensorThread needs a driver");
}

SensorThread::~SensorThread() {
  stop();
  if (thread_.joinable()) thread_.join();
}

void SensorThread::start() {
  if (thread_.joinable()) return;
  LOG(INFO) << "sampler[" << name_ << "]: starting, interval " << interval_.count() << " ms";
  thread_ = std::thread(&SensorThread::run, this);
}

void SensorThread::stop() {
  stop_.set();
}

bool SensorThread::join_for(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) return true;
  if (!done_.wait_for(timeout)) {
    LOG(WARNING) << "sampler[" << name_ << "]: did not stop within " << timeout.count() << " ms";
    return false;
  }
  thread_.join();
  return true;
}

void SensorThread::run() {
  using Clock = std::chrono::steady_clock;
  auto next_tick = Clock::now() + interval_;

  while (!stop_.is_set()) {
    if (stop_.wait_until(next_tick)) break;
    sample_once();
    next_tick += interval_;   // grid, not now + interval
  }

  LOG(INFO) << "sampler[" << name_ << "]: stopped after " << samples() << " samples";
  done_.set();
}

// -----------------------------------------------------------------------------
// sample_once(): one tick. Never lets an exception escape the thread.
// -----------------------------------------------------------------------------
void SensorThread::sample_once() {
  try {
    std::optional<PmReading> payload = driver_();
    if (!payload) {
      ++empty_cycles_;
      VLOG(1) << "sampler[" << name_ << "]: no reading this cycle";
      return;
    }

    SensorReading reading;
    reading.ts        = wall_time_seconds();
    reading.device_id = device_id_;
    reading.payload   = *payload;

    if (out_.push_drop_oldest(reading.to_string())) {
      LOG(WARNING) << "sampler[" << name_ << "]: queue full, dropped oldest reading";
    }
    ++samples_;
  } catch (const std::exception& e) {
    ++faults_;
    LOG(ERROR) << "sampler[" << name_ << "]: sampling fault, skipping cycle: " << e.what();
  } catch (...) {
    ++faults_;
    LOG(ERROR) << "sampler[" << name_ << "]: unknown sampling fault, skipping cycle";
  }
}

} // namespace aqlink
