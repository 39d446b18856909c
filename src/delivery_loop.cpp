// -----------------------------------------------------------------------------
// delivery_loop.cpp: queue/backlog to buffered publisher, with backoff
//
// Ordering & state model: see include/aqlink/delivery_loop.hpp
// -----------------------------------------------------------------------------
#include "aqlink/delivery_loop.hpp"

#include <glog/logging.h>

#include <deque>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace aqlink {

const char* to_string(DeliveryLoop::State s) {
  switch (s) {
    case DeliveryLoop::State::Idle:     return "idle";
    case DeliveryLoop::State::Running:  return "running";
    case DeliveryLoop::State::Draining: return "draining";
    case DeliveryLoop::State::Stopped:  return "stopped";
  }
  return "unknown";
}

DeliveryLoop::DeliveryLoop(SampleQueue& queue,
                           OutboundFactory factory,
                           std::unique_ptr<BackoffPolicy> backoff,
                           DeliveryLoopOptions opts)
: queue_(queue),
  factory_(std::move(factory)),
  backoff_(std::move(backoff)),
  opts_(opts) {
  if (!factory_) throw std::invalid_argument("DeliveryLoop needs an outbound factory");
  if (!backoff_) throw std::invalid_argument("DeliveryLoop needs a backoff policy");
  if (opts_.poll_interval.count() <= 0) throw std::invalid_argument("poll interval must be > 0");
}

DeliveryLoop::~DeliveryLoop() {
  stop();
  if (thread_.joinable()) thread_.join();
}

void DeliveryLoop::start() {
  if (thread_.joinable()) return;
  state_ = State::Running;
  thread_ = std::thread(&DeliveryLoop::run, this);
}

void DeliveryLoop::stop() {
  if (!stop_.is_set()) LOG(INFO) << "delivery: stop requested";
  stop_.set();
}

bool DeliveryLoop::join_for(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) return true;
  if (!done_.wait_for(timeout)) {
    LOG(WARNING) << "delivery: did not stop within " << timeout.count() << " ms";
    return false;
  }
  thread_.join();
  return true;
}

void DeliveryLoop::pause_after_failure() {
  const Seconds delay = backoff_->next_delay(false);
  if (delay.count() <= 0.0) return;
  VLOG(1) << "delivery: backing off " << delay.count() << " s";
  stop_.wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(delay));
}

std::unique_ptr<BufferedPublisher> DeliveryLoop::build_publisher() {
  try {
    std::unique_ptr<BufferedPublisher> out = factory_();
    if (!out) LOG(ERROR) << "delivery: outbound factory returned nothing";
    return out;
  } catch (const std::exception& e) {
    LOG(ERROR) << "delivery: outbound factory failed: " << e.what();
    return nullptr;
  }
}

void DeliveryLoop::run() {
  LOG(INFO) << "delivery: loop started";
  std::unique_ptr<BufferedPublisher> out;
  std::deque<Envelope> backlog;

  while (!stop_.is_set()) {
    if (!out) {
      out = build_publisher();
      if (!out) {
        pause_after_failure();
        continue;
      }
      backoff_->next_delay(true);
      if (opts_.resume_unsent) {
        for (auto& row : out->unsent()) {
          backlog.push_back(Envelope{std::move(row.payload), row.id});
        }
        if (!backlog.empty())
          LOG(INFO) << "delivery: resuming " << backlog.size() << " unsent rows";
      }
      backlog_size_ = backlog.size();
    }

    Envelope env;
    if (!backlog.empty()) {
      env = std::move(backlog.front());
      backlog.pop_front();
    } else {
      std::string payload;
      if (!queue_.pop(payload, opts_.poll_interval)) continue;
      env.payload = std::move(payload);
    }

    if (out->deliver(env)) {
      ++delivered_;
      backoff_->next_delay(true);
      backlog_size_ = backlog.size();
      continue;
    }

    ++failed_;
    LOG(WARNING) << "delivery: publish failed, retrying later ("
                 << backlog.size() + 1 << " in backlog)";
    backlog.push_front(std::move(env));
    backlog_size_ = backlog.size();
    pause_after_failure();
  }

  state_ = State::Draining;
  if (!backlog.empty())
    LOG(INFO) << "delivery: " << backlog.size() << " messages left in backlog";
  if (out) out->close();
  out.reset();

  state_ = State::Stopped;
  LOG(INFO) << "delivery: loop stopped, delivered=" << delivered_.load()
            << " failed_attempts=" << failed_.load();
  done_.set();
}

} // namespace aqlink
