// -----------------------------------------------------------------------------
// agent.cpp: component wiring and ordered shutdown
// -----------------------------------------------------------------------------
#include "aqlink/agent.hpp"

#include "aqlink/buffer.hpp"
#include "aqlink/buffered_publisher.hpp"
#include "aqlink/mqtt_publisher.hpp"

#include <glog/logging.h>

#include <cmath>
#include <stdexcept>
#include <utility>

namespace aqlink {

OutboundFactory make_outbound_factory(const AgentConfig& cfg) {
  SqliteBufferOptions bopts;
  bopts.path           = cfg.buffer.path;
  bopts.max_bytes      = buffer_max_bytes(cfg.buffer);
  bopts.eviction_batch = cfg.buffer.eviction_batch;

  MqttOptions mopts;
  mopts.host                  = cfg.mqtt.host;
  mopts.port                  = cfg.mqtt.port;
  mopts.topic                 = effective_topic(cfg);
  mopts.client_id             = effective_client_id(cfg);
  mopts.username              = cfg.mqtt.username;
  mopts.password              = cfg.mqtt.password;
  mopts.keepalive_s           = cfg.mqtt.keepalive_s;
  mopts.ack_timeout           = std::chrono::milliseconds(cfg.mqtt.ack_timeout_ms);
  mopts.reconnect_delay_s     = cfg.mqtt.reconnect_delay_s;
  mopts.reconnect_delay_max_s = cfg.mqtt.reconnect_delay_max_s;

  return [bopts, mopts]() {
    auto buffer = std::make_unique<SqliteBuffer>(bopts);
    auto mqtt   = std::make_unique<MqttPublisher>(mopts);
    return std::make_unique<BufferedPublisher>(std::move(buffer), std::move(mqtt));
  };
}

namespace {

const AgentConfig& validated(const AgentConfig& cfg) {
  validate(cfg);
  return cfg;
}

} // namespace

std::unique_ptr<BackoffPolicy> make_backoff(const BackoffConfig& cfg) {
  return std::make_unique<ExponentialBackoff>(Seconds(cfg.base_s), Seconds(cfg.max_s), cfg.jitter);
}

Agent::Agent(const AgentConfig& cfg,
             std::unique_ptr<PmSensor> sensor,
             OutboundFactory outbound,
             std::unique_ptr<BackoffPolicy> backoff)
: cfg_(validated(cfg)), sensor_(std::move(sensor)), queue_(cfg_.sampling.queue_capacity) {
  if (!sensor_) throw std::invalid_argument("Agent needs a sensor");

  const auto interval = std::chrono::milliseconds(
      static_cast<int64_t>(std::llround(cfg_.sampling.interval_s * 1000.0)));
  PmSensor* s = sensor_.get();
  sampler_ = std::make_unique<SensorThread>("pm", interval, cfg_.device_id,
                                            [s] { return s->read(); }, queue_);

  DeliveryLoopOptions dopts;
  dopts.poll_interval = std::chrono::milliseconds(cfg_.delivery.poll_interval_ms);
  dopts.resume_unsent = cfg_.delivery.resume_unsent;
  loop_ = std::make_unique<DeliveryLoop>(queue_, std::move(outbound), std::move(backoff), dopts);
}

Agent::~Agent() {
  if (running_) stop(std::chrono::milliseconds(cfg_.delivery.join_timeout_ms));
}

void Agent::start() {
  if (running_) return;
  LOG(INFO) << "agent: starting device=" << cfg_.device_id
            << " environment=" << to_string(cfg_.environment)
            << " interval=" << cfg_.sampling.interval_s << "s"
            << " queue=" << cfg_.sampling.queue_capacity;
  loop_->start();
  sampler_->start();
  running_ = true;
}

bool Agent::stop(std::chrono::milliseconds join_timeout) {
  if (!running_) return true;
  running_ = false;
  LOG(INFO) << "agent: stopping";

  sampler_->stop();
  const bool sampler_ok = sampler_->join_for(join_timeout);

  loop_->stop();
  const bool loop_ok = loop_->join_for(join_timeout);

  LOG(INFO) << "agent: stopped, samples=" << sampler_->samples()
            << " delivered=" << loop_->delivered()
            << " dropped=" << queue_.dropped()
            << " queued=" << queue_.size();
  if (!sampler_ok || !loop_ok) LOG(ERROR) << "agent: shutdown incomplete";
  return sampler_ok && loop_ok;
}

} // namespace aqlink
