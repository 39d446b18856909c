/**
 * @page aq-agent aqlink Agent
 * @file agent.hpp
 * @brief Wires sensor, sampling queue, sampling thread and delivery loop together.
 *
 * @details
 * ```
 *   PmSensor ─► SensorThread ─► SampleQueue ─► DeliveryLoop ─► BufferedPublisher
 *                                                               ├─ SqliteBuffer
 *                                                               └─ MqttPublisher
 * ```
 * The agent owns everything on that line except the publisher, which the
 * delivery loop builds in its own thread from the outbound factory.
 *
 * Shutdown order is producers first, then the consumer, each with a bounded
 * join, so no sample is pushed after the loop has stopped draining.
 */
#ifndef AQLINK_AGENT_HPP
#define AQLINK_AGENT_HPP

#include <chrono>
#include <memory>

#include "aqlink/bounded_queue.hpp"
#include "aqlink/config.hpp"
#include "aqlink/delivery_loop.hpp"
#include "aqlink/sensor_source.hpp"
#include "aqlink/sensor_thread.hpp"

namespace aqlink {

/// SqliteBuffer + MqttPublisher built from @p cfg, for use inside the loop thread.
OutboundFactory make_outbound_factory(const AgentConfig& cfg);

/// Exponential backoff with the bounds from @p cfg.
std::unique_ptr<BackoffPolicy> make_backoff(const BackoffConfig& cfg);

class Agent {
public:
  /**
   * @throws std::invalid_argument if @p sensor is null,
   *         ConfigError if @p cfg does not validate.
   */
  Agent(const AgentConfig& cfg,
        std::unique_ptr<PmSensor> sensor,
        OutboundFactory outbound,
        std::unique_ptr<BackoffPolicy> backoff);

  /// Stops with the configured join timeout if still running.
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  void start();

  /**
   * @brief Stop the sampler, then the delivery loop.
   * @return false if either thread missed @p join_timeout.
   */
  bool stop(std::chrono::milliseconds join_timeout);

  bool running() const { return running_; }

  SampleQueue& queue() { return queue_; }
  SensorThread& sampler() { return *sampler_; }
  DeliveryLoop& delivery() { return *loop_; }
  const PmSensor& sensor() const { return *sensor_; }

private:
  AgentConfig cfg_;
  std::unique_ptr<PmSensor> sensor_;
  SampleQueue queue_;
  std::unique_ptr<SensorThread> sampler_;
  std::unique_ptr<DeliveryLoop> loop_;
  bool running_{false};
};

} // namespace aqlink

#endif // AQLINK_AGENT_HPP
