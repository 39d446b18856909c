/**
 * @page aq-mqtt aqlink MQTT Transport
 * @file mqtt_publisher.hpp
 * @brief QoS 1 publisher on top of libmosquitto with a blocking wait for PUBACK.
 *
 * @details
 * CONNECTION
 * ----------
 * The client connects asynchronously when constructed and runs the
 * library's own network thread (`mosquitto_loop_start`). Reconnects are
 * handled by that thread with a bounded exponential delay. Construction
 * never fails because the broker is down; `publish()` simply returns false
 * until the connection comes up.
 *
 * PUBLISH
 * -------
 * ```
 *   publish(p)
 *     ├─ not connected ──────────────► false
 *     ├─ mosquitto_publish(qos=1) err ► false
 *     └─ wait for on_publish(mid) up to ack_timeout
 *          ├─ acked and still connected ► true
 *          └─ timeout / disconnect     ► false
 * ```
 * The message id is registered under the same lock that is held across
 * `mosquitto_publish()`, so an ack racing the registration cannot be lost.
 *
 * THREADING
 * ---------
 * Callbacks run on the libmosquitto thread and only drive an AckTracker,
 * which owns the connected flag, the pending-ack table and the disconnect
 * reason. Each disconnect bumps a generation counter, so a publish that saw
 * the link drop fails even if the broker acks that mid after reconnecting.
 */
#ifndef AQLINK_MQTT_PUBLISHER_HPP
#define AQLINK_MQTT_PUBLISHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "aqlink/publisher.hpp"

struct mosquitto;

namespace aqlink {

struct MqttOptions {
  std::string host{"localhost"};
  int         port{1883};
  std::string topic{"air/sensor-pi-01/readings"};
  std::string client_id{"sensor-pi-01"};
  std::optional<std::string> username;
  std::optional<std::string> password;
  int keepalive_s{60};
  std::chrono::milliseconds ack_timeout{10000};
  unsigned reconnect_delay_s{1};
  unsigned reconnect_delay_max_s{60};
};

/// Outcome of one tracked publish.
enum class AckResult : uint8_t { Acked, TimedOut, Disconnected, SendFailed };

const char* to_string(AckResult r);

/**
 * @brief Connection state and PUBACK bookkeeping for one client.
 *
 * The network callbacks call set_connected(), on_disconnect() and on_ack();
 * the publishing thread calls send_and_wait(). All of it is thread-safe.
 */
class AckTracker {
public:
  /// Sends one message. Fills the message id and returns false on failure.
  using SendFn = std::function<bool(int& mid)>;

  /**
   * @brief Run @p send under the table lock, then wait for its ack.
   *
   * The id is registered before the lock is released, so an ack arriving
   * right after the send is never missed. @p send is not called while
   * disconnected.
   */
  AckResult send_and_wait(const SendFn& send, std::chrono::milliseconds timeout);

  void set_connected(bool up);
  void on_disconnect(int rc);

  /// @return false if @p mid is not being waited for (late or unknown ack).
  bool on_ack(int mid);

  bool connected() const { return connected_.load(); }
  std::optional<int> disconnect_reason() const;
  std::size_t pending() const;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> connected_{false};
  std::map<int, bool> pending_;          // mid -> acked
  uint64_t disconnects_{0};
  std::optional<int> disconnect_rc_;
};

class MqttPublisher : public Publisher {
public:
  /// @throws std::runtime_error if the client cannot be allocated.
  explicit MqttPublisher(MqttOptions opts);
  ~MqttPublisher() override;

  MqttPublisher(const MqttPublisher&) = delete;
  MqttPublisher& operator=(const MqttPublisher&) = delete;

  bool publish(const std::string& payload) override;
  void close() override;

  bool is_connected() const { return acks_.connected(); }

  /// Reason code of the last disconnect, if there was one.
  std::optional<int> disconnect_reason() const { return acks_.disconnect_reason(); }

  const MqttOptions& options() const { return opts_; }

private:
  static void on_connect(struct mosquitto* mosq, void* obj, int rc);
  static void on_disconnect(struct mosquitto* mosq, void* obj, int rc);
  static void on_publish(struct mosquitto* mosq, void* obj, int mid);

  MqttOptions opts_;
  struct mosquitto* mosq_ = nullptr;
  std::atomic<bool> closed_{false};
  AckTracker acks_;
};

} // namespace aqlink

#endif // AQLINK_MQTT_PUBLISHER_HPP
