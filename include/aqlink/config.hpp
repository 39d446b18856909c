/**
 * @page aq-config aqlink Configuration
 * @file config.hpp
 * @brief Agent configuration: per-environment presets, JSON overrides, validation.
 *
 * @details
 * One AgentConfig is built at startup and handed down to constructors.
 * Nothing below main() reads the environment or a file on its own.
 *
 * LAYERING
 * --------
 * ```
 *   preset(environment)  ->  JSON file (optional)  ->  command-line flags
 * ```
 * Each layer overrides only the fields it names. Unknown JSON keys are
 * ignored so a newer file still loads on an older agent; a known key with
 * the wrong type is a ConfigError.
 *
 * JSON SHAPE
 * ----------
 * ```
 *   {
 *     "device_id": "sensor-pi-01",
 *     "log_level": "INFO",
 *     "sensor":   { "port": "/dev/serial0", "baud": 9600, "read_timeout_ms": 1000,
 *                   "max_retries": 3, "retry_timeout_ms": 1000, "simulate": false },
 *     "sampling": { "interval_s": 10, "queue_capacity": 5000 },
 *     "buffer":   { "path": "buffer.db", "max_mb": 32, "eviction_batch": 500 },
 *     "mqtt":     { "host": "localhost", "port": 1883, "topic": "", "client_id": "",
 *                   "username": null, "password": null, "keepalive_s": 60,
 *                   "ack_timeout_ms": 10000, "reconnect_delay_s": 1,
 *                   "reconnect_delay_max_s": 60 },
 *     "backoff":  { "base_s": 1.0, "max_s": 60.0, "jitter": 0.5 },
 *     "delivery": { "poll_interval_ms": 1000, "resume_unsent": true,
 *                   "join_timeout_ms": 15000 }
 *   }
 * ```
 * An empty `mqtt.topic` means `air/<device_id>/readings` (prefixed with
 * `test/` in the testing preset); an empty `mqtt.client_id` means the
 * device id.
 */
#ifndef AQLINK_CONFIG_HPP
#define AQLINK_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace aqlink {

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class Environment { Production, Development, Testing };

const char* to_string(Environment env);
std::optional<Environment> parse_environment(const std::string& name);

struct SensorConfig {
  std::string port{"/dev/serial0"};
  int  baud{9600};
  int  read_timeout_ms{1000};
  int  max_retries{3};
  int  retry_timeout_ms{1000};
  bool simulate{false};          ///< use the built-in PMS5003 simulator
};

struct SamplingConfig {
  double      interval_s{10.0};
  std::size_t queue_capacity{5000};
};

struct BufferConfig {
  std::string path{"buffer.db"};
  uint64_t    max_mb{32};        ///< 0 disables the cap
  std::size_t eviction_batch{500};
};

struct MqttConfig {
  std::string host{"localhost"};
  int         port{1883};
  std::string topic;             ///< empty: derived from device id
  std::string client_id;         ///< empty: device id
  std::optional<std::string> username;
  std::optional<std::string> password;
  int      keepalive_s{60};
  int      ack_timeout_ms{10000};
  unsigned reconnect_delay_s{1};
  unsigned reconnect_delay_max_s{60};
};

struct BackoffConfig {
  double base_s{1.0};
  double max_s{60.0};
  double jitter{0.5};
};

struct DeliveryConfig {
  int  poll_interval_ms{1000};
  bool resume_unsent{true};
  int  join_timeout_ms{15000};
};

struct AgentConfig {
  Environment environment{Environment::Development};
  std::string device_id{"sensor-pi-01"};
  std::string log_level{"INFO"};

  SensorConfig   sensor;
  SamplingConfig sampling;
  BufferConfig   buffer;
  MqttConfig     mqtt;
  BackoffConfig  backoff;
  DeliveryConfig delivery;
};

/// Defaults for one deployment environment.
AgentConfig preset(Environment env);

/**
 * @brief Overlay the keys present in @p j onto @p cfg.
 * @throws ConfigError if @p j is not an object or a known key has the wrong type.
 */
void apply_json(AgentConfig& cfg, const nlohmann::json& j);

/**
 * @brief preset(@p env) overlaid with the JSON file at @p path.
 * @throws ConfigError on unreadable file or malformed JSON.
 */
AgentConfig load_config(const std::string& path, Environment env);

/// Effective configuration, derived fields resolved. Password is masked.
nlohmann::json to_json(const AgentConfig& cfg);

/**
 * @brief Reject settings the agent cannot run with.
 *
 * Besides per-field ranges, `delivery.join_timeout_ms` must exceed both the
 * longest publish wait (`mqtt.ack_timeout_ms`) and sensor_read_budget_ms(),
 * otherwise a stop arriving mid-call could never finish inside the join.
 * @throws ConfigError naming the first offending field.
 */
void validate(const AgentConfig& cfg);

/// Longest a single sensor read can block: every attempt times out.
int64_t sensor_read_budget_ms(const SensorConfig& s);

/// Topic actually used for publishing.
std::string effective_topic(const AgentConfig& cfg);

/// MQTT client id actually used.
std::string effective_client_id(const AgentConfig& cfg);

/// Cap in bytes, or nullopt when max_mb is 0.
std::optional<uint64_t> buffer_max_bytes(const BufferConfig& b);

/// glog thresholds for a textual level (DEBUG, INFO, WARNING, ERROR).
struct LogThresholds {
  int minloglevel{0};
  int verbosity{0};
};

/// @throws ConfigError on an unknown level name.
LogThresholds log_thresholds(const std::string& level);

} // namespace aqlink

#endif // AQLINK_CONFIG_HPP
