/**
 * @file config.cpp
 * @brief Presets, JSON overlay and validation for AgentConfig.
 */
#include "aqlink/config.hpp"
#include "serial_io.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <type_traits>

using nlohmann::json;

namespace aqlink {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Overwrite @p out with j[key] when present; ConfigError if the type does not fit.
template <typename T>
void take(const json& j, const char* section, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end()) return;

  const std::string where = std::string(section) + (*section ? "." : "") + key;
  bool fits = false;
  if constexpr (std::is_same_v<T, bool>) {
    fits = it->is_boolean();
  } else if constexpr (std::is_same_v<T, std::string>) {
    fits = it->is_string();
  } else if constexpr (std::is_floating_point_v<T>) {
    fits = it->is_number();
  } else if constexpr (std::is_unsigned_v<T>) {
    fits = it->is_number_unsigned();
  } else {
    fits = it->is_number_integer();
  }
  if (!fits) throw ConfigError("config: wrong type for " + where + ": " + it->dump());
  out = it->get<T>();
}

void take_opt(const json& j, const char* section, const char* key, std::optional<std::string>& out) {
  auto it = j.find(key);
  if (it == j.end()) return;
  if (it->is_null()) { out.reset(); return; }
  if (!it->is_string())
    throw ConfigError(std::string("config: wrong type for ") + section + "." + key + ": " + it->dump());
  out = it->get<std::string>();
}

const json* section(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end()) return nullptr;
  if (!it->is_object()) throw ConfigError(std::string("config: section '") + name + "' must be an object");
  return &*it;
}

} // namespace

const char* to_string(Environment env) {
  switch (env) {
    case Environment::Production:  return "production";
    case Environment::Development: return "development";
    case Environment::Testing:     return "testing";
  }
  return "unknown";
}

std::optional<Environment> parse_environment(const std::string& name) {
  const std::string n = lower(name);
  if (n == "production")  return Environment::Production;
  if (n == "development") return Environment::Development;
  if (n == "testing")     return Environment::Testing;
  return std::nullopt;
}

AgentConfig preset(Environment env) {
  AgentConfig c;
  c.environment = env;
  switch (env) {
    case Environment::Production:
      c.log_level = "WARNING";
      break;
    case Environment::Development:
      c.log_level = "DEBUG";
      break;
    case Environment::Testing:
      c.log_level           = "DEBUG";
      c.device_id           = "test-device";
      c.sampling.interval_s = 1.0;
      c.buffer.path         = ":memory:";
      c.mqtt.client_id      = "aqlink-agent-test";
      c.sensor.simulate     = true;
      break;
  }
  return c;
}

void apply_json(AgentConfig& c, const json& j) {
  if (!j.is_object()) throw ConfigError("config: top level must be a JSON object");

  take(j, "", "device_id", c.device_id);
  take(j, "", "log_level", c.log_level);

  if (const json* s = section(j, "sensor")) {
    take(*s, "sensor", "port", c.sensor.port);
    take(*s, "sensor", "baud", c.sensor.baud);
    take(*s, "sensor", "read_timeout_ms", c.sensor.read_timeout_ms);
    take(*s, "sensor", "max_retries", c.sensor.max_retries);
    take(*s, "sensor", "retry_timeout_ms", c.sensor.retry_timeout_ms);
    take(*s, "sensor", "simulate", c.sensor.simulate);
  }
  if (const json* s = section(j, "sampling")) {
    take(*s, "sampling", "interval_s", c.sampling.interval_s);
    take(*s, "sampling", "queue_capacity", c.sampling.queue_capacity);
  }
  if (const json* s = section(j, "buffer")) {
    take(*s, "buffer", "path", c.buffer.path);
    take(*s, "buffer", "max_mb", c.buffer.max_mb);
    take(*s, "buffer", "eviction_batch", c.buffer.eviction_batch);
  }
  if (const json* s = section(j, "mqtt")) {
    take(*s, "mqtt", "host", c.mqtt.host);
    take(*s, "mqtt", "port", c.mqtt.port);
    take(*s, "mqtt", "topic", c.mqtt.topic);
    take(*s, "mqtt", "client_id", c.mqtt.client_id);
    take_opt(*s, "mqtt", "username", c.mqtt.username);
    take_opt(*s, "mqtt", "password", c.mqtt.password);
    take(*s, "mqtt", "keepalive_s", c.mqtt.keepalive_s);
    take(*s, "mqtt", "ack_timeout_ms", c.mqtt.ack_timeout_ms);
    take(*s, "mqtt", "reconnect_delay_s", c.mqtt.reconnect_delay_s);
    take(*s, "mqtt", "reconnect_delay_max_s", c.mqtt.reconnect_delay_max_s);
  }
  if (const json* s = section(j, "backoff")) {
    take(*s, "backoff", "base_s", c.backoff.base_s);
    take(*s, "backoff", "max_s", c.backoff.max_s);
    take(*s, "backoff", "jitter", c.backoff.jitter);
  }
  if (const json* s = section(j, "delivery")) {
    take(*s, "delivery", "poll_interval_ms", c.delivery.poll_interval_ms);
    take(*s, "delivery", "resume_unsent", c.delivery.resume_unsent);
    take(*s, "delivery", "join_timeout_ms", c.delivery.join_timeout_ms);
  }
}

AgentConfig load_config(const std::string& path, Environment env) {
  AgentConfig c = preset(env);
  std::ifstream in(path);
  if (!in) throw ConfigError("config: cannot open " + path);

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("config: " + path + " is not valid JSON: " + e.what());
  }
  apply_json(c, j);
  return c;
}

std::string effective_topic(const AgentConfig& c) {
  if (!c.mqtt.topic.empty()) return c.mqtt.topic;
  const std::string topic = "air/" + c.device_id + "/readings";
  return c.environment == Environment::Testing ? "test/" + topic : topic;
}

std::string effective_client_id(const AgentConfig& c) {
  return c.mqtt.client_id.empty() ? c.device_id : c.mqtt.client_id;
}

std::optional<uint64_t> buffer_max_bytes(const BufferConfig& b) {
  if (b.max_mb == 0) return std::nullopt;
  return b.max_mb * 1024ull * 1024ull;
}

json to_json(const AgentConfig& c) {
  json j;
  j["environment"] = to_string(c.environment);
  j["device_id"]   = c.device_id;
  j["log_level"]   = c.log_level;

  j["sensor"] = {
    {"port", c.sensor.port},
    {"baud", c.sensor.baud},
    {"read_timeout_ms", c.sensor.read_timeout_ms},
    {"max_retries", c.sensor.max_retries},
    {"retry_timeout_ms", c.sensor.retry_timeout_ms},
    {"simulate", c.sensor.simulate},
  };
  j["sampling"] = {
    {"interval_s", c.sampling.interval_s},
    {"queue_capacity", c.sampling.queue_capacity},
  };
  j["buffer"] = {
    {"path", c.buffer.path},
    {"max_mb", c.buffer.max_mb},
    {"eviction_batch", c.buffer.eviction_batch},
  };
  j["mqtt"] = {
    {"host", c.mqtt.host},
    {"port", c.mqtt.port},
    {"topic", effective_topic(c)},
    {"client_id", effective_client_id(c)},
    {"username", c.mqtt.username ? json(*c.mqtt.username) : json(nullptr)},
    {"password", c.mqtt.password ? json("***") : json(nullptr)},
    {"keepalive_s", c.mqtt.keepalive_s},
    {"ack_timeout_ms", c.mqtt.ack_timeout_ms},
    {"reconnect_delay_s", c.mqtt.reconnect_delay_s},
    {"reconnect_delay_max_s", c.mqtt.reconnect_delay_max_s},
  };
  j["backoff"] = {
    {"base_s", c.backoff.base_s},
    {"max_s", c.backoff.max_s},
    {"jitter", c.backoff.jitter},
  };
  j["delivery"] = {
    {"poll_interval_ms", c.delivery.poll_interval_ms},
    {"resume_unsent", c.delivery.resume_unsent},
    {"join_timeout_ms", c.delivery.join_timeout_ms},
  };
  return j;
}

void validate(const AgentConfig& c) {
  auto fail = [](const std::string& what) { throw ConfigError("config: " + what); };

  if (c.device_id.empty())               fail("device_id must not be empty");
  if (c.sampling.interval_s <= 0.0)      fail("sampling.interval_s must be > 0");
  if (c.sampling.queue_capacity == 0)    fail("sampling.queue_capacity must be > 0");
  if (c.buffer.eviction_batch == 0)      fail("buffer.eviction_batch must be > 0");
  if (!c.sensor.simulate && c.sensor.port.empty()) fail("sensor.port must not be empty");
  if (!c.sensor.simulate && !baud_supported(c.sensor.baud))
    fail("sensor.baud " + std::to_string(c.sensor.baud) + " is not a supported rate");
  if (c.sensor.read_timeout_ms <= 0)     fail("sensor.read_timeout_ms must be > 0");
  if (c.sensor.max_retries < 1)          fail("sensor.max_retries must be >= 1");
  if (c.sensor.retry_timeout_ms < 0)     fail("sensor.retry_timeout_ms must be >= 0");
  if (c.mqtt.host.empty())               fail("mqtt.host must not be empty");
  if (c.mqtt.port <= 0 || c.mqtt.port > 65535) fail("mqtt.port out of range");
  if (c.mqtt.keepalive_s < 5)            fail("mqtt.keepalive_s must be >= 5");
  if (c.mqtt.ack_timeout_ms <= 0)        fail("mqtt.ack_timeout_ms must be > 0");
  if (c.mqtt.reconnect_delay_s == 0)     fail("mqtt.reconnect_delay_s must be > 0");
  if (c.mqtt.reconnect_delay_max_s < c.mqtt.reconnect_delay_s)
    fail("mqtt.reconnect_delay_max_s must be >= reconnect_delay_s");
  if (c.mqtt.username.has_value() != c.mqtt.password.has_value())
    fail("mqtt.username and mqtt.password go together");
  if (c.backoff.base_s <= 0.0)           fail("backoff.base_s must be > 0");
  if (c.backoff.max_s < c.backoff.base_s) fail("backoff.max_s must be >= backoff.base_s");
  if (c.backoff.jitter < 0.0 || c.backoff.jitter > 1.0) fail("backoff.jitter must be in [0, 1]");
  if (c.delivery.poll_interval_ms <= 0)  fail("delivery.poll_interval_ms must be > 0");
  if (c.delivery.join_timeout_ms <= 0)   fail("delivery.join_timeout_ms must be > 0");
  if (c.delivery.join_timeout_ms <= c.mqtt.ack_timeout_ms)
    fail("delivery.join_timeout_ms must be > mqtt.ack_timeout_ms");
  if (c.delivery.join_timeout_ms <= sensor_read_budget_ms(c.sensor))
    fail("delivery.join_timeout_ms must be > the worst-case sensor read (" +
         std::to_string(sensor_read_budget_ms(c.sensor)) + " ms)");
  (void)log_thresholds(c.log_level);
}

int64_t sensor_read_budget_ms(const SensorConfig& s) {
  const int64_t attempts = std::max(s.max_retries, 1);
  return attempts * (int64_t{s.read_timeout_ms} + s.retry_timeout_ms) - s.retry_timeout_ms;
}

LogThresholds log_thresholds(const std::string& level) {
  // glog severities: 0 INFO, 1 WARNING, 2 ERROR, 3 FATAL.
  const std::string l = upper(level);
  if (l == "DEBUG")                  return {0, 1};
  if (l == "INFO")                   return {0, 0};
  if (l == "WARNING" || l == "WARN") return {1, 0};
  if (l == "ERROR")                  return {2, 0};
  throw ConfigError("config: unknown log level '" + level + "'");
}

} // namespace aqlink
