/**
 * @file main.cpp
 * @brief aqlink-agent: sample a PMS5003 and forward readings to MQTT.
 *
 * Responsibilities:
 *  - Build the AgentConfig: environment preset, optional JSON file, then flags.
 *  - Set up glog from the configured level (-v on the command line wins).
 *  - Open the sensor (UART, or the simulator with --test-mode / sensor.simulate).
 *  - Run the Agent until SIGINT/SIGTERM, or for the test-mode duration.
 *
 * Notes:
 *  - SIGINT/SIGTERM are blocked before any thread starts and collected with
 *    sigtimedwait() here, so no handler ever runs on a worker thread.
 *  - Exit codes: 0 clean stop, 1 configuration or startup error,
 *    2 threads did not finish within the join timeout.
 */

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>

#include <pthread.h>

#include <CLI/CLI.hpp>
#include <glog/logging.h>

#include "aqlink/agent.hpp"
#include "aqlink/config.hpp"
#include "aqlink/sensor_source.hpp"

using namespace aqlink;

namespace {

// Wait for SIGINT/SIGTERM for at most @p max_ms (< 0: forever). Returns the signal or 0.
int wait_for_signal(const sigset_t& set, long max_ms) {
  if (max_ms < 0) {
    int sig = 0;
    if (sigwait(&set, &sig) != 0) return 0;
    return sig;
  }
  timespec ts{};
  ts.tv_sec  = max_ms / 1000;
  ts.tv_nsec = (max_ms % 1000) * 1000000L;
  const int sig = sigtimedwait(&set, nullptr, &ts);
  return sig > 0 ? sig : 0;
}

} // namespace

int main(int argc, char** argv) {
  CLI::App app{"aqlink-agent: PMS5003 to MQTT telemetry agent"};

  std::string environment = "development";
  std::string config_path;
  std::string device_id, port, db_path, broker, topic;
  int broker_port = 0;
  double interval_s = 0.0;
  bool test_mode = false;
  int test_count = 10;
  double test_interval_s = 1.0;
  int verbose = 0;

  app.add_option("--environment", environment, "production|development|testing")
     ->check(CLI::IsMember({"production", "development", "testing"}));
  app.add_option("--config", config_path, "JSON config file (overrides the environment preset)")
     ->check(CLI::ExistingFile);
  app.add_option("--device-id", device_id, "Device id (overrides config)");
  app.add_option("--port", port, "Sensor serial device, e.g. /dev/serial0");
  app.add_option("--db", db_path, "Buffer database path, or :memory:");
  app.add_option("--broker", broker, "MQTT broker host");
  app.add_option("--broker-port", broker_port, "MQTT broker port")->check(CLI::Range(1, 65535));
  app.add_option("--topic", topic, "MQTT topic (default air/<device-id>/readings)");
  app.add_option("--interval", interval_s, "Sampling interval in seconds")->check(CLI::PositiveNumber);
  app.add_flag("--test-mode", test_mode, "Run against the simulated sensor and exit after --test-count readings");
  app.add_option("--test-count", test_count, "Readings to generate in test mode")->check(CLI::PositiveNumber);
  app.add_option("--test-interval", test_interval_s, "Seconds between readings in test mode")
     ->check(CLI::PositiveNumber);
  app.add_flag("-v,--verbose", verbose, "More log output (repeatable)");

  CLI11_PARSE(app, argc, argv);

  // ---- configuration ----
  AgentConfig cfg;
  try {
    const Environment env = *parse_environment(environment);
    cfg = config_path.empty() ? preset(env) : load_config(config_path, env);
    if (!device_id.empty()) cfg.device_id = device_id;
    if (!port.empty())      cfg.sensor.port = port;
    if (!db_path.empty())   cfg.buffer.path = db_path;
    if (!broker.empty())    cfg.mqtt.host = broker;
    if (broker_port > 0)    cfg.mqtt.port = broker_port;
    if (!topic.empty())     cfg.mqtt.topic = topic;
    if (interval_s > 0.0)   cfg.sampling.interval_s = interval_s;
    if (test_mode) {
      cfg.sensor.simulate     = true;
      cfg.sampling.interval_s = test_interval_s;
    }
    validate(cfg);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  // ---- logging ----
  const LogThresholds lt = log_thresholds(cfg.log_level);
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = verbose > 0 ? 0 : lt.minloglevel;
  FLAGS_v = verbose > 0 ? verbose : lt.verbosity;
  google::InitGoogleLogging(argv[0]);

  LOG(INFO) << "aqlink-agent: environment=" << to_string(cfg.environment)
            << " device=" << cfg.device_id
            << " broker=" << cfg.mqtt.host << ":" << cfg.mqtt.port
            << " topic=" << effective_topic(cfg);

  // ---- signals: block before any thread exists so every thread inherits the mask ----
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  // ---- sensor ----
  std::unique_ptr<PmSensor> sensor;
  if (cfg.sensor.simulate) {
    sensor = make_simulated_sensor(cfg.sensor, make_test_readings(static_cast<std::size_t>(test_count)));
  } else {
    sensor = open_serial_sensor(cfg.sensor);
  }
  if (!sensor) {
    LOG(ERROR) << "aqlink-agent: no sensor, giving up";
    return 1;
  }

  // ---- run ----
  std::unique_ptr<Agent> agent;
  try {
    agent = std::make_unique<Agent>(cfg, std::move(sensor), make_outbound_factory(cfg),
                                    make_backoff(cfg.backoff));
  } catch (const std::exception& e) {
    LOG(ERROR) << "aqlink-agent: startup failed: " << e.what();
    return 1;
  }
  agent->start();

  long budget_ms = -1;
  if (test_mode) {
    budget_ms = static_cast<long>((test_count * test_interval_s + 2.0) * 1000.0);
    LOG(INFO) << "aqlink-agent: test mode, " << test_count << " readings every "
              << test_interval_s << " s";
  }
  const int sig = wait_for_signal(sigs, budget_ms);
  if (sig) LOG(INFO) << "aqlink-agent: caught " << strsignal(sig);

  const bool clean = agent->stop(std::chrono::milliseconds(cfg.delivery.join_timeout_ms));
  return clean ? 0 : 2;
}
