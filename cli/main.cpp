/**
 * @file main.cpp
 * @brief aqlink-cli: operator tool for a deployed agent.
 *
 * Subcommands:
 *  - read    one sensor read, printed as JSON with the driver's error counters
 *  - stats   durable buffer statistics
 *  - unsent  rows still waiting for a broker ack (oldest first)
 *  - config  the effective configuration for an environment (+ optional file)
 *
 * Notes:
 *  - Everything printed on stdout is JSON so the output can be piped to jq.
 *  - `stats` and `unsent` open the buffer read-write (SQLite WAL allows that
 *    next to a running agent); they never modify rows.
 *  - Exit codes: 0 ok, 1 usage/config error, 2 sensor or storage failure.
 */

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "aqlink/buffer.hpp"
#include "aqlink/config.hpp"
#include "aqlink/reading.hpp"
#include "aqlink/sensor_source.hpp"

using json = nlohmann::json;
using namespace aqlink;

namespace {

// ---------- shared option block ----------

struct Common {
  std::string environment{"development"};
  std::string config_path;
  bool pretty{false};
};

AgentConfig resolve(const Common& c) {
  const Environment env = *parse_environment(c.environment);
  AgentConfig cfg = c.config_path.empty() ? preset(env) : load_config(c.config_path, env);
  return cfg;
}

void print(const json& j, bool pretty) {
  std::cout << (pretty ? j.dump(2) : j.dump()) << "\n";
}

// ---------- subcommands ----------

int cmd_read(const Common& common, const std::string& port, bool simulate) {
  AgentConfig cfg = resolve(common);
  if (!port.empty()) cfg.sensor.port = port;

  std::unique_ptr<PmSensor> sensor = simulate
      ? make_simulated_sensor(cfg.sensor, make_test_readings(1))
      : open_serial_sensor(cfg.sensor);
  if (!sensor) {
    std::cerr << "cannot open sensor on " << cfg.sensor.port << "\n";
    return 2;
  }

  const auto r = sensor->read();
  json out;
  out["port"]            = simulate ? std::string("simulator") : cfg.sensor.port;
  out["stream"]          = sensor->stream().name();
  out["ok"]              = r.has_value();
  out["reading"]         = r ? json::parse(r->to_string()) : json(nullptr);
  out["timeouts"]        = sensor->driver().timeouts();
  out["checksum_errors"] = sensor->driver().checksum_errors();
  out["frames_ok"]       = sensor->driver().frames_ok();
  print(out, common.pretty);
  return r ? 0 : 2;
}

int cmd_stats(const Common& common, const std::string& db) {
  const AgentConfig cfg = resolve(common);
  SqliteBufferOptions opts;
  opts.path           = db.empty() ? cfg.buffer.path : db;
  opts.max_bytes      = buffer_max_bytes(cfg.buffer);
  opts.eviction_batch = cfg.buffer.eviction_batch;

  SqliteBuffer buffer(opts);
  const BufferStats s = buffer.stats();
  json out;
  out["path"]           = opts.path;
  out["total_entries"]  = s.total_entries;
  out["sent_entries"]   = s.sent_entries;
  out["unsent_entries"] = s.unsent_entries;
  out["size_bytes"]     = s.size_bytes;
  out["max_bytes"]      = s.max_bytes ? json(*s.max_bytes) : json(nullptr);
  out["eviction_batch"] = s.eviction_batch;
  print(out, common.pretty);
  buffer.close();
  return 0;
}

int cmd_unsent(const Common& common, const std::string& db, std::size_t limit) {
  const AgentConfig cfg = resolve(common);
  SqliteBufferOptions opts;
  opts.path = db.empty() ? cfg.buffer.path : db;

  SqliteBuffer buffer(opts);
  json rows = json::array();
  for (const auto& e : buffer.unsent()) {
    if (limit && rows.size() >= limit) break;
    json row;
    row["id"] = e.id;
    // Payloads are SensorReading strings; show them parsed when they are.
    if (auto reading = SensorReading::from_string(e.payload)) {
      row["ts"]        = reading->ts;
      row["device_id"] = reading->device_id;
      row["payload"]   = json::parse(reading->payload.to_string());
    } else {
      row["raw"] = e.payload;
    }
    rows.push_back(std::move(row));
  }
  print(rows, common.pretty);
  buffer.close();
  return 0;
}

int cmd_config(const Common& common) {
  const AgentConfig cfg = resolve(common);
  validate(cfg);
  print(to_json(cfg), common.pretty);
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = 1;     // WARNING and up; stdout is reserved for JSON
  google::InitGoogleLogging(argv[0]);

  CLI::App app{"aqlink-cli: inspect the aqlink sensor agent"};
  app.require_subcommand(1);

  Common common;
  app.add_option("--environment", common.environment, "production|development|testing")
     ->check(CLI::IsMember({"production", "development", "testing"}));
  app.add_option("--config", common.config_path, "JSON config file")->check(CLI::ExistingFile);
  app.add_flag("--pretty", common.pretty, "Indent JSON output");

  std::string port, db;
  bool simulate = false;
  std::size_t limit = 0;

  CLI::App* read = app.add_subcommand("read", "Read the sensor once");
  read->add_option("--port", port, "Serial device (default from config)");
  read->add_flag("--simulate", simulate, "Use the built-in simulator");

  CLI::App* stats = app.add_subcommand("stats", "Show buffer statistics");
  stats->add_option("--db", db, "Buffer database (default from config)");

  CLI::App* unsent = app.add_subcommand("unsent", "List unsent buffer rows");
  unsent->add_option("--db", db, "Buffer database (default from config)");
  unsent->add_option("--limit", limit, "Show at most N rows (0 = all)");

  CLI::App* config = app.add_subcommand("config", "Print the effective configuration");

  CLI11_PARSE(app, argc, argv);

  try {
    if (*read)   return cmd_read(common, port, simulate);
    if (*stats)  return cmd_stats(common, db);
    if (*unsent) return cmd_unsent(common, db, limit);
    if (*config) return cmd_config(common);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const BufferError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  return 1;
}
