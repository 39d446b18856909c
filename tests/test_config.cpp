#include <doctest/doctest.h>
#include "aqlink/config.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace aqlink;
using nlohmann::json;

TEST_CASE("Environment names round-trip and unknown ones are refused") {
    CHECK(parse_environment("production") == Environment::Production);
    CHECK(parse_environment("Testing") == Environment::Testing);
    CHECK(parse_environment("development") == Environment::Development);
    CHECK_FALSE(parse_environment("staging").has_value());
    CHECK(std::string(to_string(Environment::Testing)) == "testing");
}

TEST_CASE("Presets differ the way each environment needs") {
    const AgentConfig prod = preset(Environment::Production);
    CHECK(prod.log_level == "WARNING");
    CHECK(prod.device_id == "sensor-pi-01");
    CHECK(prod.buffer.path == "buffer.db");
    CHECK(prod.sensor.port == "/dev/serial0");
    CHECK(effective_topic(prod) == "air/sensor-pi-01/readings");
    CHECK(effective_client_id(prod) == "sensor-pi-01");

    const AgentConfig dev = preset(Environment::Development);
    CHECK(dev.log_level == "DEBUG");
    CHECK(dev.sampling.interval_s == doctest::Approx(10.0));

    const AgentConfig test = preset(Environment::Testing);
    CHECK(test.device_id == "test-device");
    CHECK(test.buffer.path == ":memory:");
    CHECK(test.sampling.interval_s == doctest::Approx(1.0));
    CHECK(effective_topic(test) == "test/air/test-device/readings");
    CHECK(effective_client_id(test) == "aqlink-agent-test");

    CHECK_NOTHROW(validate(prod));
    CHECK_NOTHROW(validate(dev));
    CHECK_NOTHROW(validate(test));
}

TEST_CASE("JSON overrides only the keys it names") {
    AgentConfig c = preset(Environment::Production);
    apply_json(c, json::parse(R"({
        "device_id": "roof-2",
        "sampling": { "interval_s": 30 },
        "mqtt": { "host": "broker.local", "username": "pi", "password": "secret" },
        "buffer": { "max_mb": 0 },
        "something_new": { "ignored": true }
    })"));

    CHECK(c.device_id == "roof-2");
    CHECK(c.sampling.interval_s == doctest::Approx(30.0));
    CHECK(c.sampling.queue_capacity == 5000);
    CHECK(c.mqtt.host == "broker.local");
    CHECK(c.mqtt.port == 1883);
    CHECK(c.mqtt.username == std::optional<std::string>("pi"));
    CHECK_FALSE(buffer_max_bytes(c.buffer).has_value());
    CHECK(effective_topic(c) == "air/roof-2/readings");
    CHECK(c.log_level == "WARNING");
}

TEST_CASE("Wrong types are a ConfigError naming the field") {
    AgentConfig c;
    try {
        apply_json(c, json::parse(R"({"mqtt": {"port": "1883"}})"));
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        CHECK(std::string(e.what()).find("mqtt.port") != std::string::npos);
    }
    CHECK_THROWS_AS(apply_json(c, json::parse(R"({"sampling": {"queue_capacity": -5}})")), ConfigError);
    CHECK_THROWS_AS(apply_json(c, json::parse(R"({"sensor": 3})")), ConfigError);
    CHECK_THROWS_AS(apply_json(c, json::parse(R"([1, 2])")), ConfigError);
}

TEST_CASE("validate rejects unusable settings") {
    auto broken = [](auto mutate) {
        AgentConfig c = preset(Environment::Production);
        mutate(c);
        return c;
    };
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.sampling.queue_capacity = 0; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.sampling.interval_s = 0.0; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.buffer.eviction_batch = 0; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.backoff.max_s = 0.5; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.backoff.jitter = 2.0; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.mqtt.port = 70000; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.mqtt.username = "only-user"; })), ConfigError);
    CHECK_THROWS_AS(validate(broken([](AgentConfig& c) { c.log_level = "LOUD"; })), ConfigError);
}

TEST_CASE("The join budget must outlast the longest blocking call") {
    const AgentConfig prod = preset(Environment::Production);
    CHECK(prod.delivery.join_timeout_ms > prod.mqtt.ack_timeout_ms);
    CHECK(sensor_read_budget_ms(prod.sensor) == 5000);
    CHECK(prod.delivery.join_timeout_ms > sensor_read_budget_ms(prod.sensor));

    AgentConfig c = preset(Environment::Production);
    c.delivery.join_timeout_ms = c.mqtt.ack_timeout_ms;
    try {
        validate(c);
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        CHECK(std::string(e.what()).find("mqtt.ack_timeout_ms") != std::string::npos);
    }

    c = preset(Environment::Production);
    c.mqtt.ack_timeout_ms = 1000;
    c.delivery.join_timeout_ms = 5000;      // equals the sensor budget
    CHECK_THROWS_AS(validate(c), ConfigError);
    c.delivery.join_timeout_ms = 5001;
    CHECK_NOTHROW(validate(c));

    c.sensor.max_retries = 5;               // 5 * 2000 - 1000 = 9000
    CHECK(sensor_read_budget_ms(c.sensor) == 9000);
    CHECK_THROWS_AS(validate(c), ConfigError);

    CHECK_NOTHROW(validate(preset(Environment::Testing)));
}

TEST_CASE("load_config reads a file on top of the preset") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("aqlink-config-" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"device_id": "from-file", "mqtt": {"topic": "custom/topic"}})";
    }
    const AgentConfig c = load_config(path.string(), Environment::Testing);
    CHECK(c.device_id == "from-file");
    CHECK(c.buffer.path == ":memory:");
    CHECK(effective_topic(c) == "custom/topic");

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_THROWS_AS(load_config(path.string(), Environment::Testing), ConfigError);
    std::filesystem::remove(path);

    CHECK_THROWS_AS(load_config("/nonexistent/aqlink.json", Environment::Production), ConfigError);
}

TEST_CASE("to_json shows resolved values and masks the password") {
    AgentConfig c = preset(Environment::Production);
    c.mqtt.username = "pi";
    c.mqtt.password = "hunter2";
    const json j = to_json(c);

    CHECK(j.at("environment") == "production");
    CHECK(j.at("mqtt").at("topic") == "air/sensor-pi-01/readings");
    CHECK(j.at("mqtt").at("password") == "***");
    CHECK(j.at("buffer").at("max_mb") == 32);
    CHECK(j.dump().find("hunter2") == std::string::npos);
}

TEST_CASE("Log levels map onto glog thresholds") {
    CHECK(log_thresholds("DEBUG").verbosity == 1);
    CHECK(log_thresholds("info").minloglevel == 0);
    CHECK(log_thresholds("WARNING").minloglevel == 1);
    CHECK(log_thresholds("ERROR").minloglevel == 2);
    CHECK_THROWS_AS(log_thresholds("chatty"), ConfigError);
}
