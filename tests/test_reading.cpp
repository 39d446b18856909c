#include <doctest/doctest.h>
#include "aqlink/reading.hpp"

#include <nlohmann/json.hpp>

using namespace aqlink;
using nlohmann::json;

TEST_CASE("PmReading serializes to a compact object with six keys") {
    PmReading r{10, 12, 15, 11, 13, 16};
    const json j = json::parse(r.to_string());

    CHECK(j.size() == 6);
    CHECK(j.at("pm1_cf") == 10);
    CHECK(j.at("pm25_cf") == 12);
    CHECK(j.at("pm10_cf") == 15);
    CHECK(j.at("pm1_atm") == 11);
    CHECK(j.at("pm25_atm") == 13);
    CHECK(j.at("pm10_atm") == 16);
    CHECK(r.to_string().find(' ') == std::string::npos);
}

TEST_CASE("SensorReading nests the payload as a JSON string") {
    SensorReading s;
    s.ts = 1700000000.25;
    s.device_id = "sensor-pi-01";
    s.payload = PmReading{1, 2, 3, 4, 5, 6};

    const json j = json::parse(s.to_string());
    CHECK(j.at("device_id") == "sensor-pi-01");
    CHECK(j.at("ts").get<double>() == doctest::Approx(1700000000.25));
    REQUIRE(j.at("payload").is_string());
    CHECK(json::parse(j.at("payload").get<std::string>()).at("pm10_atm") == 6);
}

TEST_CASE("SensorReading parses back what it wrote") {
    SensorReading s{1234.5, "dev-7", PmReading{100, 200, 300, 400, 500, 600}};
    auto back = SensorReading::from_string(s.to_string());
    REQUIRE(back.has_value());
    CHECK(back->ts == doctest::Approx(1234.5));
    CHECK(back->device_id == "dev-7");
    CHECK(back->payload == s.payload);
}

TEST_CASE("Malformed input parses to nullopt instead of throwing") {
    CHECK_FALSE(PmReading::from_string("").has_value());
    CHECK_FALSE(PmReading::from_string("not json").has_value());
    CHECK_FALSE(PmReading::from_string("[1,2,3]").has_value());
    CHECK_FALSE(PmReading::from_string(R"({"pm1_cf":1})").has_value());
    CHECK_FALSE(PmReading::from_string(
        R"({"pm1_cf":-1,"pm25_cf":0,"pm10_cf":0,"pm1_atm":0,"pm25_atm":0,"pm10_atm":0})").has_value());
    CHECK_FALSE(PmReading::from_string(
        R"({"pm1_cf":70000,"pm25_cf":0,"pm10_cf":0,"pm1_atm":0,"pm25_atm":0,"pm10_atm":0})").has_value());

    CHECK_FALSE(SensorReading::from_string(R"({"ts":1,"device_id":"x"})").has_value());
    CHECK_FALSE(SensorReading::from_string(R"({"ts":"1","device_id":"x","payload":"{}"})").has_value());
    // Inlined object instead of a nested string is not the canonical form.
    CHECK_FALSE(SensorReading::from_string(
        R"({"ts":1,"device_id":"x","payload":{"pm1_cf":0}})").has_value());
}

TEST_CASE("wall_time_seconds is a plausible epoch time") {
    const double t = wall_time_seconds();
    CHECK(t > 1.6e9);
    CHECK(t < 4.0e9);
}
