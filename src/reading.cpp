/**
 * @file reading.cpp
 * @brief Canonical serialization for PmReading / SensorReading.
 *
 * Refer to `reading.hpp` for the format and its rationale.
 */
#include "aqlink/reading.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace aqlink {

namespace {

// Read a uint16 field; false if absent or not an unsigned integer in range.
bool take_u16(const json& j, const char* key, uint16_t& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) return false;
  const auto v = it->get<int64_t>();
  if (v < 0 || v > 0xFFFF) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

} // namespace

std::string PmReading::to_string() const {
  json j;
  j["pm1_cf"]   = pm1_cf;
  j["pm25_cf"]  = pm25_cf;
  j["pm10_cf"]  = pm10_cf;
  j["pm1_atm"]  = pm1_atm;
  j["pm25_atm"] = pm25_atm;
  j["pm10_atm"] = pm10_atm;
  return j.dump();
}

std::optional<PmReading> PmReading::from_string(const std::string& text) {
  try {
    const auto j = json::parse(text);
    if (!j.is_object()) return std::nullopt;

    PmReading r;
    if (!take_u16(j, "pm1_cf", r.pm1_cf)     ||
        !take_u16(j, "pm25_cf", r.pm25_cf)   ||
        !take_u16(j, "pm10_cf", r.pm10_cf)   ||
        !take_u16(j, "pm1_atm", r.pm1_atm)   ||
        !take_u16(j, "pm25_atm", r.pm25_atm) ||
        !take_u16(j, "pm10_atm", r.pm10_atm)) {
      return std::nullopt;
    }
    return r;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

bool operator==(const PmReading& a, const PmReading& b) {
  return a.pm1_cf == b.pm1_cf && a.pm25_cf == b.pm25_cf && a.pm10_cf == b.pm10_cf &&
         a.pm1_atm == b.pm1_atm && a.pm25_atm == b.pm25_atm && a.pm10_atm == b.pm10_atm;
}

std::string SensorReading::to_string() const {
  json j;
  j["ts"]        = ts;
  j["device_id"] = device_id;
  j["payload"]   = payload.to_string();   // nested as a string, not an object
  return j.dump();
}

std::optional<SensorReading> SensorReading::from_string(const std::string& text) {
  try {
    const auto j = json::parse(text);
    if (!j.is_object()) return std::nullopt;

    auto ts  = j.find("ts");
    auto dev = j.find("device_id");
    auto pl  = j.find("payload");
    if (ts == j.end() || !ts->is_number()) return std::nullopt;
    if (dev == j.end() || !dev->is_string()) return std::nullopt;
    if (pl == j.end() || !pl->is_string()) return std::nullopt;

    auto inner = PmReading::from_string(pl->get<std::string>());
    if (!inner) return std::nullopt;

    SensorReading r;
    r.ts        = ts->get<double>();
    r.device_id = dev->get<std::string>();
    r.payload   = *inner;
    return r;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

double wall_time_seconds() {
  using namespace std::chrono;
  return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

} // namespace aqlink
