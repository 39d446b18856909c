/**
 * @file reading.hpp
 * @brief aqlink reading types and their canonical wire/disk string form.
 *
 * @details
 * ## What travels
 * A particulate sample starts life as a decoded sensor frame (`PmReading`),
 * gets stamped with wall time and a device id by a sampling thread
 * (`SensorReading`), and is then serialized exactly once. From that point on
 * the pipeline only moves strings: the sampling queue, the delivery backlog,
 * the SQLite buffer and the MQTT payload all hold the same bytes.
 *
 * ## Canonical form
 * ```
 *   {"device_id":"sensor-pi-01","payload":"{\"pm10_atm\":15,...}","ts":1718000000.25}
 * ```
 * - Keys are emitted in sorted order (nlohmann::json object ordering), so two
 *   equal readings always serialize to the same bytes.
 * - `payload` is the PmReading's own canonical string, nested as a JSON
 *   *string*. The ingestion side decodes it in a second step. Keeping it
 *   opaque lets the envelope stay stable if the sensor payload grows fields.
 *
 * ## Failure model
 * - `from_string()` never throws; malformed input yields `std::nullopt`.
 */
#ifndef AQLINK_READING_HPP
#define AQLINK_READING_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace aqlink {

/**
 * @brief Six particulate concentrations decoded from one sensor frame (µg/m³).
 *
 * `*_cf` values use the factory calibration factor (CF=1); `*_atm` values are
 * the sensor's atmospheric-environment estimate.
 */
struct PmReading {
  uint16_t pm1_cf{0};
  uint16_t pm25_cf{0};
  uint16_t pm10_cf{0};
  uint16_t pm1_atm{0};
  uint16_t pm25_atm{0};
  uint16_t pm10_atm{0};

  /// Compact JSON object with the six fields.
  std::string to_string() const;

  /// Parse the form produced by to_string(); nullopt on missing keys or bad types.
  static std::optional<PmReading> from_string(const std::string& text);
};

bool operator==(const PmReading& a, const PmReading& b);
inline bool operator!=(const PmReading& a, const PmReading& b) { return !(a == b); }

/**
 * @brief A PmReading stamped with time and origin. Never mutated after creation.
 */
struct SensorReading {
  double      ts{0.0};      ///< seconds since the Unix epoch (wall clock)
  std::string device_id;
  PmReading   payload;

  std::string to_string() const;
  static std::optional<SensorReading> from_string(const std::string& text);
};

/// Current wall-clock time as float seconds since the epoch.
double wall_time_seconds();

} // namespace aqlink

#endif // AQLINK_READING_HPP
