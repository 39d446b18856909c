/**
 * @file sensor_source.hpp
 * @brief A PMS5003 driver bundled with the byte stream it owns.
 *
 * @details
 * The driver only holds a reference to its stream, so something has to own
 * both for the lifetime of the sampling thread. PmSensor is that owner. Two
 * builders cover the deployments: a real UART and the built-in simulator.
 */
#ifndef AQLINK_SENSOR_SOURCE_HPP
#define AQLINK_SENSOR_SOURCE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "aqlink/config.hpp"
#include "aqlink/pms5003.hpp"
#include "aqlink/reading.hpp"
#include "aqlink/transport/byte_stream.hpp"

namespace aqlink {

class PmSensor {
public:
  /// Takes ownership of @p stream and builds the driver on top of it.
  PmSensor(std::unique_ptr<transport::IByteStream> stream, Pms5003Config cfg);

  PmSensor(const PmSensor&) = delete;
  PmSensor& operator=(const PmSensor&) = delete;

  /// Switch the sensor to passive mode. @return false if no ack came back.
  bool begin() { return driver_.begin(); }

  std::optional<PmReading> read() { return driver_.read(); }

  const Pms5003& driver() const { return driver_; }
  transport::IByteStream& stream() { return *stream_; }

private:
  std::unique_ptr<transport::IByteStream> stream_;
  Pms5003 driver_;
};

/// Driver tuning taken from the sensor section of the config.
Pms5003Config driver_config(const SensorConfig& s);

/**
 * @brief Open the UART named in @p s and put the sensor in passive mode.
 * @return nullptr if the port cannot be opened. A missing ack is only logged.
 */
std::unique_ptr<PmSensor> open_serial_sensor(const SensorConfig& s);

/// Simulated sensor replaying @p readings (the last one repeats).
std::unique_ptr<PmSensor> make_simulated_sensor(const SensorConfig& s,
                                                std::vector<PmReading> readings);

/// @p count distinct, increasing readings for test runs.
std::vector<PmReading> make_test_readings(std::size_t count);

} // namespace aqlink

#endif // AQLINK_SENSOR_SOURCE_HPP
