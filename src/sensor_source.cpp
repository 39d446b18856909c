// -----------------------------------------------------------------------------
// sensor_source.cpp: UART and simulator backed PMS5003 sensors
// -----------------------------------------------------------------------------
#include "aqlink/sensor_source.hpp"

#include "aqlink/transport/stream_fake_pms5003.hpp"
#include "aqlink/transport/stream_linux_serial.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace aqlink {

PmSensor::PmSensor(std::unique_ptr<transport::IByteStream> stream, Pms5003Config cfg)
: stream_(std::move(stream)), driver_(*stream_, cfg) {}

Pms5003Config driver_config(const SensorConfig& s) {
  Pms5003Config c;
  c.max_retries = s.max_retries;
  c.timeout     = std::chrono::milliseconds(s.retry_timeout_ms);
  return c;
}

std::unique_ptr<PmSensor> open_serial_sensor(const SensorConfig& s) {
  transport::SerialConfig sc;
  sc.path            = s.port;
  sc.baud            = s.baud;
  sc.read_timeout_ms = s.read_timeout_ms;

  auto stream = std::make_unique<transport::LinuxSerialStream>(sc);
  if (!stream->begin()) {
    LOG(ERROR) << "sensor: cannot open " << s.port << " at " << s.baud << " baud: "
               << std::strerror(errno);
    return nullptr;
  }

  auto sensor = std::make_unique<PmSensor>(std::move(stream), driver_config(s));
  if (!sensor->begin()) {
    // Some modules skip the ack; frame reads still work in that case.
    LOG(WARNING) << "sensor: no passive-mode ack on " << s.port;
  }
  LOG(INFO) << "sensor: PMS5003 on " << s.port << " via " << sensor->stream().name();
  return sensor;
}

std::unique_ptr<PmSensor> make_simulated_sensor(const SensorConfig& s,
                                                std::vector<PmReading> readings) {
  auto stream = std::make_unique<transport::FakePms5003Stream>(std::move(readings));
  auto sensor = std::make_unique<PmSensor>(std::move(stream), driver_config(s));
  if (!sensor->begin()) LOG(WARNING) << "sensor: simulator did not ack passive mode";
  LOG(INFO) << "sensor: using simulated PMS5003";
  return sensor;
}

std::vector<PmReading> make_test_readings(std::size_t count) {
  std::vector<PmReading> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const auto k = static_cast<uint16_t>(i);
    out.push_back(PmReading{static_cast<uint16_t>(10 + k), static_cast<uint16_t>(15 + k),
                            static_cast<uint16_t>(20 + k), static_cast<uint16_t>(12 + k),
                            static_cast<uint16_t>(17 + k), static_cast<uint16_t>(22 + k)});
  }
  return out;
}

} // namespace aqlink
