/**
 * @file publisher.hpp
 * @brief Outbound transport seam: anything that can hand a payload to the backend.
 *
 * @details
 * `publish()` is synchronous and reports delivery, not just acceptance:
 * true means the far side confirmed the message. Failures are reported as
 * false, never thrown. Implementations: MqttPublisher (libmosquitto) in
 * production, scripted fakes in tests.
 */
#ifndef AQLINK_PUBLISHER_HPP
#define AQLINK_PUBLISHER_HPP

#include <string>

namespace aqlink {

class Publisher {
public:
  virtual ~Publisher() = default;

  /// Send one payload. @return true once the remote end acknowledged it.
  virtual bool publish(const std::string& payload) = 0;

  /// Release the connection. Idempotent.
  virtual void close() = 0;
};

} // namespace aqlink

#endif // AQLINK_PUBLISHER_HPP
