#pragma once
/**
 * @file byte_stream.hpp
 * @brief Minimal byte-stream interface the sensor driver reads frames from.
 *
 * Header-only on purpose. A real UART, a pseudo-TTY, or a simulator can sit
 * behind it; the driver never knows which.
 */

#include <cstddef>
#include <cstdint>

namespace aqlink::transport {

/**
 * @brief Byte stream trait every sensor link implements.
 *
 * Contract:
 *  - write(data,len) sends a command; returns bytes accepted.
 *  - read(out,n) blocks until n bytes arrived or the stream's own read
 *    timeout expired; returns bytes actually read (0..n). A short count is
 *    not an error by itself, the caller validates.
 *  - name() is a short identifier for logs/diagnostics.
 */
class IByteStream {
public:
  virtual ~IByteStream() = default;
  virtual std::size_t write(const uint8_t* data, std::size_t len) = 0;
  virtual std::size_t read(uint8_t* out, std::size_t n) = 0;
  virtual const char* name() const = 0;
};

} // namespace aqlink::transport
