#pragma once
/**
 * @file stream_linux_serial.hpp
 * @brief Linux UART byte stream (header-only, termios via serial_io).
 *
 * Depends on serial_io.hpp for the syscalls. Owns its descriptor.
 */

#if !defined(__linux__)
#  error "stream_linux_serial.hpp is Linux-only."
#endif

#include "aqlink/transport/byte_stream.hpp"
#include "serial_io.hpp"
#include <string>

namespace aqlink::transport {

struct SerialConfig {
  std::string path{"/dev/serial0"};
  int baud{9600};
  int read_timeout_ms{1000};  // per read() call
  int boot_delay_ms{100};
};

class LinuxSerialStream : public IByteStream {
public:
  explicit LinuxSerialStream(const SerialConfig& cfg) : cfg_(cfg) {}
  ~LinuxSerialStream() override { end(); }

  LinuxSerialStream(const LinuxSerialStream&) = delete;
  LinuxSerialStream& operator=(const LinuxSerialStream&) = delete;

  bool begin() {
    if (is_open()) return true;
    if (cfg_.path.empty()) return false;
    fd_ = open_serial(cfg_.path, cfg_.baud, cfg_.boot_delay_ms);
    return is_open();
  }

  void end() {
    if (is_open()) { close_serial(fd_); fd_ = -1; }
  }

  bool is_open() const { return fd_ >= 0; }

  std::size_t write(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return 0;
    // A stale partial frame would shift every following read; drop it first.
    flush_input(fd_);
    return write_all(fd_, data, len);
  }

  std::size_t read(uint8_t* out, std::size_t n) override {
    if (fd_ < 0 || !out || !n) return 0;
    return read_exact(fd_, out, n, cfg_.read_timeout_ms);
  }

  const char* name() const override { return "linux-serial"; }
  const std::string& path() const { return cfg_.path; }

private:
  SerialConfig cfg_;
  int fd_{-1};
};

} // namespace aqlink::transport
