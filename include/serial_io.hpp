/**
 * @page aq-serial-io-hdr aqlink Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move fixed-size byte blocks to and from a sensor.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the minimal surface needed to talk to a UART-attached
 * particulate sensor from a Linux host. It pairs with serial_io.cpp for the
 * POSIX work. The sensor protocol has no framing byte of its own: the host
 * writes a short command and then reads an exact number of bytes back. That
 * is all this layer does.
 *
 * ROLE IN AQLINK
 * --------------
 * - aqlink::open_serial: acquire a file descriptor to a TTY, set raw mode, and
 *   drop whatever the sensor streamed before we took control.
 * - aqlink::write_all: write one command in full.
 * - aqlink::read_exact: poll and accumulate bytes until n arrived or the timeout hit.
 * - aqlink::close_serial: close the descriptor cleanly.
 *
 * These functions are used by:
 * - transport::LinuxSerialStream, the IByteStream the sensor driver reads from.
 * - aqlink-cli `read`, for one-shot probes from a shell.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   [Pms5003] -> IByteStream -> LinuxSerialStream -> read_exact()/write_all()
 *                                                  \-> serial_io.cpp (syscalls)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: on a Raspberry Pi the PMS5003 usually sits on /dev/serial0.
 *   Prefer that symlink over /dev/ttyAMA0 or /dev/ttyS0.
 * - Baud: the PMS5003 only speaks 9600 8N1.
 * - Timeouts: read_exact returns the number of bytes actually collected. A short
 *   count means timeout or link error; the driver decides whether to retry.
 *
 * LIMITATIONS AND TRADE-OFFS
 * --------------------------
 * - Baud table: a small set of common rates is mapped to termios speeds.
 *   Unknown values fall back to 9600.
 * - Concurrency: do not share a single fd between threads without external
 *   synchronization. In aqlink one sampling thread owns each port.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace aqlink {

/**
 * @brief Open a Linux TTY device, configure it for raw I/O, and return its file descriptor.
 *
 * What it does:
 *   - Opens the device path with O_RDWR | O_NOCTTY | O_NONBLOCK.
 *   - Puts the port into raw 8N1 mode with no flow control.
 *   - Sets the baud rate from a fixed table (2400..230400). Any other rate
 *     fails with errno = EINVAL before the device is touched.
 *   - Waits boot_delay_ms, then flushes whatever the sensor sent in active mode.
 *
 * @param dev            Device path, e.g. "/dev/serial0".
 * @param baud           Requested baud rate. Default 9600 (PMS5003).
 * @param boot_delay_ms  Milliseconds to sleep after opening before first I/O.
 * @return File descriptor (non-negative) on success, or -1 on failure.
 */
int open_serial(const std::string& dev, int baud = 9600, int boot_delay_ms = 100);

/// True if open_serial() can configure @p baud.
bool baud_supported(int baud);

/**
 * @brief Write @p len bytes to the port, looping over partial writes.
 *
 * @return Number of bytes written. Less than @p len means the port refused
 *         more data within @p timeout_ms or failed.
 */
std::size_t write_all(int fd, const uint8_t* data, std::size_t len, int timeout_ms = 500);

/**
 * @brief Read up to @p n bytes, waiting at most @p timeout_ms in total.
 *
 * Uses poll(2) and keeps reading until @p n bytes arrived, the deadline
 * passed, or the descriptor reported an error.
 *
 * @return Number of bytes placed into @p out (0..n).
 */
std::size_t read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms = 1000);

/**
 * @brief Discard anything pending in the kernel input queue.
 */
void flush_input(int fd);

/**
 * @brief Close a serial file descriptor obtained from open_serial().
 *
 * @param fd  File descriptor to close. If negative, the call is a no-op.
 */
void close_serial(int fd);

} // namespace aqlink
