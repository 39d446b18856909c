// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"   // open_serial(), write_all(), read_exact(), close_serial()

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for timeout-based read loop
#include <cerrno>          // EINTR / EAGAIN checks
#include <chrono>          // deadlines for read_exact / write_all
#include <thread>          // boot delay

namespace aqlink {

namespace {

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Disables echo, line buffering, and flow control (8N1 raw mode).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
// ---------------------------------------------------------------------------
bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cflag &= ~CSTOPB;                       // one stop bit
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

bool to_speed(int baud, speed_t& out) {
    switch (baud) {
        case 2400:   out = B2400;   return true;
        case 4800:   out = B4800;   return true;
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        default:     return false;
    }
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    using namespace std::chrono;
    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace


bool baud_supported(int baud) {
    speed_t ignored;
    return to_speed(baud, ignored);
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open and initialize a serial port at the requested baud.
// The PMS5003 powers up in active mode and streams frames on its own, so
// the input queue is flushed after the boot delay.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    speed_t speed = B9600;
    if (!to_speed(baud, speed)) {
        errno = EINVAL;
        return -1;
    }

    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, speed)) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(boot_delay_ms));
    tcflush(fd, TCIOFLUSH);
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Commands are 6 bytes, so a single write nearly always suffices; the loop
// only covers EAGAIN on a full driver buffer.
// ---------------------------------------------------------------------------
std::size_t write_all(int fd, const uint8_t* data, std::size_t len, int timeout_ms) {
    if (fd < 0 || !data) return 0;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t done = 0;
    pollfd pfd{fd, POLLOUT, 0};

    while (done < len) {
        ssize_t w = ::write(fd, data + done, len - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) break;

        int left = remaining_ms(deadline);
        if (left == 0) break;
        if (::poll(&pfd, 1, left) <= 0) break;
    }
    if (done == len) tcdrain(fd);
    return done;
}


// ---------------------------------------------------------------------------
// read_exact()
// ------------
// Accumulate bytes until n arrived or the total deadline expired.
// Returns the byte count; the caller compares it with what it asked for.
// ---------------------------------------------------------------------------
std::size_t read_exact(int fd, uint8_t* out, std::size_t n, int timeout_ms) {
    if (fd < 0 || !out) return 0;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t got = 0;
    pollfd pfd{fd, POLLIN, 0};

    while (got < n) {
        int left = remaining_ms(deadline);
        if (left == 0) break;

        int pr = ::poll(&pfd, 1, left);
        if (pr == 0) break;                           // timeout expired
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;
        if (pfd.revents & POLLIN) {
            ssize_t r = ::read(fd, out + got, n - got);
            if (r > 0) got += static_cast<std::size_t>(r);
            else if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) break;
        }
    }
    return got;
}


void flush_input(int fd) {
    if (fd >= 0) tcflush(fd, TCIFLUSH);
}


void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace aqlink
