// ============================================================================
// serial_io.cpp — implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "serial_io.hpp"   // open_serial(), write_frame(), read_frame(), close_serial()
#include "slip.hpp"        // harvestlink::slip::encode() and decoder

#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, O_NONBLOCK)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for the timed read loop
#include <cerrno>          // EAGAIN / EINTR checks
#include <chrono>          // read_frame deadline

namespace harvestlink {

// ---------------------------------------------------------------------------
// to_speed()
// ----------
// Map a baud integer onto a termios speed. Returns B0 for unsupported values
// so callers can decide whether to fall back.
// ---------------------------------------------------------------------------
static speed_t to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
        default:     return B0;
    }
}

bool baud_supported(int baud) {
    return to_speed(baud) != B0;
}

// ---------------------------------------------------------------------------
// set_raw()
// ---------
// Raw 8N1, no flow control, VMIN=VTIME=0 (poll() does the waiting).
// Internal helper for open_serial() only.
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // bridge has no RTS/CTS wired
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}

// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Unlike a bare open(), a port we cannot configure is closed again and
// reported as a failure: a half-configured tty would corrupt every page.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;                        // missing device, permissions, ...

    speed_t sp = to_speed(baud);
    if (sp == B0) sp = B115200;

    if (!set_raw(fd, sp)) {
        ::close(fd);
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);                       // drop bridge boot chatter
    return fd;
}

bool write_frame(int fd, const std::vector<uint8_t>& payload) {
    if (fd < 0) return false;
    std::vector<uint8_t> out;
    slip::encode(payload.data(), payload.size(), out);
    return ::write(fd, out.data(), out.size()) == static_cast<ssize_t>(out.size());
}

// ---------------------------------------------------------------------------
// read_frame()
// ------------
// Poll until the deadline, feeding one byte at a time into the caller's
// decoder. One byte per read keeps any following frame in the kernel buffer
// for the next call.
//
// Hangup detection:
// - POLLHUP/POLLERR/POLLNVAL in revents,
// - read() == 0 on a readable fd (tty EOF after the bridge unplugs),
// - read() < 0 with anything but EAGAIN/EWOULDBLOCK/EINTR.
// ---------------------------------------------------------------------------
ReadStatus read_frame(int fd, slip::decoder& dec, std::vector<uint8_t>& out, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    out.clear();
    if (fd < 0) return ReadStatus::Hangup;

    const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms < 0 ? 0 : timeout_ms);
    pollfd pfd{fd, POLLIN, 0};
    uint8_t byte = 0;

    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
        if (left < 0) left = 0;

        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr < 0) {
            if (errno == EINTR) continue;
            return ReadStatus::Hangup;
        }
        if (pr == 0) return ReadStatus::Timeout;

        if (pfd.revents & (POLLERR | POLLNVAL)) return ReadStatus::Hangup;

        if (pfd.revents & POLLIN) {
            ssize_t n = ::read(fd, &byte, 1);
            if (n == 1) {
                if (dec.feed(byte, out)) return ReadStatus::Frame;
                continue;
            }
            if (n == 0) return ReadStatus::Hangup;
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            return ReadStatus::Hangup;
        }

        if (pfd.revents & POLLHUP) return ReadStatus::Hangup;  // nothing left to drain
    }
}

void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace harvestlink
