/**
 * @file serial_io.hpp
 * @brief Open the BLE-UART bridge tty in raw mode and move SLIP-framed notifications.
 *
 * @details
 * PURPOSE
 * -------
 * The smallest surface needed to talk to the bridge from a Linux host. It
 * pairs with serial_io.cpp for the POSIX work and with slip.hpp for framing.
 * LinuxSerialLink (transport/transport_linux_serial.hpp) is the only caller
 * in the library; tests and tools may use the free functions directly.
 *
 *   open_serial()  -> write_frame()/read_frame() -> close_serial()
 *        \-> termios raw 8N1      \-> slip.hpp
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Device selection: prefer /dev/serial/by-id/... for stable paths.
 * - Permissions: the runtime user needs the dialout group.
 * - read_frame() tells a clean timeout apart from a hangup; a hangup is the
 *   host's "disconnected" signal for the fetch engine.
 * - Writes are all-or-nothing: a short write counts as a failure.
 * - Do not share one fd between threads without external locking.
 */
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "slip.hpp"

namespace harvestlink {

/// Outcome of one read_frame() call.
enum class ReadStatus : uint8_t {
    Frame   = 0,  ///< one complete payload delivered
    Timeout = 1,  ///< deadline passed with no complete frame
    Hangup  = 2   ///< device gone (POLLHUP/POLLERR, EOF, or read error)
};

/**
 * @brief Open a tty, configure raw 8N1 at @p baud, wait out the USB reset, flush.
 *
 * @param dev            Device path, e.g. "/dev/ttyACM0".
 * @param baud           9600, 19200, 38400, 57600, 115200, 230400, 460800.
 *                       Anything else falls back to 115200.
 * @param boot_delay_ms  Sleep after open before the first flush (USB CDC
 *                       bridges reset on open). Default 400 ms.
 * @return fd (>= 0) on success, -1 on failure. Caller closes with close_serial().
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief SLIP-encode @p payload and write it in one call.
 * @return true only if every encoded byte was written.
 */
bool write_frame(int fd, const std::vector<uint8_t>& payload);

/**
 * @brief Wait up to @p timeout_ms for one complete SLIP frame.
 *
 * @param dec  Decoder that persists across calls, so partial frames are kept.
 * @param out  Receives the payload on ReadStatus::Frame; cleared at entry.
 */
ReadStatus read_frame(int fd, slip::decoder& dec, std::vector<uint8_t>& out, int timeout_ms = 1500);

/// Close an fd from open_serial(). Negative fds are ignored.
void close_serial(int fd);

/// true if @p baud has a termios speed on this platform.
bool baud_supported(int baud);

} // namespace harvestlink
