#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux tty transport to the BLE-UART bridge (header-only, SLIP framed).
 *
 * Depends on serial_io.hpp for termios/poll work and slip.hpp for framing.
 * One SLIP frame on the tty = one BLE notification from the device.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "harvestlink/transport/transport_base.hpp"
#include "serial_io.hpp"
#include "slip.hpp"

#include <string>

namespace harvestlink::transport {

struct SerialConfig : public Config {
  std::string path;          // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int boot_delay_ms{400};
};

class LinuxSerialLink : public ITransport {
public:
  explicit LinuxSerialLink(const std::string& dev_path = {}, int baud = 115200)
  : dev_path_(dev_path), baud_(baud) {}

  ~LinuxSerialLink() override { end(); }

  LinuxSerialLink(const LinuxSerialLink&) = delete;
  LinuxSerialLink& operator=(const LinuxSerialLink&) = delete;

  bool begin(const Config& cfg) override {
    // We control the call sites; treat cfg as SerialConfig.
    const auto& sc = static_cast<const SerialConfig&>(cfg);

    end();
    if (!sc.path.empty()) dev_path_ = sc.path;
    baud_ = sc.baud;
    mtu_  = sc.mtu;
    if (dev_path_.empty()) return false;

    fd_ = open_serial(dev_path_, baud_, sc.boot_delay_ms);
    dec_.reset();
    return fd_ >= 0;
  }

  void end() override {
    close_serial(fd_);
    fd_ = -1;
  }

  bool is_open() const override { return fd_ >= 0; }

  RxResult recv_frame(std::vector<uint8_t>& out, int timeout_ms) override {
    out.clear();
    if (fd_ < 0) return RxResult::Error;
    switch (read_frame(fd_, dec_, out, timeout_ms)) {
      case ReadStatus::Frame:   return RxResult::Ok;
      case ReadStatus::Timeout: return RxResult::None;
      case ReadStatus::Hangup:  break;
    }
    end();                      // hangup: the fd is useless from here on
    return RxResult::Error;
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    std::vector<uint8_t> payload(data, data + len);
    return write_frame(fd_, payload) ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "linux-serial"; }
  std::size_t mtu() const override { return mtu_; }

  const std::string& path() const { return dev_path_; }

private:
  int fd_{-1};
  std::string dev_path_;
  int baud_{115200};
  std::size_t mtu_{244};
  slip::decoder dec_;
};

} // namespace harvestlink::transport
