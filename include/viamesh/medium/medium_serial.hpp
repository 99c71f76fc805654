#pragma once
/**
 * @file medium_serial.hpp
 * @brief Serial radio modem medium: SLIP frames over a Linux TTY (header-only).
 *
 * The modem on the other end of the wire owns the air interface; whatever it
 * hears it hands over as one SLIP frame, whatever we write it broadcasts.
 */

#if !defined(__linux__)
#  error "medium_serial.hpp is Linux-only."
#endif

#include "viamesh/medium/medium_base.hpp"
#include "viamesh/log.hpp"
#include "serial_io.hpp"
#include "slip.hpp"
#include <string>
#include <vector>
#include <cerrno>
#include <cstring>

namespace viamesh::medium {

struct SerialConfig : public Config {
  SerialConfig() { mtu = 240; }   // typical LoRa modem frame
  std::string path;               // e.g. /dev/serial/by-id/usb-...
  int baud{115200};
  int boot_delay_ms{400};
};

class SerialMedium : public IMedium {
public:
  SerialMedium() = default;
  ~SerialMedium() override { end(); }

  SerialMedium(const SerialMedium&) = delete;
  SerialMedium& operator=(const SerialMedium&) = delete;

  bool begin(const Config& cfg) override {
    // Call sites always pass a SerialConfig here.
    const auto& sc = static_cast<const SerialConfig&>(cfg);
    end();

    mtu_ = sc.mtu;
    dec_ = slip::decoder(sc.mtu);
    if (sc.path.empty()) {
      log::logger()->error("serial: no device path");
      return false;
    }

    fd_ = open_serial(sc.path, sc.baud, sc.boot_delay_ms);
    if (fd_ < 0) {
      log::logger()->error("serial: cannot open {}: {}", sc.path, std::strerror(errno));
      return false;
    }
    log::logger()->info("serial: {} up at {} baud", sc.path, sc.baud);
    return true;
  }

  void end() override {
    close_serial(fd_);
    fd_ = -1;
    dec_.reset();
  }

  TxResult broadcast(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    if (len > mtu_) return TxResult::Error;
    tx_.assign(data, data + len);
    errno = 0;
    if (write_frame(fd_, tx_)) return TxResult::Ok;
    return (errno == EAGAIN || errno == EWOULDBLOCK) ? TxResult::Busy : TxResult::Error;
  }

  RxResult wait(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t timeout_ms) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;

    if (!read_frame(fd_, dec_, rx_, static_cast<int>(timeout_ms))) {
      return errno == 0 ? RxResult::None : RxResult::Error;
    }
    if (rx_.size() > cap) return RxResult::None;   // cannot be a viamesh frame
    std::memcpy(out, rx_.data(), rx_.size());
    out_len = rx_.size();
    return RxResult::Ok;
  }

  const char* name() const override { return "serial"; }
  std::size_t mtu() const override { return mtu_; }

private:
  int fd_{-1};
  std::size_t mtu_{240};
  slip::decoder dec_;
  std::vector<uint8_t> tx_;
  std::vector<uint8_t> rx_;
};

} // namespace viamesh::medium
