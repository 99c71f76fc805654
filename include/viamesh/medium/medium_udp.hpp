#pragma once
/**
 * @file medium_udp.hpp
 * @brief UDP broadcast medium (header-only, POSIX sockets, poll timeout).
 *
 * Every host binds the same UDP port (the channel) and broadcasts to the
 * configured broadcast address. SO_REUSEADDR/SO_REUSEPORT let several hosts
 * share one machine for testing; each of them hears every datagram.
 *
 * Depends on: sys/socket.h, netinet/in.h, arpa/inet.h, poll.h.
 */

#if !defined(__linux__)
#  error "medium_udp.hpp is Linux-only."
#endif

#include "viamesh/medium/medium_base.hpp"
#include "viamesh/log.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace viamesh::medium {

struct UdpConfig : public Config {
  std::string bind_address{"0.0.0.0"};
  std::string broadcast_address{"255.255.255.255"};
};

class UdpMedium : public IMedium {
public:
  UdpMedium() = default;
  ~UdpMedium() override { end(); }

  UdpMedium(const UdpMedium&) = delete;
  UdpMedium& operator=(const UdpMedium&) = delete;

  bool begin(const Config& cfg) override {
    // Call sites always pass a UdpConfig here.
    const auto& uc = static_cast<const UdpConfig&>(cfg);
    end();
    mtu_ = uc.mtu;

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port = htons(uc.channel);
    if (::inet_pton(AF_INET, uc.bind_address.c_str(), &local.sin_addr) != 1) {
      log::logger()->error("udp: invalid bind address '{}'", uc.bind_address);
      return false;
    }

    dest_ = sockaddr_in{};
    dest_.sin_family = AF_INET;
    dest_.sin_port = htons(uc.channel);
    if (::inet_pton(AF_INET, uc.broadcast_address.c_str(), &dest_.sin_addr) != 1) {
      log::logger()->error("udp: invalid broadcast address '{}'", uc.broadcast_address);
      return false;
    }

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) return fail("socket");

    int yes = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) return fail("SO_REUSEADDR");
#ifdef SO_REUSEPORT
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes)) < 0) return fail("SO_REUSEPORT");
#endif
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &yes, sizeof(yes)) < 0) return fail("SO_BROADCAST");

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) return fail("bind");

    log::logger()->info("udp: channel {} up, broadcasting to {}", uc.channel, uc.broadcast_address);
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  TxResult broadcast(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    if (len > mtu_) return TxResult::Error;
    ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&dest_), sizeof(dest_));
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == ENOBUFS)) return TxResult::Busy;
    return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
  }

  RxResult wait(uint8_t* out, std::size_t cap, std::size_t& out_len, uint32_t timeout_ms) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (pr == 0) return RxResult::None;
    if (pr < 0) return errno == EINTR ? RxResult::None : RxResult::Error;

    ssize_t r = ::recvfrom(fd_, out, cap, 0, nullptr, nullptr);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0 || errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
    return RxResult::Error;
  }

  const char* name() const override { return "udp"; }
  std::size_t mtu() const override { return mtu_; }

private:
  bool fail(const char* what) {
    log::logger()->error("udp: {} failed: {}", what, std::strerror(errno));
    end();
    return false;
  }

  int fd_{-1};
  sockaddr_in dest_{};
  std::size_t mtu_{1400};
};

} // namespace viamesh::medium
