#pragma once
/**
 * @file transport_linux_udp.hpp
 * @brief Linux UDP transport to one unit (header-only, sockets + poll).
 *
 * Depends on: sys/socket.h, netdb.h, poll.h. STL only for std::string.
 *
 * The socket is left unconnected so replies can be checked against the unit's
 * address explicitly; anything else that lands on the port is reported as
 * RxResult::Foreign and dropped.
 */

#if !defined(__linux__)
#  error "transport_linux_udp.hpp is Linux-only."
#endif

#include "ventobridge/transport/transport_base.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace ventobridge::transport {

struct UdpConfig : public Config {
  std::string host;     // unit hostname or IP
  uint16_t    port{4000};
};

class LinuxUdp : public IDatagramTransport {
public:
  explicit LinuxUdp(const UdpConfig& cfg) : cfg_(cfg) {}
  ~LinuxUdp() override { end(); }

  LinuxUdp(const LinuxUdp&) = delete;
  LinuxUdp& operator=(const LinuxUdp&) = delete;

  bool begin() override {
    end();
    last_error_.clear();
    if (cfg_.host.empty()) { last_error_ = "empty_host"; return false; }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(cfg_.port);
    int rc = ::getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
      last_error_ = std::string("resolve_failed:") + ::gai_strerror(rc);
      return false;
    }

    // First address we can open a socket for wins.
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
      int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
      if (fd < 0) continue;
      std::memcpy(&peer_, ai->ai_addr, ai->ai_addrlen);
      peer_len_ = ai->ai_addrlen;
      fd_ = fd;
      break;
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
      last_error_ = std::string("socket_failed:") + std::strerror(errno);
      return false;
    }
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;
    ssize_t w = ::sendto(fd_, data, len, 0,
                         reinterpret_cast<const sockaddr*>(&peer_), peer_len_);
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
    if (w < 0) last_error_ = std::string("send_failed:") + std::strerror(errno);
    return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    if (fd_ < 0 || !out || cap == 0) return RxResult::Error;

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms < 0 ? 0 : timeout_ms);
    if (pr == 0) return RxResult::None;                  // timeout expired
    if (pr < 0)  return errno == EINTR ? RxResult::None : RxResult::Error;

    sockaddr_storage from{};
    socklen_t from_len = sizeof(from);
    ssize_t r = ::recvfrom(fd_, out, cap, 0, reinterpret_cast<sockaddr*>(&from), &from_len);
    if (r < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
      last_error_ = std::string("recv_failed:") + std::strerror(errno);
      return RxResult::Error;
    }
    if (!same_host(from)) return RxResult::Foreign;
    out_len = static_cast<std::size_t>(r);
    return RxResult::Ok;
  }

  const char* name() const override { return "linux-udp"; }
  std::size_t mtu() const override { return cfg_.mtu; }

  const std::string& last_error() const { return last_error_; }
  const UdpConfig& config() const { return cfg_; }

private:
  // Address match only; the unit may answer from another source port.
  bool same_host(const sockaddr_storage& from) const {
    if (from.ss_family != peer_.ss_family) return false;
    if (from.ss_family == AF_INET) {
      const auto* a = reinterpret_cast<const sockaddr_in*>(&from);
      const auto* b = reinterpret_cast<const sockaddr_in*>(&peer_);
      return a->sin_addr.s_addr == b->sin_addr.s_addr;
    }
    if (from.ss_family == AF_INET6) {
      const auto* a = reinterpret_cast<const sockaddr_in6*>(&from);
      const auto* b = reinterpret_cast<const sockaddr_in6*>(&peer_);
      return std::memcmp(&a->sin6_addr, &b->sin6_addr, sizeof(in6_addr)) == 0;
    }
    return false;
  }

  UdpConfig        cfg_;
  int              fd_{-1};
  sockaddr_storage peer_{};
  socklen_t        peer_len_{0};
  std::string      last_error_;
};

} // namespace ventobridge::transport
