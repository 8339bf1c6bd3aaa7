#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal datagram transport interface the device client talks through.
 *
 * Header-only. The real implementation is a UDP socket (transport_linux_udp.hpp);
 * tests plug in a simulated unit.
 */

#include <cstddef>
#include <cstdint>

namespace ventobridge::transport {

// Return codes kept simple; the device client maps them onto its retry policy.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t {
  None=0,     // timeout expired, nothing received
  Ok=1,       // one datagram from the configured peer
  Foreign=2,  // a datagram arrived from someone else and was discarded
  Error=3
};

struct Config {
  uint16_t mtu{512};
};

/**
 * @brief Transport trait every datagram link can rely on.
 *
 * Contract:
 *  - begin() resolves the peer and opens the link.
 *  - send(buf,len) transmits exactly one datagram to the peer.
 *  - recv(buf,cap,len,timeout_ms) waits at most timeout_ms for one datagram.
 *    Only datagrams whose source matches the peer's address are returned as Ok.
 *    timeout_ms == 0 polls without blocking.
 *  - end() closes the link; safe to call twice.
 *  - name() is a short identifier for logs.
 */
class IDatagramTransport {
public:
  virtual ~IDatagramTransport() = default;
  virtual bool        begin() = 0;
  virtual void        end() = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, int timeout_ms) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace ventobridge::transport
