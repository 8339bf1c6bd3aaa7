/**
 * @page vb-device-client Vento Device Client
 * @file device_client.hpp
 * @brief One unit, one socket, one transaction at a time.
 *
 * @details
 * PURPOSE
 * -------
 * The device client turns "give me the status page" and "set fan-speed to 3"
 * into request/reply exchanges over an unreliable datagram link:
 *   - encode the request (codec.hpp),
 *   - send it, wait up to `timeout_ms` for a reply from the unit's address,
 *   - decode the reply; on silence or garbage, resend,
 *   - give up after `attempts` sends with `ErrorCode::DeviceUnreachable`.
 *
 * CORRELATION
 * -----------
 * The protocol has no sequence numbers. A reply belongs to the current
 * transaction because only one transaction is ever outstanding (the mutex
 * below) and because the transport only hands back datagrams from the unit's
 * address. Datagrams that were still queued from an earlier, timed-out attempt
 * are drained before each new send.
 *
 * - Foreign sender:        ignored, the wait continues, no attempt consumed.
 * - Malformed reply:       logged, attempt consumed, request resent.
 * - Silence for timeout:   attempt consumed, request resent.
 *
 * TOGGLES
 * -------
 * Power is a toggle on the unit: the frame carries no target state. For
 * Toggle parameters `set_parameter()` reads the status page first and sends
 * the toggle only when the current state differs, all under one lock hold so
 * no poll can slip in between.
 *
 * A toggle frame is never resent blindly: a lost reply may hide a toggle the
 * unit already applied. Each toggle gets one send; if no reply comes back the
 * status page is read again (read-all is safe to repeat) and the toggle is
 * sent again only if the state still differs. Success means the unit reports
 * the requested state.
 *
 * THREADING
 * ---------
 * Every public call takes the mutex for its whole exchange. The bridge loop
 * is the only caller in the daemon, but the lock keeps the guarantee if more
 * callers appear. `cancel()` may be called from any thread; the current wait
 * finishes within one timeout and no further attempts are made.
 */
#ifndef VENTOBRIDGE_DEVICE_CLIENT_HPP
#define VENTOBRIDGE_DEVICE_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

#include "ventobridge/codec.hpp"
#include "ventobridge/error.hpp"
#include "ventobridge/parameter.hpp"
#include "ventobridge/transport/transport_base.hpp"

namespace ventobridge {

struct DeviceClientConfig {
  int timeout_ms{2000};  ///< wait per attempt
  int attempts{3};       ///< total sends per transaction, >= 1
};

/// Per-client counters, read by the daemon for periodic log summaries.
struct DeviceStats {
  uint32_t transactions{0};
  uint32_t sends{0};
  uint32_t timeouts{0};
  uint32_t decode_errors{0};
  uint32_t foreign{0};
  uint32_t failures{0};
};

class DeviceClient {
public:
  DeviceClient(transport::IDatagramTransport& link, const DeviceClientConfig& cfg);

  DeviceClient(const DeviceClient&) = delete;
  DeviceClient& operator=(const DeviceClient&) = delete;

  /**
   * @brief Read the full status page.
   *
   * @param out  Decoded readings on success.
   * @param err  `DeviceUnreachable` after all attempts, `IoError` if the
   *             socket itself failed.
   */
  bool query(ResponseFrame& out, Error& err);

  /**
   * @brief Write one parameter and return the unit's acknowledging status page.
   *
   * @param p    Writable parameter (Direct or Toggle).
   * @param v    Value of the parameter's type, inside its write range.
   * @param ack  Status page the unit answered with.
   * @param err  `InvalidValue` if the value is rejected (nothing is sent),
   *             `DeviceUnreachable` after all attempts.
   */
  bool set_parameter(const Parameter& p, const Value& v, ResponseFrame& ack, Error& err);

  /// Abandon the current wait and refuse further attempts.
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

  DeviceStats stats() const;
  const DeviceClientConfig& config() const { return cfg_; }

private:
  // One request/reply exchange, up to `attempts` sends. Caller holds mu_.
  bool transact(const std::vector<uint8_t>& request, ResponseFrame& out, Error& err, int attempts);

  // Read-then-toggle with a confirming read after every unanswered toggle. Caller holds mu_.
  bool toggle_to(const Parameter& p, const Value& v, ResponseFrame& ack, Error& err);

  // Throw away anything already waiting on the link. Caller holds mu_.
  void drain_stale();

  transport::IDatagramTransport& link_;
  DeviceClientConfig             cfg_;
  std::atomic<bool>              cancelled_{false};

  mutable std::mutex mu_;          ///< one outstanding transaction
  DeviceStats        stats_{};     ///< guarded by mu_
  std::vector<uint8_t> rx_buf_;    ///< guarded by mu_
};

} // namespace ventobridge

#endif // VENTOBRIDGE_DEVICE_CLIENT_HPP
