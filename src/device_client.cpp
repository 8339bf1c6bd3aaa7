// -----------------------------------------------------------------------------
// device_client.cpp — Implementation of the Vento device client
//
// Contracts (correlation, retries, toggles):
//   see include/ventobridge/device_client.hpp
//
// Usage with a simulated unit:
//   see tests/test_device_client.cpp
// -----------------------------------------------------------------------------
#include "ventobridge/device_client.hpp"
#include "ventobridge/log.hpp"

#include <chrono>
#include <sstream>

namespace ventobridge {

using Clock = std::chrono::steady_clock;

static constexpr int DRAIN_MAX = 16;   // stale datagrams dropped per transaction, at most

static int ms_left(Clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// ---------- public ----------

DeviceClient::DeviceClient(transport::IDatagramTransport& link, const DeviceClientConfig& cfg)
: link_(link), cfg_(cfg), rx_buf_(MAX_DATAGRAM_LEN) {
  if (cfg_.attempts < 1) cfg_.attempts = 1;     // at least one send per transaction
  if (cfg_.timeout_ms < 1) cfg_.timeout_ms = 1;
}

// query() — Read-all under the lock.
bool DeviceClient::query(ResponseFrame& out, Error& err) {
  std::vector<uint8_t> req;
  if (!encode_request(Request::read_all(), req, err)) return false;

  std::lock_guard<std::mutex> lock(mu_);
  return transact(req, out, err, cfg_.attempts);
}

// -----------------------------------------------------------------------------
// set_parameter() — Validate, then write (or read-then-toggle) under one lock.
// PRE:
//   - p comes from the registry.
// POLICY:
//   - Validation failures never touch the link; they come back as InvalidValue.
//   - Direct writes are resent on silence like any read.
//   - Toggle parameters go through toggle_to().
// OUT:
//   - ack holds the status page the unit answered the write (or the read) with.
// -----------------------------------------------------------------------------
bool DeviceClient::set_parameter(const Parameter& p, const Value& v, ResponseFrame& ack, Error& err) {
  if (!p.writable())
    return err.set(ErrorCode::InvalidValue, std::string("read_only:") + p.name);

  Error verr;
  if (!check_value(p, v, verr)) return err.set(ErrorCode::InvalidValue, verr.reason);

  std::lock_guard<std::mutex> lock(mu_);

  if (p.write == WriteMode::Toggle) return toggle_to(p, v, ack, err);

  std::vector<uint8_t> req;
  if (!encode_request(Request::write(p, v), req, verr))
    return err.set(ErrorCode::InvalidValue, verr.reason);
  return transact(req, ack, err, cfg_.attempts);
}

DeviceStats DeviceClient::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

// ---------- private ----------

// -----------------------------------------------------------------------------
// toggle_to() — Drive a Toggle parameter to `v`.
// PRE:   mu_ held by caller; v passed check_value().
// POLICY:
//   - Read first; already at v means no toggle at all.
//   - Each toggle frame is sent once. No reply: read the page again and
//     toggle again only if the unit still differs from v.
//   - A reply whose page shows the other state is a DecodeError; the unit
//     did something other than what was asked.
//   - At most `attempts` toggle frames per call.
// OUT:   ack is a page that reports v, or an error.
// -----------------------------------------------------------------------------
bool DeviceClient::toggle_to(const Parameter& p, const Value& v, ResponseFrame& ack, Error& err) {
  std::vector<uint8_t> read, toggle;
  Error verr;
  if (!encode_request(Request::read_all(), read, err)) return false;
  if (!encode_request(Request::toggle(p), toggle, verr))
    return err.set(ErrorCode::InvalidValue, verr.reason);

  ResponseFrame page;
  if (!transact(read, page, err, cfg_.attempts)) return false;

  for (int sent = 0; ; ++sent) {
    const Reading* now = page.find(p.id);
    if (!now)
      return err.set(ErrorCode::DecodeError, std::string("state_unknown:") + p.name);

    if (now->value == v) {
      if (sent == 0) log::debug(std::string("status=ok event=toggle_skipped param=") + p.name);
      ack = std::move(page);
      return true;
    }

    if (sent == cfg_.attempts) break;

    ResponseFrame reply;
    Error terr;
    if (transact(toggle, reply, terr, 1)) {
      const Reading* r = reply.find(p.id);
      if (r && r->value == v) {
        ack = std::move(reply);
        return true;
      }
      if (r)
        return err.set(ErrorCode::DecodeError, std::string("toggle_mismatch:") + p.name);
    } else if (cancelled_.load() || terr.code == ErrorCode::IoError) {
      err = terr;
      return false;
    }

    // Unanswered toggle, or an ack without the parameter: ask the unit.
    log::info(std::string("status=retry event=toggle_confirm param=") + p.name +
              " reason=" + (terr.reason.empty() ? "ack_without_param" : terr.reason));
    if (!transact(read, page, err, cfg_.attempts)) return false;
  }

  std::ostringstream why;
  why << "attempts_exhausted:" << cfg_.attempts << "(toggle_unconfirmed)";
  return err.set(ErrorCode::DeviceUnreachable, why.str());
}

// -----------------------------------------------------------------------------
// transact() — Send, wait, decode; resend on silence or garbage.
// PRE:   mu_ held by caller.
// POLICY:
//   - Each attempt: drain stale datagrams, send once, wait up to timeout_ms.
//   - Foreign datagrams do not end the wait; a bad reply from the unit does.
//   - cancel() stops before the next attempt.
// OUT:   decoded status page in `out`, or DeviceUnreachable / IoError.
//        `attempts` is 1 for frames that must not be repeated (toggles).
// -----------------------------------------------------------------------------
bool DeviceClient::transact(const std::vector<uint8_t>& request, ResponseFrame& out, Error& err,
                            int attempts) {
  ++stats_.transactions;
  std::string last = "timeout";
  bool link_failed = false;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (cancelled_.load()) {
      ++stats_.failures;
      return err.set(ErrorCode::DeviceUnreachable, "cancelled");
    }

    drain_stale();

    const transport::TxResult tx = link_.send(request.data(), request.size());
    ++stats_.sends;
    if (tx != transport::TxResult::Ok) {
      last = (tx == transport::TxResult::Busy) ? "send_busy" : "send_failed";
      link_failed = (tx == transport::TxResult::Error);
      log::warn("status=error event=send link=" + std::string(link_.name()) +
                " attempt=" + std::to_string(attempt) + " reason=" + last);
      continue;
    }
    link_failed = false;

    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(cfg_.timeout_ms);
    for (;;) {
      const int left = ms_left(deadline);
      if (left <= 0) { ++stats_.timeouts; last = "timeout"; break; }

      std::size_t n = 0;
      const transport::RxResult rx = link_.recv(rx_buf_.data(), rx_buf_.size(), n, left);

      if (rx == transport::RxResult::None) { ++stats_.timeouts; last = "timeout"; break; }

      if (rx == transport::RxResult::Foreign) {
        ++stats_.foreign;
        log::debug("status=ignored event=rx reason=foreign_sender");
        continue;                                  // keep waiting for the unit
      }

      if (rx == transport::RxResult::Error) { last = "recv_failed"; link_failed = true; break; }

      if (log::enabled(log::Level::Debug))
        log::debug("event=rx len=" + std::to_string(n) + " " + decode_pretty(rx_buf_.data(), n));

      Error derr;
      ResponseFrame frame;
      if (decode_response(rx_buf_.data(), n, frame, derr)) {
        out = std::move(frame);
        return true;
      }

      ++stats_.decode_errors;
      last = derr.reason;
      log::warn("status=error event=decode attempt=" + std::to_string(attempt) +
                " reason=" + derr.reason + " len=" + std::to_string(n));
      break;                                       // resend
    }

    if (attempt < attempts)
      log::info("status=retry attempt=" + std::to_string(attempt + 1) +
                " of=" + std::to_string(attempts) + " reason=" + last);
  }

  ++stats_.failures;
  std::ostringstream why;
  why << "attempts_exhausted:" << attempts << "(" << last << ")";
  return err.set(link_failed ? ErrorCode::IoError : ErrorCode::DeviceUnreachable, why.str());
}

// drain_stale() — Late replies from an earlier attempt must not answer this one.
void DeviceClient::drain_stale() {
  for (int i = 0; i < DRAIN_MAX; ++i) {
    std::size_t n = 0;
    const transport::RxResult rx = link_.recv(rx_buf_.data(), rx_buf_.size(), n, 0);
    if (rx != transport::RxResult::Ok && rx != transport::RxResult::Foreign) return;
    log::debug("status=ignored event=rx reason=stale len=" + std::to_string(n));
  }
}

} // namespace ventobridge
