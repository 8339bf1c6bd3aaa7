// -----------------------------------------------------------------------------
// bridge.cpp — Implementation of the bridge controller
//
// This file contains the *implementation details* for the Bridge class
// declared in `bridge.hpp`.
//
// API & loop model:
//   see include/ventobridge/bridge.hpp
//
// Runnable flows against a simulated unit and a recording bus:
//   see tests/test_bridge_flows.cpp
// -----------------------------------------------------------------------------
#include "ventobridge/bridge.hpp"
#include "ventobridge/log.hpp"

#include <chrono>
#include <utility>

#include "nlohmann/json.hpp"

namespace ventobridge {

// ---------- public ----------

Bridge::Bridge(DeviceClient& device, IPubSub& bus, const TopicMap& topics, const BridgeOptions& opts)
: device_(device), bus_(bus), topics_(topics), opts_(opts) {
  if (opts_.poll_interval_ms == 0) opts_.poll_interval_ms = 1;   // never spin on a zero interval
}

// add_message() — Resolve the topic, then enqueue; fail if unrelated or full.
bool Bridge::add_message(const std::string& topic, const std::string& payload) {
  const Parameter* p = topics_.parameter_for_command_topic(topic);

  std::lock_guard<std::mutex> lock(inbox_mu_);
  if (!p || inbox_.full()) {          // not ours, or no room
    ++stats_.rejected;
    return false;
  }
  inbox_.push_back(Command{p, payload});
  inbox_cv_.notify_one();             // cut the loop's wait short
  return true;
}

// tick() — One command, then the poll if its interval has elapsed.
void Bridge::tick(uint32_t now_ms) {
  ++tick_count_;

  process_one();

  if (!polled_ || static_cast<uint32_t>(now_ms - last_poll_ms_) >= opts_.poll_interval_ms) {
    poll(now_ms);
  }
}

void Bridge::wait(uint32_t max_ms) {
  std::unique_lock<std::mutex> lock(inbox_mu_);
  inbox_cv_.wait_for(lock, std::chrono::milliseconds(max_ms),
                     [this] { return !inbox_.empty() || woken_; });
  woken_ = false;
}

void Bridge::wake() {
  std::lock_guard<std::mutex> lock(inbox_mu_);
  woken_ = true;
  inbox_cv_.notify_all();
}

uint32_t Bridge::ms_until_poll(uint32_t now_ms) const {
  if (!polled_) return 0;
  const uint32_t elapsed = now_ms - last_poll_ms_;   // wraps cleanly
  return elapsed >= opts_.poll_interval_ms ? 0 : opts_.poll_interval_ms - elapsed;
}

void Bridge::publish_service_down() {
  publish(topics_.service_topic(), SERVICE_DOWN, opts_.retain);
  last_service_ = SERVICE_DOWN;
}

size_t Bridge::pending() const {
  std::lock_guard<std::mutex> lock(inbox_mu_);
  return inbox_.size();
}

// Loop thread only: everything but `rejected` is written without the lock.
BridgeStats Bridge::stats() const {
  std::lock_guard<std::mutex> lock(inbox_mu_);
  return stats_;
}

// ---------- private: command path ----------

// process_one() — Pop the oldest command (if any) and run it outside the lock.
bool Bridge::process_one() {
  Command cmd;
  {
    std::lock_guard<std::mutex> lock(inbox_mu_);
    if (inbox_.empty()) return false;
    cmd = inbox_.front();
    inbox_.pop_front();
  }
  run_command(cmd);
  return true;
}

// -----------------------------------------------------------------------------
// run_command() — payload text -> device write -> ack publishes.
// PRE:   cmd.param is a writable registry entry (add_message() resolved it).
// POLICY:
//   - Any failure is logged with its reason and publishes nothing.
//   - The written parameter is published from the ack even when unchanged.
//   - If the ack does not carry it, refresh with a read-all when allowed.
// -----------------------------------------------------------------------------
void Bridge::run_command(const Command& cmd) {
  const Parameter& p = *cmd.param;
  Error err;

  Value v;
  if (!decode_payload(p, cmd.payload, v, err)) {
    ++stats_.commands_failed;
    log::warn(std::string("status=error event=command param=") + p.name +
              " reason=" + err.describe());
    return;
  }

  ResponseFrame ack;
  if (!device_.set_parameter(p, v, ack, err)) {       // range checks happen in there
    ++stats_.commands_failed;
    log::error(std::string("status=error event=command param=") + p.name +
               " reason=" + err.describe());
    return;
  }

  ++stats_.commands_ok;
  log::info(std::string("status=ok event=command param=") + p.name +
            " value=" + encode_payload(p, v));

  if (!ack.find(p.id) && opts_.refresh_after_set) {
    log::debug(std::string("event=refresh reason=ack_without:") + p.name);
    ResponseFrame fresh;
    if (device_.query(fresh, err)) {
      ack = std::move(fresh);
    } else {
      log::warn("status=error event=refresh reason=" + err.describe());
    }
  }

  publish_frame(ack, &p);
  if (opts_.publish_snapshot) publish_snapshot(ack);
}

// ---------- private: poll path ----------

// -----------------------------------------------------------------------------
// poll() — Read-all and publish what changed.
// POLICY:
//   - The interval restarts at the attempt, success or not.
//   - Availability is published on transitions when de-duplicating, on every
//     poll otherwise.
// -----------------------------------------------------------------------------
void Bridge::poll(uint32_t now_ms) {
  polled_ = true;
  last_poll_ms_ = now_ms;

  ResponseFrame frame;
  Error err;
  if (!device_.query(frame, err)) {
    ++stats_.polls_failed;
    log::error("status=error event=poll reason=" + err.describe());
    if (opts_.publish_availability) publish_service(SERVICE_TIMEOUT);
    return;
  }

  ++stats_.polls_ok;
  publish_frame(frame, nullptr);
  if (opts_.publish_snapshot) publish_snapshot(frame);
  if (opts_.publish_availability) publish_service(SERVICE_ONLINE);
}

// ---------- private: publishing ----------

void Bridge::publish_frame(const ResponseFrame& frame, const Parameter* forced) {
  for (const auto& r : frame.readings) {
    publish_state(*r.param, r.value, r.param == forced);
  }
}

void Bridge::publish_state(const Parameter& p, const Value& v, bool force) {
  const std::string payload = encode_payload(p, v);

  auto it = last_state_.find(p.id);
  if (opts_.dedupe && !force && it != last_state_.end() && it->second == payload) return;

  if (publish(topics_.state_topic(p), payload, opts_.retain)) {
    last_state_[p.id] = payload;
  }
}

// -----------------------------------------------------------------------------
// publish_snapshot() — One JSON object with every value of the page.
// Booleans as true/false, numbers as numbers, timers and raw blocks as the
// same strings the state topics carry.
// -----------------------------------------------------------------------------
void Bridge::publish_snapshot(const ResponseFrame& frame) {
  std::string text;
  try {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& r : frame.readings) {
      switch (r.param->type) {
        case ValueType::Boolean:
          j[r.param->name] = r.value.number != 0;
          break;
        case ValueType::Integer:
        case ValueType::Enumerated:
          j[r.param->name] = r.value.number;
          break;
        default:
          j[r.param->name] = encode_payload(*r.param, r.value);
          break;
      }
    }
    text = j.dump();
  } catch (const nlohmann::json::exception& e) {
    log::error(std::string("status=error event=snapshot reason=") + e.what());
    return;
  }

  if (opts_.dedupe && text == last_snapshot_) return;
  if (publish(topics_.status_topic(), text, opts_.retain)) last_snapshot_ = text;
}

void Bridge::publish_service(const char* state) {
  if (opts_.dedupe && last_service_ == state) return;
  if (publish(topics_.service_topic(), state, opts_.retain)) last_service_ = state;
}

bool Bridge::publish(const std::string& topic, const std::string& payload, bool retain) {
  if (!bus_.publish(topic, payload, retain)) {
    log::debug("status=error event=publish topic=" + topic);
    return false;
  }
  ++stats_.publishes;
  log::debug("event=publish topic=" + topic + " payload=" + payload);
  return true;
}

} // namespace ventobridge
