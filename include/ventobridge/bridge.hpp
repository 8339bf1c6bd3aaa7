/**
 * @file bridge.hpp
 * @brief Bridge controller: MQTT commands in, device writes out; periodic polls, state publishes.
 *
 * @details
 * ## Field Brief
 * The bridge is the daemon's loop body. It does not know sockets or brokers;
 * it holds a DeviceClient (device side) and an IPubSub (broker side) and moves
 * values between them.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [MQTT network thread]                 [Bridge, main thread]
 *          │                                   │
 *  <base>/fan-speed/set "3" ── add_message() ──►  inbox (bounded, locked)
 *          │                                   │
 *          │                      tick(now_ms) ─┬─► process_one()
 *          │                                   │     ├─ decode payload
 *          │                                   │     ├─ DeviceClient::set_parameter()
 *          │                                   │     └─ publish ack values
 *          │                                   │
 *          │                                   └─► poll() when interval elapsed
 *          │                                         ├─ DeviceClient::query()
 *          │                                         ├─ publish changed states
 *          │                                         ├─ <base>/status (JSON)
 *          │                                         └─ <base>/service
 *          ◄──────────────────── publish() ────────────┘
 * ```
 *
 * - **At most one** command per tick, then a poll if one is due. Device I/O
 *   only ever happens on the thread that calls tick().
 * - The first tick always polls, so subscribers get state right after startup.
 *
 * ---
 *
 * @par Failure Model
 * - **Inbox full / unrelated topic:** `add_message()` returns false, nothing queued.
 * - **Bad payload, rejected value, unreachable unit on a command:** logged,
 *   nothing published, loop continues.
 * - **Unreachable unit on a poll:** `TimeOut` on `<base>/service`, next poll at
 *   the normal interval.
 *
 * @par De-duplication
 * With `dedupe` on, a state topic is only published when its payload differs
 * from the last one published for it. The parameter a command wrote is always
 * published from the ack, so a client that set a value always hears back.
 * The snapshot and availability topics follow the same rule (on change only).
 */
#ifndef VENTOBRIDGE_BRIDGE_HPP
#define VENTOBRIDGE_BRIDGE_HPP

#include <stdint.h>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>

#include "etl/deque.h"
#include "ventobridge/codec.hpp"
#include "ventobridge/device_client.hpp"
#include "ventobridge/pubsub.hpp"
#include "ventobridge/topic_map.hpp"

namespace ventobridge {

struct BridgeOptions {
  uint32_t poll_interval_ms{5000};
  bool     dedupe{true};
  bool     publish_snapshot{true};      ///< JSON on <base>/status
  bool     publish_availability{true};  ///< Online / TimeOut on <base>/service
  bool     retain{false};               ///< retained flag on state and status publishes
  bool     refresh_after_set{true};     ///< query when the ack lacks the written parameter
};

/// One queued command: resolved parameter plus the raw payload text.
struct Command {
  const Parameter* param{nullptr};
  std::string      payload;
};

struct BridgeStats {
  uint32_t commands_ok{0};
  uint32_t commands_failed{0};
  uint32_t polls_ok{0};
  uint32_t polls_failed{0};
  uint32_t publishes{0};
  uint32_t rejected{0};      ///< add_message() refusals
};

class Bridge {
public:
  static constexpr size_t INBOX_CAP = 16;   ///< Max queued commands

  Bridge(DeviceClient& device, IPubSub& bus, const TopicMap& topics, const BridgeOptions& opts);

  Bridge(const Bridge&) = delete;
  Bridge& operator=(const Bridge&) = delete;

  /**
   * @brief Queue a command from the broker. Safe from any thread.
   *
   * The topic is resolved here, so only `<base>/<writable>/set` topics take
   * a slot.
   *
   * @retval false  Unrelated topic or inbox full; nothing queued.
   */
  bool add_message(const std::string& topic, const std::string& payload);

  /**
   * @brief Run one loop step: at most one command, then a poll if due.
   * @param now_ms Monotonic milliseconds; wraps at 32 bits.
   */
  void tick(uint32_t now_ms);

  /// Block until a command is queued, wake() is called, or max_ms passes.
  void wait(uint32_t max_ms);

  /// Release a thread blocked in wait(). Used on shutdown.
  void wake();

  /// Milliseconds until the next poll is due (0 if due now).
  uint32_t ms_until_poll(uint32_t now_ms) const;

  /// Publish `Service Down` on the service topic (shutdown path).
  void publish_service_down();

  size_t pending() const;
  BridgeStats stats() const;
  uint32_t tick_count() const { return tick_count_; }

private:
  bool process_one();
  void run_command(const Command& cmd);
  void poll(uint32_t now_ms);

  void publish_frame(const ResponseFrame& frame, const Parameter* forced);
  void publish_state(const Parameter& p, const Value& v, bool force);
  void publish_snapshot(const ResponseFrame& frame);
  void publish_service(const char* state);
  bool publish(const std::string& topic, const std::string& payload, bool retain);

  DeviceClient&  device_;
  IPubSub&       bus_;
  const TopicMap& topics_;
  BridgeOptions  opts_;

  mutable std::mutex              inbox_mu_;
  std::condition_variable         inbox_cv_;
  etl::deque<Command, INBOX_CAP>  inbox_;      ///< guarded by inbox_mu_
  bool                            woken_{false};

  // loop-thread only
  std::unordered_map<uint8_t, std::string> last_state_;   ///< id -> last published payload
  std::string last_snapshot_;
  std::string last_service_;
  bool        polled_{false};
  uint32_t    last_poll_ms_{0};
  uint32_t    tick_count_{0};
  BridgeStats stats_{};    ///< `rejected` is written under inbox_mu_
};

} // namespace ventobridge

#endif // VENTOBRIDGE_BRIDGE_HPP
