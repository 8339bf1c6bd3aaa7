/**
 * @page vb-mosquitto MQTT Client (libmosquitto)
 * @file mosquitto_client.hpp
 * @brief IPubSub on top of libmosquitto's threaded client.
 *
 * @details
 * PURPOSE
 * -------
 * The daemon's only link to the broker. Wraps one `struct mosquitto` handle:
 * credentials, last will, connect, background network loop, subscriptions and
 * QoS 0 publishes.
 *
 * THREADING
 * ---------
 * - connect() runs the TCP connect on the caller's thread, then starts
 *   libmosquitto's network thread (mosquitto_loop_start).
 * - Connect, disconnect and message callbacks run on that network thread.
 *   The message handler must only enqueue (the bridge's add_message()).
 * - publish() may be called from any thread; libmosquitto queues it.
 *
 * RECONNECT
 * ---------
 * libmosquitto reconnects by itself (2 s doubling to 30 s). Every topic ever
 * passed to subscribe() is re-issued from the connect callback, so a broker
 * restart does not silently drop the command topics.
 *
 * LAST WILL
 * ---------
 * set_will() must be called before connect(). The daemon registers
 * `<base>/service = "Service Down"` (retained when `--retain` is set), so
 * subscribers learn about a crash the same way they learn about a clean
 * shutdown.
 */
#ifndef VENTOBRIDGE_MOSQUITTO_CLIENT_HPP
#define VENTOBRIDGE_MOSQUITTO_CLIENT_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "ventobridge/pubsub.hpp"

struct mosquitto;
struct mosquitto_message;

namespace ventobridge {

struct MqttConfig {
  std::string host;
  uint16_t    port{1883};
  std::string user;                        // empty: anonymous
  std::string password;
  std::string client_id{"ventobridge"};
  std::string base_topic{"blauberg-vento"};
  int         keepalive_s{60};
};

class MosquittoClient : public IPubSub {
public:
  explicit MosquittoClient(const MqttConfig& cfg);
  ~MosquittoClient() override;

  MosquittoClient(const MosquittoClient&) = delete;
  MosquittoClient& operator=(const MosquittoClient&) = delete;

  /// Register the last will. Only takes effect on the next connect().
  void set_will(const std::string& topic, const std::string& payload, bool retain);

  bool connect(Error& err) override;
  void disconnect() override;
  bool subscribe(const std::string& topic, Error& err) override;
  bool publish(const std::string& topic, const std::string& payload, bool retain) override;
  void set_message_handler(MessageHandler handler) override;

  bool connected() const { return connected_.load(); }

private:
  static void on_connect_thunk(mosquitto*, void* self, int rc);
  static void on_disconnect_thunk(mosquitto*, void* self, int rc);
  static void on_message_thunk(mosquitto*, void* self, const mosquitto_message* msg);

  void on_connect(int rc);
  void on_disconnect(int rc);
  void on_message(const mosquitto_message* msg);

  MqttConfig        cfg_;
  mosquitto*        mosq_{nullptr};
  bool              loop_running_{false};
  std::atomic<bool> connected_{false};

  std::mutex               mu_;          // guards topics_ and handler_
  std::vector<std::string> topics_;
  MessageHandler           handler_;

  std::string will_topic_;
  std::string will_payload_;
  bool        will_retain_{false};
};

} // namespace ventobridge

#endif // VENTOBRIDGE_MOSQUITTO_CLIENT_HPP
