#pragma once
/**
 * @file pubsub.hpp
 * @brief Pub/sub seam between the bridge and an MQTT client library.
 *
 * The daemon plugs in MosquittoClient (mosquitto_client.hpp); tests plug in a
 * recording fake. The bridge only ever calls publish(); subscriptions and the
 * message handler are wired up by whoever owns both objects.
 *
 * Contract:
 *  - connect() starts the session and the client's own network thread. The
 *    client reconnects on its own after a drop and re-issues every topic that
 *    was passed to subscribe().
 *  - The message handler runs on the client's network thread. It must not
 *    block; the bridge only enqueues.
 *  - publish() is QoS 0 and never blocks on the network. False means the
 *    message was not queued (not connected, payload too large).
 */

#include <functional>
#include <string>

#include "ventobridge/error.hpp"

namespace ventobridge {

using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

class IPubSub {
public:
  virtual ~IPubSub() = default;

  virtual bool connect(Error& err) = 0;
  virtual void disconnect() = 0;
  virtual bool subscribe(const std::string& topic, Error& err) = 0;
  virtual bool publish(const std::string& topic, const std::string& payload, bool retain) = 0;
  virtual void set_message_handler(MessageHandler handler) = 0;
};

} // namespace ventobridge
