// ============================================================================
// mosquitto_client.cpp — implementation for mosquitto_client.hpp
// For API/threading notes see the matching .hpp.
// ============================================================================
#include "mosquitto_client.hpp"
#include "ventobridge/log.hpp"

#include <mosquitto.h>

#include <utility>

namespace ventobridge {

static constexpr int QOS = 0;

// ---------------------------------------------------------------------------
// Construction only allocates the handle. Nothing touches the network until
// connect(). A failed mosquitto_new() leaves mosq_ null and connect() reports it.
// ---------------------------------------------------------------------------
MosquittoClient::MosquittoClient(const MqttConfig& cfg) : cfg_(cfg) {
  mosquitto_lib_init();
  const char* id = cfg_.client_id.empty() ? nullptr : cfg_.client_id.c_str();
  mosq_ = mosquitto_new(id, true, this);
  if (!mosq_) return;

  mosquitto_connect_callback_set(mosq_, &MosquittoClient::on_connect_thunk);
  mosquitto_disconnect_callback_set(mosq_, &MosquittoClient::on_disconnect_thunk);
  mosquitto_message_callback_set(mosq_, &MosquittoClient::on_message_thunk);
  mosquitto_reconnect_delay_set(mosq_, 2, 30, true);
}

MosquittoClient::~MosquittoClient() {
  disconnect();
  if (mosq_) mosquitto_destroy(mosq_);
  mosquitto_lib_cleanup();
}

void MosquittoClient::set_will(const std::string& topic, const std::string& payload, bool retain) {
  will_topic_   = topic;
  will_payload_ = payload;
  will_retain_  = retain;
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// PRE:   handler and will are set; subscriptions may already be recorded.
// POLICY:
//   - Credentials and will are applied on every call.
//   - A TCP-level failure here is fatal for the caller; later drops are
//     handled by libmosquitto's reconnect inside the network thread.
// OUT:   network thread running; CONNACK arrives via on_connect().
// ---------------------------------------------------------------------------
bool MosquittoClient::connect(Error& err) {
  if (!mosq_) return err.set(ErrorCode::IoError, "mosquitto_new_failed");

  int rc = MOSQ_ERR_SUCCESS;
  if (!cfg_.user.empty()) {
    rc = mosquitto_username_pw_set(mosq_, cfg_.user.c_str(),
                                   cfg_.password.empty() ? nullptr : cfg_.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS)
      return err.set(ErrorCode::IoError, std::string("credentials:") + mosquitto_strerror(rc));
  }

  if (!will_topic_.empty()) {
    rc = mosquitto_will_set(mosq_, will_topic_.c_str(), static_cast<int>(will_payload_.size()),
                            will_payload_.data(), QOS, will_retain_);
    if (rc != MOSQ_ERR_SUCCESS)
      return err.set(ErrorCode::IoError, std::string("will:") + mosquitto_strerror(rc));
  }

  rc = mosquitto_connect(mosq_, cfg_.host.c_str(), cfg_.port, cfg_.keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS)
    return err.set(ErrorCode::IoError, std::string("connect_failed:") + mosquitto_strerror(rc));

  rc = mosquitto_loop_start(mosq_);
  if (rc != MOSQ_ERR_SUCCESS)
    return err.set(ErrorCode::IoError, std::string("loop_start:") + mosquitto_strerror(rc));
  loop_running_ = true;

  log::info("status=ok event=mqtt_connecting host=" + cfg_.host + " port=" + std::to_string(cfg_.port) +
            " client_id=" + cfg_.client_id);
  return true;
}

void MosquittoClient::disconnect() {
  if (!mosq_ || !loop_running_) return;
  mosquitto_disconnect(mosq_);
  mosquitto_loop_stop(mosq_, false);
  loop_running_ = false;
  connected_.store(false);
}

// Recorded first, so the connect callback re-issues it after any reconnect.
bool MosquittoClient::subscribe(const std::string& topic, Error& err) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    topics_.push_back(topic);
  }
  if (!mosq_) return err.set(ErrorCode::IoError, "mosquitto_new_failed");
  if (!connected_.load()) return true;      // on_connect() picks it up

  const int rc = mosquitto_subscribe(mosq_, nullptr, topic.c_str(), QOS);
  if (rc != MOSQ_ERR_SUCCESS)
    return err.set(ErrorCode::IoError, std::string("subscribe:") + mosquitto_strerror(rc));
  return true;
}

bool MosquittoClient::publish(const std::string& topic, const std::string& payload, bool retain) {
  if (!mosq_) return false;
  const int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), QOS, retain);
  if (rc != MOSQ_ERR_SUCCESS) {
    log::debug("status=error event=publish topic=" + topic + " reason=" + mosquitto_strerror(rc));
    return false;
  }
  return true;
}

void MosquittoClient::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mu_);
  handler_ = std::move(handler);
}

// ---------- network thread ----------

void MosquittoClient::on_connect_thunk(mosquitto*, void* self, int rc) {
  static_cast<MosquittoClient*>(self)->on_connect(rc);
}

void MosquittoClient::on_disconnect_thunk(mosquitto*, void* self, int rc) {
  static_cast<MosquittoClient*>(self)->on_disconnect(rc);
}

void MosquittoClient::on_message_thunk(mosquitto*, void* self, const mosquitto_message* msg) {
  static_cast<MosquittoClient*>(self)->on_message(msg);
}

void MosquittoClient::on_connect(int rc) {
  if (rc != 0) {
    log::error(std::string("status=error event=mqtt_connack reason=") + mosquitto_connack_string(rc));
    return;
  }
  connected_.store(true);
  log::info("status=ok event=mqtt_connected host=" + cfg_.host);

  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& t : topics_) {
    const int src = mosquitto_subscribe(mosq_, nullptr, t.c_str(), QOS);
    if (src != MOSQ_ERR_SUCCESS)
      log::warn("status=error event=subscribe topic=" + t + " reason=" + mosquitto_strerror(src));
  }
}

void MosquittoClient::on_disconnect(int rc) {
  connected_.store(false);
  if (rc == 0) log::info("status=ok event=mqtt_disconnected");
  else         log::warn(std::string("status=error event=mqtt_lost reason=") + mosquitto_strerror(rc));
}

void MosquittoClient::on_message(const mosquitto_message* msg) {
  if (!msg || !msg->topic) return;
  const std::string topic(msg->topic);
  const std::string payload = msg->payload
      ? std::string(static_cast<const char*>(msg->payload), static_cast<std::size_t>(msg->payloadlen))
      : std::string();

  std::lock_guard<std::mutex> lock(mu_);
  if (handler_) handler_(topic, payload);
}

} // namespace ventobridge
