// ============================================================================
// app_config.cpp — implementation for app_config.hpp
// For the file format and precedence rules see the matching .hpp.
// ============================================================================
#include "app_config.hpp"

#include <fstream>
#include <limits>
#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace ventobridge {

// ---------------------------------------------------------------------------
// read_port() / read_positive()
// -----------------------------
// Numbers are read wide and range-checked here; nlohmann would otherwise wrap
// 70000 into a uint16_t without complaint.
// ---------------------------------------------------------------------------
static bool read_port(const json& sec, const char* key, uint16_t& out, const std::string& where, Error& err) {
  if (!sec.contains(key)) return true;
  const long long v = sec.at(key).get<long long>();
  if (v < 1 || v > 65535)
    return err.set(ErrorCode::ConfigError, "bad_port:" + where + "." + key);
  out = static_cast<uint16_t>(v);
  return true;
}

template <typename T>
static bool read_positive(const json& sec, const char* key, T& out, const std::string& where, Error& err) {
  if (!sec.contains(key)) return true;
  const long long v = sec.at(key).get<long long>();
  if (v < 1 || static_cast<unsigned long long>(v) > std::numeric_limits<T>::max())
    return err.set(ErrorCode::ConfigError, "bad_value:" + where + "." + key);
  out = static_cast<T>(v);
  return true;
}

static void read_string(const json& sec, const char* key, std::string& out) {
  if (sec.contains(key)) out = sec.at(key).get<std::string>();
}

static void read_bool(const json& sec, const char* key, bool& out) {
  if (sec.contains(key)) out = sec.at(key).get<bool>();
}

// ---------------------------------------------------------------------------
// parse_config_json()
// -------------------
// PRE:   `cfg` holds defaults (or an earlier layer).
// POLICY:
//   - Only keys present in the document change `cfg`.
//   - A section that is not an object, or a key of the wrong JSON type, is a
//     ConfigError; nlohmann exceptions stop here.
//   - `cfg` is left untouched on failure.
// ---------------------------------------------------------------------------
bool parse_config_json(const std::string& text, AppConfig& cfg, Error& err) {
  AppConfig next = cfg;
  try {
    const json root = json::parse(text);
    if (!root.is_object()) return err.set(ErrorCode::ConfigError, "not_an_object");

    auto section = [&](const char* name, json& out) -> bool {
      out = json::object();
      if (!root.contains(name)) return true;
      if (!root.at(name).is_object())
        return err.set(ErrorCode::ConfigError, std::string("bad_section:") + name);
      out = root.at(name);
      return true;
    };

    json dev, mqtt, bridge, log;
    if (!section("device", dev) || !section("mqtt", mqtt) ||
        !section("bridge", bridge) || !section("log", log)) return false;

    read_string(dev, "host", next.device.host);
    if (!read_port(dev, "port", next.device.port, "device", err)) return false;
    if (!read_positive(dev, "timeout_ms", next.client.timeout_ms, "device", err)) return false;
    if (!read_positive(dev, "attempts", next.client.attempts, "device", err)) return false;

    read_string(mqtt, "host", next.mqtt.host);
    if (!read_port(mqtt, "port", next.mqtt.port, "mqtt", err)) return false;
    read_string(mqtt, "user", next.mqtt.user);
    read_string(mqtt, "password", next.mqtt.password);
    read_string(mqtt, "client_id", next.mqtt.client_id);
    read_string(mqtt, "base_topic", next.mqtt.base_topic);
    if (!read_positive(mqtt, "keepalive", next.mqtt.keepalive_s, "mqtt", err)) return false;

    if (!read_positive(bridge, "poll_interval_ms", next.bridge.poll_interval_ms, "bridge", err)) return false;
    read_bool(bridge, "dedupe", next.bridge.dedupe);
    read_bool(bridge, "publish_snapshot", next.bridge.publish_snapshot);
    read_bool(bridge, "publish_availability", next.bridge.publish_availability);
    read_bool(bridge, "retain", next.bridge.retain);
    read_bool(bridge, "refresh_after_set", next.bridge.refresh_after_set);

    read_string(log, "file", next.log.file);
    read_bool(log, "debug", next.log.debug);
  } catch (const json::exception& e) {
    return err.set(ErrorCode::ConfigError, std::string("json:") + e.what());
  }

  cfg = next;
  return true;
}

bool load_config_file(const std::string& path, AppConfig& cfg, Error& err) {
  std::ifstream in(path);
  if (!in) return err.set(ErrorCode::ConfigError, "unreadable:" + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_config_json(ss.str(), cfg, err);
}

// ---------------------------------------------------------------------------
// register_cli()
// --------------
// Hosts are not marked required here: they may come from --config.
// ---------------------------------------------------------------------------
void register_cli(CLI::App& app, CliArgs& a) {
  AppConfig& v = a.values;

  app.add_option("--config", a.config_path, "JSON config file (flags override it)");

  app.add_option("--vento-host", v.device.host, "Ventilation unit IP or hostname");
  app.add_option("--vento-port", v.device.port, "Ventilation unit UDP port")
     ->capture_default_str()->check(CLI::Range(1, 65535));
  app.add_option("--timeout", v.client.timeout_ms, "Reply timeout per attempt (ms)")
     ->capture_default_str()->check(CLI::PositiveNumber);
  app.add_option("--retries", v.client.attempts, "Sends per request before giving up")
     ->capture_default_str()->check(CLI::PositiveNumber);

  app.add_option("--mqtt-host", v.mqtt.host, "MQTT broker host");
  app.add_option("--mqtt-port", v.mqtt.port, "MQTT broker port")
     ->capture_default_str()->check(CLI::Range(1, 65535));
  app.add_option("--mqtt-user", v.mqtt.user, "MQTT username");
  app.add_option("--mqtt-pass", v.mqtt.password, "MQTT password");
  app.add_option("--mqtt-topic", v.mqtt.base_topic, "Base topic prefix")->capture_default_str();
  app.add_option("--mqtt-client-id", v.mqtt.client_id, "MQTT client id")->capture_default_str();

  app.add_option("--poll-interval", v.bridge.poll_interval_ms, "Status poll interval (ms)")
     ->capture_default_str()->check(CLI::PositiveNumber);
  app.add_flag("--no-dedupe", a.no_dedupe, "Publish every value on every poll");
  app.add_flag("--retain", a.retain, "Publish state topics retained");

  app.add_option("--log", v.log.file, "Append log lines to this file instead of stderr");
  app.add_flag("--debug", a.debug, "Enable debug logging");
}

// ---------------------------------------------------------------------------
// merge_cli()
// -----------
// Only options with count() > 0 were typed by the user; everything else keeps
// the file's (or the default) value.
// ---------------------------------------------------------------------------
void merge_cli(const CLI::App& app, const CliArgs& a, AppConfig& cfg) {
  const AppConfig& v = a.values;
  auto given = [&](const char* name) {
    const CLI::Option* o = app.get_option_no_throw(name);
    return o && o->count() > 0;
  };

  if (given("--vento-host"))     cfg.device.host = v.device.host;
  if (given("--vento-port"))     cfg.device.port = v.device.port;
  if (given("--timeout"))        cfg.client.timeout_ms = v.client.timeout_ms;
  if (given("--retries"))        cfg.client.attempts = v.client.attempts;

  if (given("--mqtt-host"))      cfg.mqtt.host = v.mqtt.host;
  if (given("--mqtt-port"))      cfg.mqtt.port = v.mqtt.port;
  if (given("--mqtt-user"))      cfg.mqtt.user = v.mqtt.user;
  if (given("--mqtt-pass"))      cfg.mqtt.password = v.mqtt.password;
  if (given("--mqtt-topic"))     cfg.mqtt.base_topic = v.mqtt.base_topic;
  if (given("--mqtt-client-id")) cfg.mqtt.client_id = v.mqtt.client_id;

  if (given("--poll-interval"))  cfg.bridge.poll_interval_ms = v.bridge.poll_interval_ms;
  if (a.no_dedupe)               cfg.bridge.dedupe = false;
  if (a.retain)                  cfg.bridge.retain = true;

  if (given("--log"))            cfg.log.file = v.log.file;
  if (a.debug)                   cfg.log.debug = true;
}

// validate_config() — first failure wins; reasons name the offending field.
bool validate_config(const AppConfig& cfg, Error& err) {
  if (cfg.device.host.empty())       return err.set(ErrorCode::ConfigError, "missing:vento-host");
  if (cfg.device.port == 0)          return err.set(ErrorCode::ConfigError, "bad_port:vento-port");
  if (cfg.client.timeout_ms < 1)     return err.set(ErrorCode::ConfigError, "bad_value:timeout");
  if (cfg.client.attempts < 1)       return err.set(ErrorCode::ConfigError, "bad_value:retries");

  if (cfg.mqtt.host.empty())         return err.set(ErrorCode::ConfigError, "missing:mqtt-host");
  if (cfg.mqtt.port == 0)            return err.set(ErrorCode::ConfigError, "bad_port:mqtt-port");
  if (cfg.mqtt.keepalive_s < 5)      return err.set(ErrorCode::ConfigError, "bad_value:keepalive");
  if (cfg.mqtt.base_topic.empty() ||
      cfg.mqtt.base_topic.find_first_of("+#") != std::string::npos)
    return err.set(ErrorCode::ConfigError, "bad_topic:mqtt-topic");

  if (cfg.bridge.poll_interval_ms == 0) return err.set(ErrorCode::ConfigError, "bad_value:poll-interval");
  return true;
}

} // namespace ventobridge
