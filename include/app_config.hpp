/**
 * @page vb-app-config Daemon Configuration
 * @file app_config.hpp
 * @brief Startup configuration: JSON file, then CLI flags, then validation.
 *
 * @details
 * PURPOSE
 * -------
 * Everything the daemon needs to know before it opens a socket lives in one
 * AppConfig value, built once in main() and handed down by const reference.
 * There are no globals; tests build configs directly.
 *
 * ORDER OF PRECEDENCE
 * -------------------
 *   1. compiled defaults (the member initializers below),
 *   2. `--config file.json`, section by section, key by key,
 *   3. flags given on the command line (only those actually present),
 *   4. validate_config(): anything unusable is a ConfigError and the daemon
 *      exits non-zero before touching the network.
 *
 * FILE FORMAT
 * -----------
 * @code
 *   {
 *     "device": { "host": "192.168.1.40", "port": 4000, "timeout_ms": 2000, "attempts": 3 },
 *     "mqtt":   { "host": "broker.lan", "port": 1883, "user": "vento", "password": "...",
 *                 "client_id": "ventobridge", "base_topic": "blauberg-vento", "keepalive": 60 },
 *     "bridge": { "poll_interval_ms": 5000, "dedupe": true, "publish_snapshot": true,
 *                 "publish_availability": true, "retain": false, "refresh_after_set": true },
 *     "log":    { "file": "/var/log/ventobridge.log", "debug": false }
 *   }
 * @endcode
 * Every section and key is optional. Unknown keys are ignored.
 */
#ifndef VENTOBRIDGE_APP_CONFIG_HPP
#define VENTOBRIDGE_APP_CONFIG_HPP

#include <string>

#include "CLI/CLI11.hpp"

#include "mosquitto_client.hpp"
#include "ventobridge/bridge.hpp"
#include "ventobridge/device_client.hpp"
#include "ventobridge/error.hpp"
#include "ventobridge/transport/transport_linux_udp.hpp"

namespace ventobridge {

struct LogConfig {
  std::string file;      // empty: stderr
  bool        debug{false};
};

struct AppConfig {
  transport::UdpConfig device;
  DeviceClientConfig   client;
  MqttConfig           mqtt;
  BridgeOptions        bridge;
  LogConfig            log;
};

/// Values bound to CLI11 options; merged over the file config by merge_cli().
struct CliArgs {
  AppConfig   values;
  std::string config_path;
  bool        no_dedupe{false};
  bool        retain{false};
  bool        debug{false};
};

/// Merge a JSON document into `cfg`. ConfigError on bad JSON or wrong types.
bool parse_config_json(const std::string& text, AppConfig& cfg, Error& err);

/// Read `path` and merge it into `cfg`. ConfigError if unreadable.
bool load_config_file(const std::string& path, AppConfig& cfg, Error& err);

/// Declare every daemon flag on `app`, bound to `args`.
void register_cli(CLI::App& app, CliArgs& args);

/// Copy the flags that were actually given over `cfg`.
void merge_cli(const CLI::App& app, const CliArgs& args, AppConfig& cfg);

/// Refuse configurations the daemon cannot run with.
bool validate_config(const AppConfig& cfg, Error& err);

} // namespace ventobridge

#endif // VENTOBRIDGE_APP_CONFIG_HPP
