/**
 * @file main.cpp
 * @brief ventobridge daemon — one Vento unit, one MQTT broker, one loop.
 *
 * Responsibilities:
 *  - Build the AppConfig (defaults, --config JSON, CLI11 flags) and validate it.
 *  - Open the UDP link, connect to the broker with a `Service Down` last will,
 *    subscribe to every command topic.
 *  - Run bridge.tick(ms) / bridge.wait(ms) until SIGINT or SIGTERM.
 *  - On shutdown: cancel the device client, publish `Service Down`, disconnect.
 *
 * Exit codes:
 *  - 0 clean shutdown
 *  - 2 configuration or log file problem
 *  - 3 device host could not be resolved / socket not opened
 *  - 4 broker connect failed
 */
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <signal.h>
#include <cstdint>
#include <string>
#include <thread>

#include "CLI/CLI11.hpp"

#include "app_config.hpp"
#include "mosquitto_client.hpp"
#include "ventobridge/bridge.hpp"
#include "ventobridge/device_client.hpp"
#include "ventobridge/log.hpp"
#include "ventobridge/topic_map.hpp"
#include "ventobridge/transport/transport_linux_udp.hpp"

using namespace ventobridge;

static constexpr uint32_t IDLE_WAIT_MAX_MS = 250;   // upper bound on one loop sleep

static std::atomic<bool> g_stop{false};
static DeviceClient*     g_device = nullptr;

// Async-signal-safe: two lock-free atomic stores.
static void on_signal(int) {
  g_stop.store(true);
  if (g_device) g_device->cancel();
}

static void install_signals() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

static uint32_t now_ms_steady32() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
  return static_cast<uint32_t>(ms);
}

int main(int argc, char** argv) {
  CLI::App app{"ventobridge - Blauberg Vento UDP to MQTT bridge"};
  CliArgs args;
  register_cli(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // ---- configuration: defaults < file < flags ----
  AppConfig cfg;
  Error err;
  if (!args.config_path.empty() && !load_config_file(args.config_path, cfg, err)) {
    log::error("status=error event=config reason=" + err.describe());
    return 2;
  }
  merge_cli(app, args, cfg);
  if (!validate_config(cfg, err)) {
    log::error("status=error event=config reason=" + err.describe());
    return 2;
  }

  if (cfg.log.debug) log::set_level(log::Level::Debug);
  if (!cfg.log.file.empty() && !log::open_file(cfg.log.file)) {
    log::error("status=error event=log_open file=" + cfg.log.file);
    return 2;
  }

  // ---- device side ----
  transport::LinuxUdp link(cfg.device);
  if (!link.begin()) {
    log::error("status=error event=udp host=" + cfg.device.host + " reason=" + link.last_error());
    return 3;
  }
  DeviceClient device(link, cfg.client);
  g_device = &device;

  // ---- broker side ----
  TopicMap topics(cfg.mqtt.base_topic);
  MosquittoClient mqtt(cfg.mqtt);
  mqtt.set_will(topics.service_topic(), SERVICE_DOWN, cfg.bridge.retain);

  Bridge bridge(device, mqtt, topics, cfg.bridge);
  mqtt.set_message_handler([&bridge](const std::string& topic, const std::string& payload) {
    if (!bridge.add_message(topic, payload))
      log::warn("status=dropped event=command topic=" + topic + " reason=inbox_full_or_unknown");
  });

  for (const auto& t : topics.command_topics()) {
    if (!mqtt.subscribe(t, err)) {
      log::error("status=error event=subscribe topic=" + t + " reason=" + err.describe());
      return 4;
    }
  }
  if (!mqtt.connect(err)) {
    log::error("status=error event=mqtt reason=" + err.describe());
    return 4;
  }

  install_signals();
  log::info("status=ok event=start vento=" + cfg.device.host + ":" + std::to_string(cfg.device.port) +
            " base=" + topics.base() + " poll_ms=" + std::to_string(cfg.bridge.poll_interval_ms));

  // ---- loop ----
  while (!g_stop.load()) {
    const uint32_t now = now_ms_steady32();
    bridge.tick(now);
    if (g_stop.load()) break;
    bridge.wait(std::min(bridge.ms_until_poll(now_ms_steady32()), IDLE_WAIT_MAX_MS));
  }

  // ---- shutdown ----
  log::info("status=ok event=stop reason=signal");
  device.cancel();
  bridge.publish_service_down();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));   // let the network thread flush
  mqtt.disconnect();
  link.end();
  g_device = nullptr;

  const DeviceStats ds = device.stats();
  const BridgeStats bs = bridge.stats();
  log::info("status=ok event=stats transactions=" + std::to_string(ds.transactions) +
            " timeouts=" + std::to_string(ds.timeouts) +
            " decode_errors=" + std::to_string(ds.decode_errors) +
            " commands_ok=" + std::to_string(bs.commands_ok) +
            " commands_failed=" + std::to_string(bs.commands_failed) +
            " polls_ok=" + std::to_string(bs.polls_ok) +
            " polls_failed=" + std::to_string(bs.polls_failed));
  log::close_file();
  return 0;
}
