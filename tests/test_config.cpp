#include <doctest/doctest.h>
#include "app_config.hpp"

#include <string>

using namespace ventobridge;

static AppConfig runnable() {
    AppConfig c;
    c.device.host = "192.168.1.40";
    c.mqtt.host = "broker.lan";
    return c;
}

TEST_CASE("Defaults match the documented values") {
    AppConfig c;
    CHECK(c.device.port == 4000);
    CHECK(c.client.timeout_ms == 2000);
    CHECK(c.client.attempts == 3);
    CHECK(c.mqtt.port == 1883);
    CHECK(c.mqtt.base_topic == "blauberg-vento");
    CHECK(c.bridge.poll_interval_ms == 5000);
    CHECK(c.bridge.dedupe);
    CHECK_FALSE(c.bridge.retain);
}

TEST_CASE("JSON file values land in their sections; absent keys keep defaults") {
    AppConfig c;
    Error err;
    REQUIRE(parse_config_json(R"({
        "device": { "host": "10.0.0.7", "attempts": 5 },
        "mqtt":   { "host": "mq", "user": "u", "password": "p", "base_topic": "home/vent" },
        "bridge": { "poll_interval_ms": 10000, "dedupe": false, "retain": true },
        "log":    { "debug": true },
        "extra":  { "ignored": 1 }
    })", c, err));

    CHECK(c.device.host == "10.0.0.7");
    CHECK(c.device.port == 4000);
    CHECK(c.client.attempts == 5);
    CHECK(c.client.timeout_ms == 2000);
    CHECK(c.mqtt.host == "mq");
    CHECK(c.mqtt.user == "u");
    CHECK(c.mqtt.password == "p");
    CHECK(c.mqtt.base_topic == "home/vent");
    CHECK(c.bridge.poll_interval_ms == 10000);
    CHECK_FALSE(c.bridge.dedupe);
    CHECK(c.bridge.retain);
    CHECK(c.log.debug);
}

TEST_CASE("Broken config documents are ConfigError and leave the config alone") {
    struct Case { const char* json; const char* reason_prefix; };
    const Case cases[] = {
        {"{ not json",                                 "json:"},
        {"[1, 2]",                                     "not_an_object"},
        {R"({"device": 5})",                           "bad_section:device"},
        {R"({"device": {"port": 70000}})",             "bad_port:device.port"},
        {R"({"mqtt": {"port": 0}})",                   "bad_port:mqtt.port"},
        {R"({"device": {"attempts": 0}})",             "bad_value:device.attempts"},
        {R"({"bridge": {"poll_interval_ms": -1}})",    "bad_value:bridge.poll_interval_ms"},
        {R"({"device": {"host": 42}})",                "json:"},
        {R"({"bridge": {"dedupe": "yes"}})",           "json:"},
    };

    for (const auto& c : cases) {
        CAPTURE(c.json);
        AppConfig cfg = runnable();
        Error err;
        CHECK_FALSE(parse_config_json(c.json, cfg, err));
        CHECK(err.code == ErrorCode::ConfigError);
        CHECK(err.reason.compare(0, std::string(c.reason_prefix).size(), c.reason_prefix) == 0);
        CHECK(cfg.device.host == "192.168.1.40");
    }
}

TEST_CASE("Missing config file is reported by path") {
    AppConfig c;
    Error err;
    CHECK_FALSE(load_config_file("/nonexistent/ventobridge.json", c, err));
    CHECK(err.reason == "unreadable:/nonexistent/ventobridge.json");
}

TEST_CASE("Flags override the file, only when given") {
    AppConfig cfg;
    Error err;
    REQUIRE(parse_config_json(R"({"device": {"host": "from-file", "port": 4001},
                                                                "mqtt": {"host": "mq-file"}})", cfg, err));

    CLI::App app;
    CliArgs args;
    register_cli(app, args);
    REQUIRE_NOTHROW(app.parse("--vento-host from-cli --no-dedupe --retain --poll-interval 2500", false));
    merge_cli(app, args, cfg);

    CHECK(cfg.device.host == "from-cli");
    CHECK(cfg.device.port == 4001);              // not given on the command line
    CHECK(cfg.mqtt.host == "mq-file");
    CHECK(cfg.bridge.poll_interval_ms == 2500);
    CHECK_FALSE(cfg.bridge.dedupe);
    CHECK(cfg.bridge.retain);
    CHECK_FALSE(cfg.log.debug);
}

TEST_CASE("CLI11 range checks reject bad ports") {
    CLI::App app;
    CliArgs args;
    register_cli(app, args);
    CHECK_THROWS_AS(app.parse("--mqtt-port 70000", false), CLI::ParseError);
}

TEST_CASE("validate_config names the first unusable field") {
    Error err;
    CHECK(validate_config(runnable(), err));

    AppConfig c = runnable();
    c.device.host.clear();
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.reason == "missing:vento-host");

    c = runnable();
    c.mqtt.host.clear();
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.reason == "missing:mqtt-host");

    c = runnable();
    c.mqtt.base_topic = "vent/#";
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.reason == "bad_topic:mqtt-topic");

    c = runnable();
    c.mqtt.keepalive_s = 2;
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.reason == "bad_value:keepalive");

    c = runnable();
    c.client.attempts = 0;
    CHECK_FALSE(validate_config(c, err));
    CHECK(err.code == ErrorCode::ConfigError);
    CHECK(err.reason == "bad_value:retries");
}
