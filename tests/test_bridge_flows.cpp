#include <doctest/doctest.h>
#include "ventobridge/bridge.hpp"
#include "sim_device.hpp"

#include "nlohmann/json.hpp"

#include <string>

using namespace ventobridge;
using vbtest::FakeBus;
using vbtest::SimDevice;

// Everything a bridge test needs, wired the way main() wires it.
struct Rig {
    SimDevice     sim;
    FakeBus       bus;
    TopicMap      topics{"vent"};
    BridgeOptions opts;
    DeviceClient  device;
    Bridge        bridge;

    explicit Rig(const BridgeOptions& o = BridgeOptions{})
    : opts(o), device(sim, DeviceClientConfig{20, 2}), bridge(device, bus, topics, opts) {}
};

static BridgeOptions states_only() {
    BridgeOptions o;
    o.publish_snapshot = false;
    o.publish_availability = false;
    return o;
}

TEST_CASE("First tick polls and publishes every value, the snapshot and Online") {
    Rig r;
    r.bridge.tick(0);

    CHECK(r.sim.reads == 1);
    CHECK(r.bus.published.size() == 25 + 2);
    CHECK(r.bus.last("vent/fan-speed/state") == "2");
    CHECK(r.bus.last("vent/power/state") == "ON");
    CHECK(r.bus.last("vent/mode-countdown/state") == "00:00:00");
    CHECK(r.bus.last("vent/service") == SERVICE_ONLINE);
    CHECK(r.bridge.stats().polls_ok == 1);
}

TEST_CASE("MQTT set: fan-speed 3 reaches the unit and the new state comes back") {
    Rig r;
    r.bridge.tick(0);
    r.bus.published.clear();

    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "3"));
    CHECK(r.bridge.pending() == 1);
    r.bridge.tick(100);

    CHECK(r.bridge.pending() == 0);
    CHECK(to_hex(r.sim.sent.back().data(), r.sim.sent.back().size()) == "6d6f62696c6504030d0a");
    CHECK(r.bus.count("vent/fan-speed/state") == 1);
    CHECK(r.bus.last("vent/fan-speed/state") == "3");
    CHECK(r.bus.count("vent/power/state") == 0);          // unchanged, de-duplicated
    CHECK(r.bus.count("vent/status") == 1);

    const auto snap = nlohmann::json::parse(r.bus.last("vent/status"));
    CHECK(snap.at("fan-speed").get<int>() == 3);
    CHECK(snap.at("power").get<bool>() == true);
    CHECK(snap.at("airflow").get<int>() == 1);
    CHECK(snap.at("night-mode-timer").get<std::string>() == "00:00:00");

    CHECK(r.bridge.stats().commands_ok == 1);
}

TEST_CASE("Writing the value the unit already has still answers on the state topic") {
    Rig r;
    r.bridge.tick(0);
    r.bus.published.clear();

    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "2"));
    r.bridge.tick(10);
    CHECK(r.bus.count("vent/fan-speed/state") == 1);
    CHECK(r.bus.last("vent/fan-speed/state") == "2");
}

TEST_CASE("Poll with boost on and filter clear publishes exactly those two states") {
    Rig r(states_only());
    r.sim.reply_only = {PARAM_BOOST_MODE, PARAM_FILTER_ALARM};
    r.sim.set(PARAM_BOOST_MODE, Value::boolean(true));
    r.sim.set(PARAM_FILTER_ALARM, Value::boolean(false));

    r.bridge.tick(0);
    REQUIRE(r.bus.published.size() == 2);
    CHECK(r.bus.last("vent/boost-mode/state") == "ON");
    CHECK(r.bus.last("vent/filter-alarm/state") == "OFF");

    SUBCASE("an identical second poll publishes nothing") {
        r.bridge.tick(5000);
        CHECK(r.sim.reads == 2);
        CHECK(r.bus.published.size() == 2);
    }

    SUBCASE("a change publishes only the changed topic") {
        r.sim.set(PARAM_FILTER_ALARM, Value::boolean(true));
        r.bridge.tick(5000);
        REQUIRE(r.bus.published.size() == 3);
        CHECK(r.bus.published.back().first == "vent/filter-alarm/state");
        CHECK(r.bus.published.back().second == "ON");
    }
}

TEST_CASE("Without de-duplication every poll republishes everything") {
    BridgeOptions o = states_only();
    o.dedupe = false;
    Rig r(o);
    r.sim.reply_only = {PARAM_BOOST_MODE, PARAM_FILTER_ALARM};

    r.bridge.tick(0);
    r.bridge.tick(5000);
    CHECK(r.bus.published.size() == 4);
    CHECK(r.bus.count("vent/boost-mode/state") == 2);
}

TEST_CASE("Polls wait for the interval, and the interval survives the 32-bit wrap") {
    Rig r(states_only());
    r.bridge.tick(0xFFFFF000u);
    CHECK(r.sim.reads == 1);
    CHECK(r.bridge.ms_until_poll(0xFFFFF000u) == 5000);

    r.bridge.tick(0xFFFFF000u + 4999);
    CHECK(r.sim.reads == 1);
    CHECK(r.bridge.ms_until_poll(0xFFFFF000u + 4999) == 1);

    r.bridge.tick(0xFFFFF000u + 5000);        // wrapped past zero
    CHECK(r.sim.reads == 2);
    CHECK(r.bridge.tick_count() == 3);
}

TEST_CASE("Unreachable unit: TimeOut on the service topic, Online again on recovery") {
    Rig r;
    r.sim.drop_replies = 2;                   // both attempts of the first poll
    r.bridge.tick(0);

    CHECK(r.bus.last("vent/service") == SERVICE_TIMEOUT);
    CHECK(r.bus.count("vent/fan-speed/state") == 0);
    CHECK(r.bridge.stats().polls_failed == 1);

    r.bridge.tick(5000);
    CHECK(r.bus.last("vent/service") == SERVICE_ONLINE);
    CHECK(r.bus.count("vent/service") == 2);
    CHECK(r.bus.count("vent/fan-speed/state") == 1);

    r.bridge.tick(10000);
    CHECK(r.bus.count("vent/service") == 2);  // no transition, no publish
}

TEST_CASE("Bad payloads and rejected values never reach the unit") {
    Rig r;
    r.bridge.tick(0);
    const std::size_t sends = r.sim.sent.size();
    r.bus.published.clear();

    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "fast"));
    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "9"));
    REQUIRE(r.bridge.add_message("vent/airflow/set", "sideways"));
    r.bridge.tick(1);
    r.bridge.tick(2);
    r.bridge.tick(3);

    CHECK(r.sim.sent.size() == sends);
    CHECK(r.bus.published.empty());
    CHECK(r.bridge.stats().commands_failed == 3);
}

TEST_CASE("Inbox refuses unrelated topics and overflow") {
    Rig r;
    CHECK_FALSE(r.bridge.add_message("vent/humidity/set", "50"));     // read-only
    CHECK_FALSE(r.bridge.add_message("vent/fan-speed/state", "3"));
    CHECK_FALSE(r.bridge.add_message("elsewhere/fan-speed/set", "3"));

    for (std::size_t i = 0; i < Bridge::INBOX_CAP; ++i)
        CHECK(r.bridge.add_message("vent/fan-speed/set", "3"));
    CHECK_FALSE(r.bridge.add_message("vent/fan-speed/set", "4"));

    CHECK(r.bridge.pending() == Bridge::INBOX_CAP);
    CHECK(r.bridge.stats().rejected == 4);
}

TEST_CASE("Commands run in arrival order, one per tick") {
    Rig r(states_only());
    r.bridge.tick(0);

    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "1"));
    REQUIRE(r.bridge.add_message("vent/fan-speed/set", "4"));
    r.bridge.tick(1);
    CHECK(r.bus.last("vent/fan-speed/state") == "1");
    CHECK(r.bridge.pending() == 1);
    r.bridge.tick(2);
    CHECK(r.bus.last("vent/fan-speed/state") == "4");
}

TEST_CASE("Power goes through read-then-toggle") {
    Rig r(states_only());
    r.bridge.tick(0);

    REQUIRE(r.bridge.add_message("vent/power/set", "OFF"));
    r.bridge.tick(1);
    CHECK(r.sim.toggles == 1);
    CHECK(r.bus.last("vent/power/state") == "OFF");

    REQUIRE(r.bridge.add_message("vent/power/set", "off"));
    r.bridge.tick(2);
    CHECK(r.sim.toggles == 1);
    CHECK(r.bus.count("vent/power/state") == 3);           // forced even when unchanged
}

TEST_CASE("An ack without the written parameter triggers a refresh") {
    Rig r(states_only());
    r.bridge.tick(0);
    const int reads = r.sim.reads;
    r.sim.ack_omits_written = true;

    REQUIRE(r.bridge.add_message("vent/airflow/set", "supply"));
    r.bridge.tick(1);
    CHECK(r.sim.reads == reads + 1);
    CHECK(r.bus.last("vent/airflow/state") == "2");

    SUBCASE("unless refresh is switched off") {
        BridgeOptions o = states_only();
        o.refresh_after_set = false;
        Rig q(o);
        q.bridge.tick(0);
        q.sim.ack_omits_written = true;
        REQUIRE(q.bridge.add_message("vent/airflow/set", "0"));
        q.bridge.tick(1);
        CHECK(q.sim.reads == 1);
        CHECK(q.bus.last("vent/airflow/state") == "1");      // still the polled value
    }
}

TEST_CASE("A failed publish is retried on the next poll even with de-duplication") {
    Rig r(states_only());
    r.sim.reply_only = {PARAM_FAN_SPEED};
    r.bus.fail_publish = true;
    r.bridge.tick(0);
    CHECK(r.bus.published.empty());

    r.bus.fail_publish = false;
    r.bridge.tick(5000);
    CHECK(r.bus.count("vent/fan-speed/state") == 1);
}

TEST_CASE("Shutdown publishes Service Down") {
    Rig r;
    r.bridge.tick(0);
    r.bridge.publish_service_down();
    CHECK(r.bus.last("vent/service") == SERVICE_DOWN);
}

TEST_CASE("wake() releases wait() without a command") {
    Rig r;
    r.bridge.wake();
    r.bridge.wait(10000);       // returns at once: the wake flag is already set
    CHECK(r.bridge.pending() == 0);
}
