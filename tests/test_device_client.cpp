#include <doctest/doctest.h>
#include "ventobridge/device_client.hpp"
#include "sim_device.hpp"

#include <atomic>
#include <string>
#include <thread>

using namespace ventobridge;
using vbtest::SimDevice;

static const Parameter& param(const char* name) {
    const Parameter* p = find_parameter(std::string(name));
    REQUIRE(p != nullptr);
    return *p;
}

static std::string hex(const std::vector<uint8_t>& b) { return to_hex(b.data(), b.size()); }

TEST_CASE("Query: one send, one reply, decoded page") {
    SimDevice sim;
    DeviceClient dc(sim, DeviceClientConfig{});

    ResponseFrame f;
    Error err;
    REQUIRE(dc.query(f, err));
    CHECK(f.readings.size() == 25);
    CHECK(sim.sent.size() == 1);
    CHECK(hex(sim.sent[0]) == "6d6f62696c6501000d0a");

    const DeviceStats s = dc.stats();
    CHECK(s.transactions == 1);
    CHECK(s.sends == 1);
    CHECK(s.timeouts == 0);
}

TEST_CASE("Drop N-1 of N replies: success on the last attempt") {
    SimDevice sim;
    sim.drop_replies = 2;
    DeviceClient dc(sim, DeviceClientConfig{50, 3});

    ResponseFrame f;
    Error err;
    REQUIRE(dc.query(f, err));
    CHECK(sim.sent.size() == 3);
    CHECK(dc.stats().timeouts == 2);
}

TEST_CASE("Drop all N replies: DeviceUnreachable") {
    SimDevice sim;
    sim.drop_replies = 3;
    DeviceClient dc(sim, DeviceClientConfig{50, 3});

    ResponseFrame f;
    Error err;
    CHECK_FALSE(dc.query(f, err));
    CHECK(err.code == ErrorCode::DeviceUnreachable);
    CHECK(err.reason == "attempts_exhausted:3(timeout)");
    CHECK(sim.sent.size() == 3);
    CHECK(dc.stats().failures == 1);
}

TEST_CASE("A malformed reply consumes the attempt and triggers a resend") {
    SimDevice sim;
    sim.garbage_replies = 1;
    DeviceClient dc(sim, DeviceClientConfig{50, 2});

    ResponseFrame f;
    Error err;
    REQUIRE(dc.query(f, err));
    CHECK(sim.sent.size() == 2);
    CHECK(dc.stats().decode_errors == 1);

    SimDevice bad;
    bad.garbage_replies = 5;
    DeviceClient dc2(bad, DeviceClientConfig{50, 2});
    CHECK_FALSE(dc2.query(f, err));
    CHECK(err.code == ErrorCode::DeviceUnreachable);
    CHECK(err.reason == "attempts_exhausted:2(bad_header)");
}

TEST_CASE("Datagrams from other senders do not consume an attempt") {
    SimDevice sim;
    sim.foreign_before_reply = 3;
    DeviceClient dc(sim, DeviceClientConfig{50, 1});

    ResponseFrame f;
    Error err;
    REQUIRE(dc.query(f, err));
    CHECK(sim.sent.size() == 1);
    CHECK(dc.stats().foreign == 3);
}

TEST_CASE("Stale replies queued before a transaction are drained, not taken as the answer") {
    SimDevice sim;
    sim.push_stale();            // page with fan-speed 2
    sim.set(PARAM_FAN_SPEED, Value::integer(4));
    DeviceClient dc(sim, DeviceClientConfig{});

    ResponseFrame f;
    Error err;
    REQUIRE(dc.query(f, err));
    CHECK(f.find(PARAM_FAN_SPEED)->value.number == 4);
}

TEST_CASE("set_parameter: invalid value is refused before anything is sent") {
    SimDevice sim;
    DeviceClient dc(sim, DeviceClientConfig{});

    ResponseFrame ack;
    Error err;
    CHECK_FALSE(dc.set_parameter(param("fan-speed"), Value::integer(7), ack, err));
    CHECK(err.code == ErrorCode::InvalidValue);
    CHECK(err.reason == "bad_value:fan-speed(1..4)");

    CHECK_FALSE(dc.set_parameter(param("humidity"), Value::integer(50), ack, err));
    CHECK(err.code == ErrorCode::InvalidValue);
    CHECK(err.reason == "read_only:humidity");

    CHECK(sim.sent.empty());
}

TEST_CASE("set_parameter: write frame out, status page back as the ack") {
    SimDevice sim;
    DeviceClient dc(sim, DeviceClientConfig{});

    ResponseFrame ack;
    Error err;
    REQUIRE(dc.set_parameter(param("fan-speed"), Value::integer(3), ack, err));
    REQUIRE(sim.sent.size() == 1);
    CHECK(hex(sim.sent[0]) == "6d6f62696c6504030d0a");
    REQUIRE(ack.find(PARAM_FAN_SPEED) != nullptr);
    CHECK(ack.find(PARAM_FAN_SPEED)->value.number == 3);
}

TEST_CASE("Toggle parameters: read first, toggle only on a mismatch") {
    SimDevice sim;                  // power is on
    DeviceClient dc(sim, DeviceClientConfig{});
    ResponseFrame ack;
    Error err;

    REQUIRE(dc.set_parameter(param("power"), Value::boolean(true), ack, err));
    CHECK(sim.reads == 1);
    CHECK(sim.toggles == 0);
    CHECK(ack.find(PARAM_POWER)->value.number == 1);

    REQUIRE(dc.set_parameter(param("power"), Value::boolean(false), ack, err));
    CHECK(sim.reads == 2);
    CHECK(sim.toggles == 1);
    CHECK(hex(sim.sent.back()) == "6d6f62696c6503000d0a");
    CHECK(ack.find(PARAM_POWER)->value.number == 0);
}

TEST_CASE("Toggle refuses to guess when the page lacks the parameter") {
    SimDevice sim;
    sim.reply_only = {PARAM_FAN_SPEED};
    DeviceClient dc(sim, DeviceClientConfig{});
    ResponseFrame ack;
    Error err;

    CHECK_FALSE(dc.set_parameter(param("power"), Value::boolean(false), ack, err));
    CHECK(err.code == ErrorCode::DecodeError);
    CHECK(err.reason == "state_unknown:power");
    CHECK(sim.toggles == 0);
}

TEST_CASE("cancel() stops further attempts") {
    SimDevice sim;
    DeviceClient dc(sim, DeviceClientConfig{});
    dc.cancel();
    CHECK(dc.cancelled());

    ResponseFrame f;
    Error err;
    CHECK_FALSE(dc.query(f, err));
    CHECK(err.code == ErrorCode::DeviceUnreachable);
    CHECK(err.reason == "cancelled");
    CHECK(sim.sent.empty());
}

TEST_CASE("Attempts below one are raised to one") {
    SimDevice sim;
    sim.drop_replies = 1;
    DeviceClient dc(sim, DeviceClientConfig{50, 0});
    CHECK(dc.config().attempts == 1);

    ResponseFrame f;
    Error err;
    CHECK_FALSE(dc.query(f, err));
    CHECK(sim.sent.size() == 1);
}

TEST_CASE("Direct writes are resent on silence like reads") {
    SimDevice sim;
    sim.drop_replies = 2;
    DeviceClient dc(sim, DeviceClientConfig{20, 3});
    ResponseFrame ack;
    Error err;

    REQUIRE(dc.set_parameter(param("fan-speed"), Value::integer(4), ack, err));
    CHECK(sim.writes == 3);
    CHECK(ack.find(PARAM_FAN_SPEED)->value.number == 4);

    sim.drop_replies = 3;
    CHECK_FALSE(dc.set_parameter(param("fan-speed"), Value::integer(1), ack, err));
    CHECK(err.code == ErrorCode::DeviceUnreachable);
    CHECK(err.reason == "attempts_exhausted:3(timeout)");
}

TEST_CASE("A toggle whose reply is lost is confirmed by a read, never sent twice") {
    SimDevice sim;                   // power is on
    sim.drop_toggle_replies = 1;
    DeviceClient dc(sim, DeviceClientConfig{20, 3});
    ResponseFrame ack;
    Error err;

    REQUIRE(dc.set_parameter(param("power"), Value::boolean(false), ack, err));
    CHECK(sim.toggles == 1);
    CHECK(sim.reads == 2);
    CHECK(sim.get(PARAM_POWER).number == 0);
    CHECK(ack.find(PARAM_POWER)->value.number == 0);
}

TEST_CASE("A toggle frame lost on the way is sent again after the read shows no change") {
    SimDevice sim;
    sim.lose_toggles = 1;
    DeviceClient dc(sim, DeviceClientConfig{20, 3});
    ResponseFrame ack;
    Error err;

    REQUIRE(dc.set_parameter(param("power"), Value::boolean(false), ack, err));
    int toggle_frames = 0;
    for (const auto& f : sim.sent)
        if (hex(f) == "6d6f62696c6503000d0a") ++toggle_frames;
    CHECK(toggle_frames == 2);
    CHECK(sim.toggles == 1);
    CHECK(sim.get(PARAM_POWER).number == 0);
    CHECK(ack.find(PARAM_POWER)->value.number == 0);
}

TEST_CASE("A toggle the unit never applies ends in DeviceUnreachable, state untouched") {
    SimDevice sim;
    sim.lose_toggles = 3;
    DeviceClient dc(sim, DeviceClientConfig{20, 3});
    ResponseFrame ack;
    Error err;

    CHECK_FALSE(dc.set_parameter(param("power"), Value::boolean(false), ack, err));
    CHECK(err.code == ErrorCode::DeviceUnreachable);
    CHECK(err.reason == "attempts_exhausted:3(toggle_unconfirmed)");
    CHECK(sim.get(PARAM_POWER).number == 1);
    CHECK(sim.reads == 4);           // first read plus one per lost toggle
}

TEST_CASE("Concurrent callers never interleave their exchanges") {
    SimDevice sim;
    DeviceClient dc(sim, DeviceClientConfig{20, 3});
    std::atomic<int> failures{0};
    const int rounds = 200;

    std::thread reader([&] {
        for (int i = 0; i < rounds; ++i) {
            ResponseFrame f;
            Error err;
            if (!dc.query(f, err)) ++failures;
        }
    });
    std::thread writer([&] {
        for (int i = 0; i < rounds; ++i) {
            ResponseFrame ack;
            Error err;
            const Value v = Value::integer(static_cast<uint8_t>(1 + i % 4));
            if (!dc.set_parameter(param("fan-speed"), v, ack, err)) ++failures;
        }
    });
    reader.join();
    writer.join();

    CHECK(failures.load() == 0);
    REQUIRE(sim.trace.size() == 4u * rounds);
    bool alternating = true;
    for (std::size_t i = 0; i < sim.trace.size(); ++i)
        if (sim.trace[i] != (i % 2 == 0 ? 'S' : 'R')) alternating = false;
    CHECK(alternating);
}
