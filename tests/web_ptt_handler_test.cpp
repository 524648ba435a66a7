#include <catch2/catch.hpp>

#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "audio_constants.h"
#include "test_support.h"
#include "web_ptt_handler.h"

using namespace std::chrono_literals;
using test_support::FakePeer;

namespace {

struct PttFixture {
    PttFixture()
        : handler(hub.ctx, transmitter, [this](const std::string& target, const std::string& caller) {
              calls.emplace_back(target, caller);
          }) {}

    std::shared_ptr<FakePeer> open(const std::string& connection_id) {
        auto peer = std::make_shared<FakePeer>();
        handler.on_open(connection_id, peer);
        return peer;
    }

    void send(const std::string& connection_id, const nlohmann::json& message) {
        handler.on_text(connection_id, message.dump());
    }

    void send_frame(const std::string& connection_id, int16_t value = 500) {
        std::vector<int16_t> samples(audio_constants::FRAME_SIZE, value);
        std::vector<uint8_t> bytes(audio_constants::FRAME_BYTES);
        std::memcpy(bytes.data(), samples.data(), bytes.size());
        handler.on_binary(connection_id, bytes);
    }

    test_support::TestHub                            hub;
    test_support::FakeTransmitter                    transmitter;
    std::vector<std::pair<std::string, std::string>> calls;
    WebPttHandler                                    handler;
};

}  // namespace

TEST_CASE("A new browser gets init and the room list", "[ptt]") {
    PttFixture f;
    f.hub.ctx.devices.upsert("intercom_aabbccdd", "Kitchen", "192.168.1.20");

    auto peer = f.open("c1");

    auto init = peer->messages("init");
    REQUIRE(init.size() == 1);
    CHECK(init[0]["status"] == "idle");
    CHECK(init[0]["version"] == hub_config::VERSION);
    auto targets = peer->messages("targets");
    REQUIRE(targets.size() == 1);
    CHECK(targets[0]["rooms"] == nlohmann::json::array({"Kitchen"}));
    CHECK(f.hub.ctx.sessions.exists("c1"));
}

TEST_CASE("PTT press, talk and release", "[ptt]") {
    using namespace audio_constants;
    PttFixture f;
    auto       talker   = f.open("c1");
    auto       listener = f.open("c2");
    talker->clear();
    listener->clear();

    f.send("c1", {{"type", "ptt_start"}, {"priority", "High"}});

    CHECK(f.handler.is_transmitting("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Transmitting);
    CHECK(talker->messages("state")[0]["status"] == "transmitting");
    CHECK(listener->messages("state")[0]["status"] == "receiving");
    CHECK(f.hub.publisher.value("current_state") == "transmitting");

    f.send_frame("c1");
    f.send_frame("c1");

    auto sent = f.transmitter.sent();
    REQUIRE(sent.size() == LEAD_IN_FRAMES + 2);
    CHECK(sent.front().opus[0] == 0x00);
    CHECK(sent.back().opus[0] == 0xA5);
    CHECK(sent.back().priority == Priority::High);
    CHECK_FALSE(sent.back().unicast_ip.has_value());

    auto relayed = listener->binaries();
    REQUIRE(relayed.size() == 2);
    CHECK(relayed[0].size() == 1 + FRAME_BYTES);
    CHECK(relayed[0][0] == static_cast<uint8_t>(Priority::High));
    CHECK(talker->binaries().empty());

    f.send("c1", {{"type", "ptt_stop"}});

    CHECK(f.transmitter.sent().size() == LEAD_IN_FRAMES + 2 + TRAIL_OUT_FRAMES);
    CHECK_FALSE(f.handler.is_transmitting("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Idle);
    CHECK(f.hub.publisher.value("current_state") == "idle");
    CHECK(listener->messages("state").back()["status"] == "idle");
    CHECK(f.hub.ctx.arbiter.try_acquire_transmit().has_value());
}

TEST_CASE("Each PTT session starts from a reset encoder", "[ptt]") {
    PttFixture f;
    f.open("c1");

    f.send("c1", {{"type", "ptt_start"}});
    f.send("c1", {{"type", "ptt_stop"}});
    f.send("c1", {{"type", "ptt_start"}});
    f.send("c1", {{"type", "ptt_stop"}});

    CHECK(f.hub.encoder_counters->created.load() == 2);
    CHECK(f.hub.encoder_counters->resets.load() == 2);
}

TEST_CASE("Mis-sized frames and frames outside a session are ignored", "[ptt]") {
    PttFixture f;
    f.open("c1");

    f.send_frame("c1");
    CHECK(f.transmitter.attempts() == 0);

    f.send("c1", {{"type", "ptt_start"}});
    std::vector<uint8_t> short_frame(320, 0);
    f.handler.on_binary("c1", short_frame);
    std::vector<uint8_t> long_frame(641, 0);
    f.handler.on_binary("c1", long_frame);
    CHECK(f.transmitter.attempts() == 0);
}

TEST_CASE("A room target sends unicast and relays only to that room", "[ptt]") {
    PttFixture f;
    f.hub.ctx.devices.upsert("intercom_aabbccdd", "Kitchen", "192.168.1.20");
    f.open("c1");
    auto kitchen = f.open("c2");
    auto office  = f.open("c3");
    f.send("c2", {{"type", "identify"}, {"client_id", "Kitchen"}});
    f.send("c3", {{"type", "identify"}, {"client_id", "Office"}});

    f.send("c1", {{"type", "ptt_start"}, {"target", "Kitchen"}});
    f.send_frame("c1");

    CHECK(f.transmitter.sent().back().unicast_ip == std::optional<std::string>("192.168.1.20"));
    CHECK(kitchen->binaries().size() == 1);
    CHECK(office->binaries().empty());
}

TEST_CASE("PTT waits out equal priority audio and then talks over it", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    f.hub.ctx.arbiter.on_packet(Priority::High, "1122334455667788");

    auto start = std::chrono::steady_clock::now();
    f.send("c1", {{"type", "ptt_start"}, {"priority", "High"}});

    CHECK(std::chrono::steady_clock::now() - start >= 250ms);
    CHECK(peer->messages("busy").empty());
    CHECK(f.handler.is_transmitting("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Transmitting);
    CHECK(peer->messages("state").back()["status"] == "transmitting");
}

TEST_CASE("PTT starts as soon as the receive it waited on ends", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    f.hub.ctx.arbiter.on_packet(Priority::Normal, "1122334455667788");

    std::thread sender_gone([&]() {
        std::this_thread::sleep_for(20ms);
        f.hub.ctx.arbiter.check_rx_timeout(ChannelArbiter::clock::now() + 1s);
    });
    auto start = std::chrono::steady_clock::now();
    f.send("c1", {{"type", "ptt_start"}});
    auto waited = std::chrono::steady_clock::now() - start;
    sender_gone.join();

    CHECK(waited >= 20ms);
    CHECK(waited < 300ms);
    CHECK(peer->messages("busy").empty());
    CHECK(f.handler.is_transmitting("c1"));
}

TEST_CASE("Emergency PTT preempts a lower priority receive", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    f.hub.ctx.arbiter.on_packet(Priority::High, "1122334455667788");

    f.send("c1", {{"type", "ptt_start"}, {"priority", "Emergency"}});
    CHECK(peer->messages("busy").empty());
    CHECK(f.handler.is_transmitting("c1"));
}

TEST_CASE("PTT queues behind a hub stream and gives up after the bound", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    auto       held = f.hub.ctx.arbiter.try_acquire_transmit();
    REQUIRE(held.has_value());

    auto start = std::chrono::steady_clock::now();
    f.send("c1", {{"type", "ptt_start"}});

    CHECK(std::chrono::steady_clock::now() - start >= 150ms);
    CHECK(peer->messages("busy").size() == 1);
    CHECK_FALSE(f.handler.is_transmitting("c1"));
}

TEST_CASE("A stuck PTT session is reset by the watchdog", "[ptt]") {
    PttFixture f;
    auto       talker   = f.open("c1");
    auto       listener = f.open("c2");
    f.send("c1", {{"type", "ptt_start"}});
    f.send_frame("c1");
    REQUIRE(f.handler.is_transmitting("c1"));

    f.handler.check_watchdog(std::chrono::steady_clock::now() + 2s);
    CHECK(f.handler.is_transmitting("c1"));

    f.handler.check_watchdog(std::chrono::steady_clock::now() + 6s);

    CHECK_FALSE(f.handler.is_transmitting("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Idle);
    CHECK(f.hub.publisher.value("current_state") == "idle");
    CHECK(listener->messages("state").back()["status"] == "idle");
    CHECK(f.hub.ctx.arbiter.try_acquire_transmit().has_value());

    // Late frames from the reset session go nowhere
    size_t before = f.transmitter.attempts();
    f.send_frame("c1");
    CHECK(f.transmitter.attempts() == before);
}

TEST_CASE("Disconnecting mid-PTT frees the channel", "[ptt]") {
    PttFixture f;
    f.open("c1");
    f.send("c1", {{"type", "identify"}, {"client_id", "Garage"}});
    f.send("c1", {{"type", "ptt_start"}});

    f.handler.on_close("c1");

    CHECK_FALSE(f.hub.ctx.sessions.exists("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Idle);
    CHECK(f.hub.ctx.arbiter.try_acquire_transmit().has_value());
    CHECK(f.hub.publisher.value("web_client") ==
          nlohmann::json({{"client_id", "Garage"}, {"status", "offline"}}));
}

TEST_CASE("A client dropped after a failed write still goes offline on close", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    f.send("c1", {{"type", "identify"}, {"client_id", "Garage"}});

    peer->disconnect();
    f.hub.ctx.router.broadcast_json(AudioRouter::state_message("idle"));
    REQUIRE_FALSE(f.hub.ctx.sessions.exists("c1"));

    f.handler.on_close("c1");

    CHECK(f.hub.publisher.value("web_client") ==
          nlohmann::json({{"client_id", "Garage"}, {"status", "offline"}}));
}

TEST_CASE("The watchdog frees the channel held by a dropped talker", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    f.send("c1", {{"type", "ptt_start"}});
    f.send_frame("c1");
    REQUIRE(f.handler.is_transmitting("c1"));

    peer->disconnect();
    f.hub.ctx.router.broadcast_json(AudioRouter::state_message("receiving"));
    REQUIRE_FALSE(f.hub.ctx.sessions.exists("c1"));

    f.handler.check_watchdog(std::chrono::steady_clock::now() + 6s);

    CHECK_FALSE(f.handler.is_transmitting("c1"));
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Idle);
    CHECK(f.hub.ctx.arbiter.try_acquire_transmit().has_value());
}

TEST_CASE("Identify publishes presence and replaces the old id", "[ptt]") {
    PttFixture f;
    f.hub.ctx.devices.upsert("intercom_aabbccdd", "Kitchen", "192.168.1.20");
    f.hub.ctx.devices.upsert("intercom_11223344", "Office", "192.168.1.30");
    auto peer = f.open("c1");

    f.send("c1", {{"type", "identify"}, {"client_id", "Kitchen"}});
    f.send("c1", {{"type", "identify"}, {"client_id", "Office"}});
    f.send("c1", {{"type", "identify"}, {"client_id", "<bad>"}});

    auto presence = f.hub.publisher.values("web_client");
    REQUIRE(presence.size() == 3);
    CHECK(presence[0] == nlohmann::json({{"client_id", "Kitchen"}, {"status", "online"}}));
    CHECK(presence[1] == nlohmann::json({{"client_id", "Kitchen"}, {"status", "offline"}}));
    CHECK(presence[2] == nlohmann::json({{"client_id", "Office"}, {"status", "online"}}));
    CHECK(f.hub.ctx.sessions.client_id("c1") == std::optional<std::string>("Office"));

    // A client never sees itself as a target
    CHECK(peer->messages("targets").back()["rooms"] == nlohmann::json::array({"Kitchen"}));
}

TEST_CASE("Calls are placed with the client id as caller", "[ptt]") {
    PttFixture f;
    f.open("c1");
    f.open("c2");
    f.send("c1", {{"type", "identify"}, {"client_id", "Kitchen"}});

    f.send("c1", {{"type", "call"}, {"target", "Office"}});
    f.send("c2", {{"type", "call"}, {"target", "all"}});
    f.send("c2", {{"type", "call"}});

    REQUIRE(f.calls.size() == 2);
    CHECK(f.calls[0] == std::make_pair(std::string("Office"), std::string("Kitchen")));
    CHECK(f.calls[1] == std::make_pair(std::string("all"), std::string("Web PTT")));
}

TEST_CASE("get_state and set_chime", "[ptt]") {
    PttFixture f;
    f.hub.ctx.chimes.insert("doorbell", f.hub.ctx.chimes.encode_pcm(test_support::tone(320)));
    f.hub.ctx.chimes.insert("ding", f.hub.ctx.chimes.encode_pcm(test_support::tone(320)));
    auto peer = f.open("c1");
    peer->clear();

    f.send("c1", {{"type", "get_state"}});
    CHECK(peer->messages("state")[0]["status"] == "idle");
    CHECK(peer->messages("targets").size() == 1);

    f.send("c1", {{"type", "set_chime"}, {"chime", "ding"}});
    CHECK(f.hub.ctx.chimes.current() == "ding");
    CHECK(f.hub.publisher.value("chime") == "ding");

    f.send("c1", {{"type", "set_chime"}, {"chime", "nope"}});
    CHECK(f.hub.ctx.chimes.current() == "ding");
}

TEST_CASE("Malformed and out-of-order control messages are ignored", "[ptt]") {
    PttFixture f;
    auto       peer = f.open("c1");
    peer->clear();

    f.handler.on_text("c1", "{not json");
    f.handler.on_text("c1", "[1,2,3]");
    f.handler.on_text("c1", std::string(2000, ' '));
    f.send("c1", {{"type", "ptt_stop"}});
    f.send("c1", {{"type", "bogus"}});
    f.send("c1", {{"type", 5}});

    CHECK(peer->messages().empty());
    CHECK(f.hub.ctx.arbiter.mode() == ChannelMode::Idle);

    f.send("c1", {{"type", "ptt_start"}});
    f.send("c1", {{"type", "ptt_start"}});
    CHECK(f.handler.is_transmitting("c1"));
    CHECK(peer->messages("busy").empty());
}
