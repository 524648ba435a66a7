#include <catch2/catch.hpp>

#include <cstring>
#include <memory>
#include <vector>

#include "audio_constants.h"
#include "audio_router.h"
#include "device_directory.h"
#include "test_support.h"

using test_support::FakePeer;

namespace {

struct RoutingFixture {
    RoutingFixture() {
        kitchen = add("c1", "Kitchen");
        office  = add("c2", "Office");
        anon    = add("c3", std::nullopt);
    }

    std::shared_ptr<FakePeer> add(const std::string& id, const std::optional<std::string>& client) {
        auto peer = std::make_shared<FakePeer>();
        sessions.add(id, peer);
        if (client) {
            sessions.identify(id, *client);
        }
        return peer;
    }

    SessionRegistry           sessions;
    AudioRouter               router{sessions};
    std::shared_ptr<FakePeer> kitchen;
    std::shared_ptr<FakePeer> office;
    std::shared_ptr<FakePeer> anon;
};

}  // namespace

TEST_CASE("Broadcast inbound audio reaches every session with a priority prefix", "[routing]") {
    RoutingFixture f;
    PcmFrame       pcm(audio_constants::FRAME_SIZE, 7);

    CHECK(f.router.forward_inbound(pcm, Priority::High, std::nullopt) == 3);
    CHECK(f.router.forward_inbound(pcm, Priority::High, std::string("All Rooms")) == 3);

    auto frames = f.office->binaries();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].size() == 1 + audio_constants::FRAME_BYTES);
    CHECK(frames[0][0] == static_cast<uint8_t>(Priority::High));
    int16_t first = 0;
    std::memcpy(&first, frames[0].data() + 1, sizeof(first));
    CHECK(first == 7);
}

TEST_CASE("Room-targeted inbound audio reaches only that room", "[routing]") {
    RoutingFixture f;
    PcmFrame       pcm(audio_constants::FRAME_SIZE, 1);

    CHECK(f.router.forward_inbound(pcm, Priority::Normal, std::string("Kitchen")) == 1);
    CHECK(f.kitchen->binaries().size() == 1);
    CHECK(f.office->binaries().empty());
    CHECK(f.anon->binaries().empty());

    // No fallback when the room has no browser
    CHECK(f.router.forward_inbound(pcm, Priority::Normal, std::string("Garage")) == 0);
    CHECK(f.office->binaries().empty());
}

TEST_CASE("PTT relay skips the sender and honours a target room", "[routing]") {
    RoutingFixture       f;
    std::vector<uint8_t> pcm(audio_constants::FRAME_BYTES, 0x10);

    CHECK(f.router.relay_ptt("c1", pcm, Priority::Emergency, std::nullopt) == 2);
    CHECK(f.kitchen->binaries().empty());
    REQUIRE(f.office->binaries().size() == 1);
    CHECK(f.office->binaries()[0][0] == static_cast<uint8_t>(Priority::Emergency));

    CHECK(f.router.relay_ptt("c1", pcm, Priority::Normal, std::string("Office")) == 1);
    CHECK(f.office->binaries().size() == 2);
    CHECK(f.anon->binaries().size() == 1);
}

TEST_CASE("A peer whose write fails is dropped from the registry", "[routing]") {
    RoutingFixture f;
    f.office->disconnect();

    CHECK(f.router.broadcast_json(AudioRouter::state_message("idle")) == 2);
    CHECK(f.sessions.count() == 2);
    CHECK_FALSE(f.sessions.exists("c2"));
}

TEST_CASE("JSON helpers build the browser protocol", "[routing]") {
    RoutingFixture f;

    CHECK(f.router.send_json("c3", AudioRouter::busy_message()));
    CHECK(f.anon->messages("busy").size() == 1);
    CHECK_FALSE(f.router.send_json("missing", AudioRouter::busy_message()));

    CHECK(f.router.broadcast_json(AudioRouter::state_message("receiving"), std::string("c1")) == 2);
    CHECK(f.kitchen->messages().empty());
    CHECK(f.office->messages("state")[0]["status"] == "receiving");

    CHECK(f.router.send_json_to_client("Kitchen", AudioRouter::targets_message({"Office"})) == 1);
    auto targets = f.kitchen->messages("targets");
    REQUIRE(targets.size() == 1);
    CHECK(targets[0]["rooms"] == nlohmann::json::array({"Office"}));
}

TEST_CASE("Device directory tracks rooms, addresses and sender targets", "[routing]") {
    DeviceDirectory devices;

    CHECK(devices.upsert("intercom_aabbccdd", "Kitchen", "192.168.1.20") == DeviceUpdate::Added);
    CHECK(devices.upsert("intercom_aabbccdd", "Kitchen", "192.168.1.21") == DeviceUpdate::Updated);
    CHECK(devices.upsert("intercom_11223344", "Office", "192.168.1.30") == DeviceUpdate::Added);
    CHECK(devices.upsert("bad", "Garage", "not-an-ip") == DeviceUpdate::Rejected);
    CHECK(devices.upsert("bad", "<script>", "192.168.1.9") == DeviceUpdate::Rejected);

    CHECK(devices.ip_for_room("Kitchen") == std::optional<std::string>("192.168.1.21"));
    CHECK_FALSE(devices.ip_for_room("Garage").has_value());
    CHECK(devices.target_options() == std::vector<std::string>{ALL_ROOMS, "Kitchen", "Office"});
    CHECK(devices.rooms("Kitchen") == std::vector<std::string>{"Office"});

    devices.on_device_state("intercom_aabbccdd", "transmitting", "Office");
    CHECK(devices.sender_target("intercom_aabbccdd") == std::optional<std::string>("Office"));
    devices.on_device_state("intercom_aabbccdd", "idle", "");
    CHECK_FALSE(devices.sender_target("intercom_aabbccdd").has_value());

    CHECK(devices.remove("intercom_11223344").has_value());
    CHECK_FALSE(devices.has_target("Office"));
    CHECK(DeviceDirectory::device_name_for_sender("1122334455667788") == "intercom_55667788");
}
