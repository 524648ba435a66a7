#include <catch2/catch.hpp>

#include <cstring>
#include <vector>

#include "packet_codec.h"

namespace {

DeviceId abc_id() {
    DeviceId id{};
    std::memcpy(id.data(), "ABCDEFGH", id.size());
    return id;
}

}  // namespace

TEST_CASE("Encode lays out id, big-endian sequence, priority and payload", "[packet]") {
    const std::vector<uint8_t> payload{0x01, 0x02};
    Bytes packet = packet_codec::encode(abc_id(), 42, Priority::High, payload);

    const std::vector<uint8_t> expected{'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H',
                                        0,   0,   0,   42,  1,   0x01, 0x02};
    REQUIRE(packet.size() == 15);
    REQUIRE(packet == expected);
}

TEST_CASE("Decode recovers every field", "[packet]") {
    AudioPacket original{abc_id(), 0xDEADBEEF, Priority::Emergency, {9, 8, 7, 6}};
    Bytes       wire = packet_codec::encode(original);

    auto               result = packet_codec::decode(wire);
    const AudioPacket* packet = packet_codec::as_packet(result);
    REQUIRE(packet != nullptr);
    CHECK(*packet == original);
}

TEST_CASE("Sequence extremes survive the wire", "[packet]") {
    for (uint32_t sequence: {0U, 1U, 0x7FFFFFFFU, 0xFFFFFFFFU}) {
        Bytes wire   = packet_codec::encode(abc_id(), sequence, Priority::Normal, Bytes{});
        auto  result = packet_codec::decode(wire);
        REQUIRE(packet_codec::as_packet(result) != nullptr);
        CHECK(packet_codec::as_packet(result)->sequence == sequence);
    }
}

TEST_CASE("Legacy 12-byte header decodes as Normal with empty payload", "[packet]") {
    std::vector<uint8_t> wire{'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 0, 0, 1, 0};

    auto               result = packet_codec::decode(wire);
    const AudioPacket* packet = packet_codec::as_packet(result);
    REQUIRE(packet != nullptr);
    CHECK(packet->device_id == abc_id());
    CHECK(packet->sequence == 256);
    CHECK(packet->priority == Priority::Normal);
    CHECK(packet->payload.empty());
}

TEST_CASE("Frames shorter than 12 bytes are rejected", "[packet]") {
    std::vector<uint8_t> wire(11, 0x00);
    auto                 result = packet_codec::decode(wire);
    REQUIRE(packet_codec::as_packet(result) == nullptr);
    CHECK(std::get<packet_codec::DecodeError>(result) == packet_codec::DecodeError::TooShort);

    CHECK(packet_codec::as_packet(packet_codec::decode({})) == nullptr);
}

TEST_CASE("Unknown priority bytes fall back to Normal", "[packet]") {
    Bytes wire = packet_codec::encode(abc_id(), 7, Priority::Normal, Bytes{0x55});
    wire[12]   = 0x07;

    auto result = packet_codec::decode(wire);
    REQUIRE(packet_codec::as_packet(result) != nullptr);
    CHECK(packet_codec::as_packet(result)->priority == Priority::Normal);
    CHECK(packet_codec::as_packet(result)->payload == Bytes{0x55});
}

TEST_CASE("Device ids convert to and from hex", "[packet]") {
    DeviceId id{0x00, 0x01, 0xAB, 0xCD, 0xEF, 0x10, 0x20, 0xFF};
    CHECK(to_hex(id) == "0001abcdef1020ff");
    CHECK(device_id_from_hex("0001ABCDEF1020FF") == id);
    CHECK_FALSE(device_id_from_hex("0001abcdef1020f").has_value());
    CHECK_FALSE(device_id_from_hex("0001abcdef1020fg").has_value());
}

TEST_CASE("Priority names parse back", "[packet]") {
    for (Priority p: {Priority::Normal, Priority::High, Priority::Emergency}) {
        CHECK(parse_priority(priority_name(p)) == p);
    }
    CHECK_FALSE(parse_priority("urgent").has_value());
}
