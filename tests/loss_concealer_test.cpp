#include <catch2/catch.hpp>

#include <utility>
#include <vector>

#include "loss_concealer.h"
#include "test_support.h"

using test_support::FakeDecoder;
using Call = FakeDecoder::Call;

namespace {

AudioPacket packet_from(uint8_t sender, uint32_t sequence, Priority priority = Priority::Normal) {
    return AudioPacket{test_support::device_id(sender), sequence, priority,
                       Bytes{static_cast<uint8_t>(sequence & 0xFF)}};
}

struct Harness {
    FakeDecoder                             decoder;
    LossConcealer                           concealer{decoder};
    std::vector<std::pair<int16_t, Priority>> frames;  // first sample, forwarded priority

    void feed(uint8_t sender, uint32_t sequence, Priority priority = Priority::Normal) {
        concealer.process(packet_from(sender, sequence, priority),
                          [&](const PcmFrame& pcm, Priority p) { frames.emplace_back(pcm[0], p); });
    }
};

}  // namespace

TEST_CASE("Gaps classify into FEC, PLC or nothing", "[concealment]") {
    CHECK(classify_gap(0) == RecoveryKind::None);
    CHECK(classify_gap(1) == RecoveryKind::Fec);
    CHECK(classify_gap(2) == RecoveryKind::Plc);
    CHECK(classify_gap(4) == RecoveryKind::Plc);
    CHECK(classify_gap(5) == RecoveryKind::None);
    CHECK(classify_gap(0xFFFFFFFFU) == RecoveryKind::None);
}

TEST_CASE("One missing frame is recovered from the next packet's FEC", "[concealment]") {
    Harness h;
    h.feed(1, 10);
    h.feed(1, 11);
    h.decoder.calls.clear();
    h.frames.clear();

    h.feed(1, 13);

    REQUIRE(h.decoder.calls == std::vector<Call>{Call::Fec, Call::Decode});
    REQUIRE(h.frames.size() == 2);
    CHECK(h.concealer.stats().fec_frames == 1);
    CHECK(h.concealer.stats().plc_frames == 0);
}

TEST_CASE("A gap of four synthesises four PLC frames before the current one", "[concealment]") {
    Harness h;
    h.feed(1, 10);
    h.decoder.calls.clear();
    h.frames.clear();

    h.feed(1, 15, Priority::High);

    CHECK(h.decoder.count(Call::Plc) == 4);
    CHECK(h.decoder.count(Call::Fec) == 0);
    REQUIRE(h.frames.size() == 5);
    CHECK(h.frames.back().second == Priority::High);
    CHECK(h.decoder.calls.back() == Call::Decode);
}

TEST_CASE("Large gaps and duplicates skip concealment", "[concealment]") {
    Harness h;
    h.feed(1, 10);
    h.decoder.calls.clear();

    SECTION("gap of nine") {
        h.feed(1, 20);
    }
    SECTION("duplicate") {
        h.feed(1, 10);
    }
    SECTION("reordered") {
        h.feed(1, 8);
    }

    CHECK(h.decoder.calls == std::vector<Call>{Call::Decode});
    CHECK(h.concealer.stats().plc_frames == 0);
    CHECK(h.concealer.stats().fec_frames == 0);
}

TEST_CASE("Sequence wrap-around is a normal step", "[concealment]") {
    Harness h;
    h.feed(1, 0xFFFFFFFFU);
    h.decoder.calls.clear();

    h.feed(1, 0);
    CHECK(h.decoder.calls == std::vector<Call>{Call::Decode});

    h.feed(1, 2);
    CHECK(h.decoder.count(Call::Fec) == 1);
}

TEST_CASE("A new sender resets decoder state and sequence tracking", "[concealment]") {
    Harness h;
    h.feed(1, 100);
    h.decoder.calls.clear();

    // Far from sender 1's sequence, but a fresh stream must not be concealed
    h.feed(2, 3);

    CHECK(h.decoder.calls == std::vector<Call>{Call::Reset, Call::Decode});
    CHECK(h.concealer.stats().resets == 2);
}

TEST_CASE("Decode failures are counted and the stream continues", "[concealment]") {
    Harness     h;
    AudioPacket empty{test_support::device_id(1), 1, Priority::Normal, {}};
    h.concealer.process(empty, [&](const PcmFrame& pcm, Priority p) { h.frames.emplace_back(pcm[0], p); });

    CHECK(h.frames.empty());
    CHECK(h.concealer.stats().decode_fails == 1);

    h.feed(1, 2);
    CHECK(h.frames.size() == 1);
}
