// -----------------------------------------------------------
// Input source tracking
// -----------------------------------------------------------

#include <catch2/catch.hpp>

#include <initializer_list>
#include <string>
#include <vector>

#include "protocol/source_tracker.h"

namespace {

PuckEvent decode(std::initializer_list<uint8_t> bytes) {
    std::vector<uint8_t> v(bytes);
    return decodeNotification(v.data(), v.size());
}

}  // namespace

TEST_CASE("Source is unknown until the puck reports one", "[source]") {
    SourceTracker tracker;
    CHECK(tracker.current() == InputSource::UNKNOWN);
    CHECK_FALSE(tracker.isKnown());

    CHECK_FALSE(tracker.onEvent(decode({0xc0, 0x02})));
    CHECK_FALSE(tracker.onEvent(decode({0xff, 0xff})));
    CHECK(tracker.current() == InputSource::UNKNOWN);
}

TEST_CASE("Switch echoes and completions update the source", "[source]") {
    SourceTracker tracker;

    CHECK(tracker.onEvent(decode({0xc1, 0x02})));
    CHECK(tracker.current() == InputSource::AUX);

    // Completion for the same source is not a change
    CHECK_FALSE(tracker.onEvent(decode({0xcf, 0x05})));
    CHECK(tracker.switchCount() == 1);

    CHECK(tracker.onEvent(decode({0xcf, 0x06})));
    CHECK(tracker.current() == InputSource::USB);

    CHECK(tracker.onEvent(decode({0xc1, 0x01})));
    CHECK(tracker.current() == InputSource::BLUETOOTH);
    CHECK(tracker.switchCount() == 3);
}

TEST_CASE("Missing completion after a switch echo is fine", "[source]") {
    SourceTracker tracker;
    tracker.onEvent(decode({0xc1, 0x03}));
    tracker.onEvent(decode({0xc0, 0x04}));
    CHECK(tracker.current() == InputSource::USB);
}

TEST_CASE("Reset forgets the source", "[source]") {
    SourceTracker tracker;
    tracker.onEvent(decode({0xcf, 0x04}));
    REQUIRE(tracker.isKnown());

    tracker.reset();
    CHECK(tracker.current() == InputSource::UNKNOWN);
    CHECK(tracker.switchCount() == 0);
    CHECK(std::string(inputSourceName(tracker.current())) == "unknown");
}
