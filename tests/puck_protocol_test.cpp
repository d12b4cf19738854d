// -----------------------------------------------------------
// Command codec / notification decoder tests
// -----------------------------------------------------------

#include <catch2/catch.hpp>

#include <initializer_list>
#include <set>
#include <string>
#include <vector>
#include <string.h>

#include "protocol/puck_protocol.h"

namespace {

struct Echo {
    PuckCommand cmd;
    uint8_t bytes[2];
};

// Confirmation frame the puck sends back for each user command
const Echo kEchoes[] = {
    { PuckCommand::VOLUME_UP,        {0xc0, 0x02} },
    { PuckCommand::VOLUME_DOWN,      {0xc0, 0x03} },
    { PuckCommand::BASS_UP,          {0xc0, 0x00} },
    { PuckCommand::BASS_DOWN,        {0xc0, 0x01} },
    { PuckCommand::PLAY_PAUSE,       {0xc0, 0x04} },
    { PuckCommand::NEXT_TRACK,       {0xc0, 0x05} },
    { PuckCommand::PREV_TRACK,       {0xc0, 0x06} },
    { PuckCommand::SWITCH_BLUETOOTH, {0xc1, 0x01} },
    { PuckCommand::SWITCH_AUX,       {0xc1, 0x02} },
    { PuckCommand::SWITCH_USB,       {0xc1, 0x03} },
    { PuckCommand::SOUND_1,          {0xc5, 0x03} },
    { PuckCommand::SOUND_2,          {0xc5, 0x02} },
    { PuckCommand::SOUND_3,          {0xc5, 0x01} },
    { PuckCommand::PAIRING,          {0xc2, 0x00} },
    { PuckCommand::FACTORY_RESET,    {0xc3, 0x00} },
    { PuckCommand::UNKNOWN_1,        {0xc5, 0x00} },
};

PuckEvent decode(std::initializer_list<uint8_t> bytes) {
    std::vector<uint8_t> v(bytes);
    return decodeNotification(v.data(), v.size());
}

bool opcodeIs(PuckCommand cmd, uint8_t b0, uint8_t b1) {
    PuckOpcode op = encodeCommand(cmd);
    return op.bytes[0] == b0 && op.bytes[1] == b1;
}

}  // namespace

TEST_CASE("Commands encode to their fixed opcodes", "[codec]") {
    CHECK(opcodeIs(PuckCommand::INITIATE,         0x84, 0x05));
    CHECK(opcodeIs(PuckCommand::ACKNOWLEDGE,      0x84, 0x00));
    CHECK(opcodeIs(PuckCommand::VOLUME_UP,        0x80, 0x02));
    CHECK(opcodeIs(PuckCommand::VOLUME_DOWN,      0x80, 0x03));
    CHECK(opcodeIs(PuckCommand::BASS_UP,          0x80, 0x00));
    CHECK(opcodeIs(PuckCommand::BASS_DOWN,        0x80, 0x01));
    CHECK(opcodeIs(PuckCommand::PLAY_PAUSE,       0x80, 0x04));
    CHECK(opcodeIs(PuckCommand::NEXT_TRACK,       0x80, 0x05));
    CHECK(opcodeIs(PuckCommand::PREV_TRACK,       0x80, 0x06));
    CHECK(opcodeIs(PuckCommand::SWITCH_BLUETOOTH, 0x81, 0x01));
    CHECK(opcodeIs(PuckCommand::SWITCH_AUX,       0x81, 0x02));
    CHECK(opcodeIs(PuckCommand::SWITCH_USB,       0x81, 0x03));
    CHECK(opcodeIs(PuckCommand::SOUND_1,          0x85, 0x01));
    CHECK(opcodeIs(PuckCommand::SOUND_2,          0x85, 0x02));
    CHECK(opcodeIs(PuckCommand::SOUND_3,          0x85, 0x03));
    CHECK(opcodeIs(PuckCommand::PAIRING,          0x82, 0x00));
    CHECK(opcodeIs(PuckCommand::FACTORY_RESET,    0x83, 0x00));
    CHECK(opcodeIs(PuckCommand::UNKNOWN_1,        0x85, 0x00));
}

TEST_CASE("No two commands share an opcode", "[codec]") {
    std::set<uint16_t> seen;
    for (size_t i = 0; i < PUCK_COMMAND_COUNT; ++i) {
        PuckOpcode op = encodeCommand(static_cast<PuckCommand>(i));
        uint16_t key = (uint16_t)((op.bytes[0] << 8) | op.bytes[1]);
        INFO("command " << commandName(static_cast<PuckCommand>(i)));
        CHECK(seen.insert(key).second);
    }
    CHECK(seen.size() == PUCK_COMMAND_COUNT);
}

TEST_CASE("Only INITIATE and ACKNOWLEDGE are handshake commands", "[codec]") {
    for (size_t i = 0; i < PUCK_COMMAND_COUNT; ++i) {
        PuckCommand cmd = static_cast<PuckCommand>(i);
        bool expected = (cmd == PuckCommand::INITIATE || cmd == PuckCommand::ACKNOWLEDGE);
        CHECK(isHandshakeCommand(cmd) == expected);
    }
}

TEST_CASE("Every user command's confirmation decodes back to its echo", "[codec][decoder]") {
    REQUIRE(sizeof(kEchoes) / sizeof(kEchoes[0]) == PUCK_COMMAND_COUNT - 2);

    for (const Echo& e : kEchoes) {
        INFO("command " << commandName(e.cmd));
        PuckEvent ev = decodeNotification(e.bytes, 2);
        CHECK(ev.kind == confirmationFor(e.cmd));
        CHECK(ev.kind != PuckEventKind::UNRECOGNIZED);
    }

    CHECK(confirmationFor(PuckCommand::INITIATE) == PuckEventKind::UNRECOGNIZED);
    CHECK(confirmationFor(PuckCommand::ACKNOWLEDGE) == PuckEventKind::UNRECOGNIZED);
}

TEST_CASE("Command names parse case-insensitively", "[codec]") {
    PuckCommand cmd = PuckCommand::INITIATE;

    REQUIRE(commandFromName("volume_up", cmd));
    CHECK(cmd == PuckCommand::VOLUME_UP);

    REQUIRE(commandFromName("Switch_Aux", cmd));
    CHECK(cmd == PuckCommand::SWITCH_AUX);

    CHECK_FALSE(commandFromName("volume", cmd));
    CHECK_FALSE(commandFromName("", cmd));
    CHECK_FALSE(commandFromName(nullptr, cmd));

    for (size_t i = 0; i < PUCK_COMMAND_COUNT; ++i) {
        PuckCommand c = static_cast<PuckCommand>(i);
        PuckCommand parsed;
        REQUIRE(commandFromName(commandName(c), parsed));
        CHECK(parsed == c);
    }
}

TEST_CASE("Handshake responses decode from 3-byte frames", "[decoder]") {
    CHECK(decode({0xd4, 0x05, 0x01}).kind == PuckEventKind::INITIATE_RESPONSE);
    CHECK(decode({0xd4, 0x00, 0x01}).kind == PuckEventKind::ACKNOWLEDGE_RESPONSE);
    CHECK(decode({0xd4, 0x00, 0x03}).kind == PuckEventKind::CONNECTED);

    for (PuckEventKind k : { PuckEventKind::INITIATE_RESPONSE,
                             PuckEventKind::ACKNOWLEDGE_RESPONSE,
                             PuckEventKind::CONNECTED }) {
        CHECK(isHandshakeResponse(k));
    }
    CHECK_FALSE(isHandshakeResponse(PuckEventKind::VOLUME_UP));
}

TEST_CASE("Other d4 payloads are unrecognized", "[decoder]") {
    CHECK(decode({0xd4, 0x05, 0x02}).kind == PuckEventKind::UNRECOGNIZED);
    CHECK(decode({0xd4, 0x00, 0x02}).kind == PuckEventKind::UNRECOGNIZED);
    CHECK(decode({0xd4, 0x05}).kind == PuckEventKind::UNRECOGNIZED);
}

TEST_CASE("Sound preset echoes are inverted relative to the commands", "[decoder]") {
    CHECK(decode({0xc5, 0x02}).kind == PuckEventKind::SOUND_2);
    CHECK(decode({0xc5, 0x03}).kind == PuckEventKind::SOUND_1);
    CHECK(decode({0xc5, 0x01}).kind == PuckEventKind::SOUND_3);
    CHECK(decode({0xc5, 0x00}).kind == PuckEventKind::UNKNOWN_1);
}

TEST_CASE("Switch completion events", "[decoder]") {
    CHECK(decode({0xcf, 0x04}).kind == PuckEventKind::SWITCHED_BLE);
    CHECK(decode({0xcf, 0x05}).kind == PuckEventKind::SWITCHED_AUX);
    CHECK(decode({0xcf, 0x06}).kind == PuckEventKind::SWITCHED_USB);
    CHECK(decode({0xcf, 0x07}).kind == PuckEventKind::UNRECOGNIZED);

    CHECK(isSwitchCompletion(PuckEventKind::SWITCHED_AUX));
    CHECK_FALSE(isSwitchCompletion(PuckEventKind::SWITCH_AUX));
}

TEST_CASE("Unknown frames keep their raw bytes", "[decoder]") {
    SECTION("ff ff") {
        PuckEvent ev = decode({0xff, 0xff});
        CHECK(ev.kind == PuckEventKind::UNRECOGNIZED);
        REQUIRE(ev.len == 2);
        CHECK(ev.rawLen == 2);
        CHECK(ev.data[0] == 0xff);
        CHECK(ev.data[1] == 0xff);
    }

    SECTION("empty") {
        PuckEvent ev = decodeNotification(nullptr, 0);
        CHECK(ev.kind == PuckEventKind::UNRECOGNIZED);
        CHECK(ev.len == 0);
        CHECK(ev.rawLen == 0);
    }

    SECTION("single byte") {
        PuckEvent ev = decode({0xc0});
        CHECK(ev.kind == PuckEventKind::UNRECOGNIZED);
        CHECK(ev.len == 1);
    }

    SECTION("valid prefix with trailing byte") {
        PuckEvent ev = decode({0xc0, 0x02, 0x00});
        CHECK(ev.kind == PuckEventKind::UNRECOGNIZED);
        CHECK(ev.len == 3);
    }

    SECTION("oversized frame is truncated but length kept") {
        std::vector<uint8_t> big(12);
        for (size_t i = 0; i < big.size(); ++i) big[i] = (uint8_t)i;
        PuckEvent ev = decodeNotification(big.data(), big.size());
        CHECK(ev.kind == PuckEventKind::UNRECOGNIZED);
        CHECK(ev.len == PUCK_MAX_FRAME);
        CHECK(ev.rawLen == 12);
        CHECK(ev.data[PUCK_MAX_FRAME - 1] == PUCK_MAX_FRAME - 1);
    }
}

TEST_CASE("Recognized events carry their payload too", "[decoder]") {
    PuckEvent ev = decode({0xd4, 0x00, 0x03});
    REQUIRE(ev.len == 3);
    CHECK(memcmp(ev.data, "\xd4\x00\x03", 3) == 0);
}

TEST_CASE("Event names", "[decoder]") {
    CHECK(std::string(eventName(PuckEventKind::CONNECTED)) == "CONNECTED");
    CHECK(std::string(eventName(PuckEventKind::SWITCHED_USB)) == "SWITCHED_USB");
    CHECK(std::string(eventName(PuckEventKind::UNRECOGNIZED)) == "UNRECOGNIZED");
    CHECK(std::string(eventName(PuckEventKind::COUNT)) == "?");
}

TEST_CASE("formatHex writes lower-case hex", "[decoder]") {
    const uint8_t bytes[] = { 0xd4, 0x05, 0x01 };
    char out[16];

    CHECK(formatHex(bytes, 3, out, sizeof(out)) == 6);
    CHECK(std::string(out) == "d40501");

    SECTION("output is clipped to the buffer") {
        char small[5];
        CHECK(formatHex(bytes, 3, small, sizeof(small)) == 4);
        CHECK(std::string(small) == "d405");
    }

    SECTION("nothing to format") {
        CHECK(formatHex(nullptr, 0, out, sizeof(out)) == 0);
        CHECK(out[0] == '\0');
    }
}
