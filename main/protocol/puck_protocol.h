#pragma once

// -----------------------------------------------------------
// Z407 puck wire protocol - command opcodes and notification frames
// Pure tables, no ESP-IDF dependency (host testable)
// -----------------------------------------------------------

#include <stddef.h>
#include <stdint.h>

// Notifications are 2 or 3 bytes; anything longer is kept truncated
static constexpr size_t PUCK_MAX_FRAME = 8;

// Logical commands written to the command characteristic
enum class PuckCommand : uint8_t {
    // Handshake only
    INITIATE = 0,
    ACKNOWLEDGE,

    // Audio
    VOLUME_UP,
    VOLUME_DOWN,
    BASS_UP,
    BASS_DOWN,

    // Media keys
    PLAY_PAUSE,
    NEXT_TRACK,
    PREV_TRACK,

    // Input selection
    SWITCH_BLUETOOTH,
    SWITCH_AUX,
    SWITCH_USB,

    // Sound presets
    SOUND_1,
    SOUND_2,
    SOUND_3,

    // System
    PAIRING,
    FACTORY_RESET,
    UNKNOWN_1,

    COUNT
};

static constexpr size_t PUCK_COMMAND_COUNT = static_cast<size_t>(PuckCommand::COUNT);

// Logical events decoded from the response characteristic
enum class PuckEventKind : uint8_t {
    // Handshake responses (3-byte frames)
    INITIATE_RESPONSE = 0,
    ACKNOWLEDGE_RESPONSE,
    CONNECTED,

    // Command confirmation echoes
    VOLUME_UP,
    VOLUME_DOWN,
    BASS_UP,
    BASS_DOWN,
    PLAY_PAUSE,
    NEXT_TRACK,
    PREV_TRACK,
    SWITCH_BLUETOOTH,
    SWITCH_AUX,
    SWITCH_USB,
    SOUND_1,
    SOUND_2,
    SOUND_3,
    PAIRING,
    FACTORY_RESET,
    UNKNOWN_1,

    // Source switch completed (only sent if the source actually changed)
    SWITCHED_BLE,
    SWITCHED_AUX,
    SWITCHED_USB,

    UNRECOGNIZED,

    COUNT
};

// 2-byte opcode
struct PuckOpcode {
    uint8_t bytes[2];

    bool operator==(const PuckOpcode& other) const {
        return bytes[0] == other.bytes[0] && bytes[1] == other.bytes[1];
    }
    bool operator!=(const PuckOpcode& other) const { return !(*this == other); }
};

// Decoded notification. The raw payload is kept for every kind so
// UNRECOGNIZED frames stay diagnosable.
struct PuckEvent {
    PuckEventKind kind;
    uint8_t data[PUCK_MAX_FRAME];
    uint8_t len;        // bytes held in data
    size_t  rawLen;     // length as received

    PuckEvent() : kind(PuckEventKind::UNRECOGNIZED), data{}, len(0), rawLen(0) {}

    bool is(PuckEventKind k) const { return kind == k; }
};

// ---------------- Command codec ----------------

PuckOpcode encodeCommand(PuckCommand cmd);

bool isHandshakeCommand(PuckCommand cmd);

const char* commandName(PuckCommand cmd);

// Event that echoes cmd, UNRECOGNIZED for INITIATE/ACKNOWLEDGE
PuckEventKind confirmationFor(PuckCommand cmd);

// Case-insensitive lookup by name ("volume_up", "SWITCH_AUX", ...)
bool commandFromName(const char* name, PuckCommand& out);

// ---------------- Notification decoder ----------------

// Total: never fails, unknown frames become UNRECOGNIZED
PuckEvent decodeNotification(const uint8_t* data, size_t len);

const char* eventName(PuckEventKind kind);

bool isHandshakeResponse(PuckEventKind kind);

bool isSwitchCompletion(PuckEventKind kind);

// Lower-case hex without separators ("d40501"). Returns chars written.
size_t formatHex(const uint8_t* data, size_t len, char* out, size_t outLen);
