#include "puck_protocol.h"

#include <string.h>
#include <strings.h>

// -----------------------------------------------------------
// Command table, indexed by PuckCommand
// -----------------------------------------------------------

struct CommandEntry {
    PuckCommand   cmd;
    PuckOpcode    opcode;
    const char*   name;
    PuckEventKind confirmation;
};

static const CommandEntry kCommandTable[PUCK_COMMAND_COUNT] = {
    { PuckCommand::INITIATE,         {{0x84, 0x05}}, "INITIATE",         PuckEventKind::UNRECOGNIZED },
    { PuckCommand::ACKNOWLEDGE,      {{0x84, 0x00}}, "ACKNOWLEDGE",      PuckEventKind::UNRECOGNIZED },
    { PuckCommand::VOLUME_UP,        {{0x80, 0x02}}, "VOLUME_UP",        PuckEventKind::VOLUME_UP },
    { PuckCommand::VOLUME_DOWN,      {{0x80, 0x03}}, "VOLUME_DOWN",      PuckEventKind::VOLUME_DOWN },
    { PuckCommand::BASS_UP,          {{0x80, 0x00}}, "BASS_UP",          PuckEventKind::BASS_UP },
    { PuckCommand::BASS_DOWN,        {{0x80, 0x01}}, "BASS_DOWN",        PuckEventKind::BASS_DOWN },
    { PuckCommand::PLAY_PAUSE,       {{0x80, 0x04}}, "PLAY_PAUSE",       PuckEventKind::PLAY_PAUSE },
    { PuckCommand::NEXT_TRACK,       {{0x80, 0x05}}, "NEXT_TRACK",       PuckEventKind::NEXT_TRACK },
    { PuckCommand::PREV_TRACK,       {{0x80, 0x06}}, "PREV_TRACK",       PuckEventKind::PREV_TRACK },
    { PuckCommand::SWITCH_BLUETOOTH, {{0x81, 0x01}}, "SWITCH_BLUETOOTH", PuckEventKind::SWITCH_BLUETOOTH },
    { PuckCommand::SWITCH_AUX,       {{0x81, 0x02}}, "SWITCH_AUX",       PuckEventKind::SWITCH_AUX },
    { PuckCommand::SWITCH_USB,       {{0x81, 0x03}}, "SWITCH_USB",       PuckEventKind::SWITCH_USB },
    { PuckCommand::SOUND_1,          {{0x85, 0x01}}, "SOUND_1",          PuckEventKind::SOUND_1 },
    { PuckCommand::SOUND_2,          {{0x85, 0x02}}, "SOUND_2",          PuckEventKind::SOUND_2 },
    { PuckCommand::SOUND_3,          {{0x85, 0x03}}, "SOUND_3",          PuckEventKind::SOUND_3 },
    { PuckCommand::PAIRING,          {{0x82, 0x00}}, "PAIRING",          PuckEventKind::PAIRING },
    { PuckCommand::FACTORY_RESET,    {{0x83, 0x00}}, "FACTORY_RESET",    PuckEventKind::FACTORY_RESET },
    { PuckCommand::UNKNOWN_1,        {{0x85, 0x00}}, "UNKNOWN_1",        PuckEventKind::UNKNOWN_1 },
};

// -----------------------------------------------------------
// Notification signatures
// Note the c5 group: the puck echoes SOUND_1 as c503 and SOUND_3
// as c501, the reverse of the command opcodes.
// -----------------------------------------------------------

struct EventEntry {
    uint8_t       sig[3];
    uint8_t       len;
    PuckEventKind kind;
};

static const EventEntry kEventTable[] = {
    { {0xd4, 0x05, 0x01}, 3, PuckEventKind::INITIATE_RESPONSE },
    { {0xd4, 0x00, 0x01}, 3, PuckEventKind::ACKNOWLEDGE_RESPONSE },
    { {0xd4, 0x00, 0x03}, 3, PuckEventKind::CONNECTED },

    { {0xc0, 0x00}, 2, PuckEventKind::BASS_UP },
    { {0xc0, 0x01}, 2, PuckEventKind::BASS_DOWN },
    { {0xc0, 0x02}, 2, PuckEventKind::VOLUME_UP },
    { {0xc0, 0x03}, 2, PuckEventKind::VOLUME_DOWN },
    { {0xc0, 0x04}, 2, PuckEventKind::PLAY_PAUSE },
    { {0xc0, 0x05}, 2, PuckEventKind::NEXT_TRACK },
    { {0xc0, 0x06}, 2, PuckEventKind::PREV_TRACK },

    { {0xc1, 0x01}, 2, PuckEventKind::SWITCH_BLUETOOTH },
    { {0xc1, 0x02}, 2, PuckEventKind::SWITCH_AUX },
    { {0xc1, 0x03}, 2, PuckEventKind::SWITCH_USB },

    { {0xc2, 0x00}, 2, PuckEventKind::PAIRING },
    { {0xc3, 0x00}, 2, PuckEventKind::FACTORY_RESET },

    { {0xc5, 0x00}, 2, PuckEventKind::UNKNOWN_1 },
    { {0xc5, 0x01}, 2, PuckEventKind::SOUND_3 },
    { {0xc5, 0x02}, 2, PuckEventKind::SOUND_2 },
    { {0xc5, 0x03}, 2, PuckEventKind::SOUND_1 },

    { {0xcf, 0x04}, 2, PuckEventKind::SWITCHED_BLE },
    { {0xcf, 0x05}, 2, PuckEventKind::SWITCHED_AUX },
    { {0xcf, 0x06}, 2, PuckEventKind::SWITCHED_USB },
};

static const char* const kEventNames[static_cast<size_t>(PuckEventKind::COUNT)] = {
    "INITIATE_RESPONSE",
    "ACKNOWLEDGE_RESPONSE",
    "CONNECTED",
    "VOLUME_UP",
    "VOLUME_DOWN",
    "BASS_UP",
    "BASS_DOWN",
    "PLAY_PAUSE",
    "NEXT_TRACK",
    "PREV_TRACK",
    "SWITCH_BLUETOOTH",
    "SWITCH_AUX",
    "SWITCH_USB",
    "SOUND_1",
    "SOUND_2",
    "SOUND_3",
    "PAIRING",
    "FACTORY_RESET",
    "UNKNOWN_1",
    "SWITCHED_BLE",
    "SWITCHED_AUX",
    "SWITCHED_USB",
    "UNRECOGNIZED",
};

static inline size_t commandIndex(PuckCommand cmd) {
    return static_cast<size_t>(cmd);
}

// -----------------------------------------------------------
// Command codec
// -----------------------------------------------------------

PuckOpcode encodeCommand(PuckCommand cmd) {
    size_t idx = commandIndex(cmd);
    if (idx >= PUCK_COMMAND_COUNT) {
        // Only reachable through a cast from an out-of-range integer
        PuckOpcode none = {{0x00, 0x00}};
        return none;
    }
    return kCommandTable[idx].opcode;
}

bool isHandshakeCommand(PuckCommand cmd) {
    return cmd == PuckCommand::INITIATE || cmd == PuckCommand::ACKNOWLEDGE;
}

const char* commandName(PuckCommand cmd) {
    size_t idx = commandIndex(cmd);
    if (idx >= PUCK_COMMAND_COUNT) return "?";
    return kCommandTable[idx].name;
}

PuckEventKind confirmationFor(PuckCommand cmd) {
    size_t idx = commandIndex(cmd);
    if (idx >= PUCK_COMMAND_COUNT) return PuckEventKind::UNRECOGNIZED;
    return kCommandTable[idx].confirmation;
}

bool commandFromName(const char* name, PuckCommand& out) {
    if (!name || !name[0]) return false;
    for (size_t i = 0; i < PUCK_COMMAND_COUNT; ++i) {
        if (strcasecmp(name, kCommandTable[i].name) == 0) {
            out = kCommandTable[i].cmd;
            return true;
        }
    }
    return false;
}

// -----------------------------------------------------------
// Notification decoder
// -----------------------------------------------------------

PuckEvent decodeNotification(const uint8_t* data, size_t len) {
    PuckEvent ev;
    ev.kind = PuckEventKind::UNRECOGNIZED;
    ev.rawLen = data ? len : 0;
    ev.len = (uint8_t)(ev.rawLen < PUCK_MAX_FRAME ? ev.rawLen : PUCK_MAX_FRAME);
    if (ev.len > 0) {
        memcpy(ev.data, data, ev.len);
    }

    if (ev.rawLen < 2 || ev.rawLen > 3) return ev;

    for (size_t i = 0; i < sizeof(kEventTable) / sizeof(kEventTable[0]); ++i) {
        const EventEntry& e = kEventTable[i];
        if (e.len != ev.rawLen) continue;
        if (memcmp(e.sig, data, e.len) == 0) {
            ev.kind = e.kind;
            break;
        }
    }
    return ev;
}

const char* eventName(PuckEventKind kind) {
    size_t idx = static_cast<size_t>(kind);
    if (idx >= static_cast<size_t>(PuckEventKind::COUNT)) return "?";
    return kEventNames[idx];
}

bool isHandshakeResponse(PuckEventKind kind) {
    return kind == PuckEventKind::INITIATE_RESPONSE ||
           kind == PuckEventKind::ACKNOWLEDGE_RESPONSE ||
           kind == PuckEventKind::CONNECTED;
}

bool isSwitchCompletion(PuckEventKind kind) {
    return kind == PuckEventKind::SWITCHED_BLE ||
           kind == PuckEventKind::SWITCHED_AUX ||
           kind == PuckEventKind::SWITCHED_USB;
}

size_t formatHex(const uint8_t* data, size_t len, char* out, size_t outLen) {
    static const char kDigits[] = "0123456789abcdef";
    if (!out || outLen == 0) return 0;

    size_t pos = 0;
    for (size_t i = 0; data && i < len && pos + 2 < outLen; ++i) {
        out[pos++] = kDigits[(data[i] >> 4) & 0x0F];
        out[pos++] = kDigits[data[i] & 0x0F];
    }
    out[pos] = '\0';
    return pos;
}
