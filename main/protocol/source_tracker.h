#pragma once

// -----------------------------------------------------------
// Source Tracker - best-effort guess of the active input
// The puck cannot be queried, so this only reflects events seen
// on this connection. UNKNOWN until an echo or switch event
// arrives, and again after the link drops.
// -----------------------------------------------------------

#include <stdint.h>
#include "puck_protocol.h"

enum class InputSource : uint8_t {
    UNKNOWN = 0,
    BLUETOOTH,
    AUX,
    USB
};

inline const char* inputSourceName(InputSource s) {
    switch (s) {
        case InputSource::BLUETOOTH: return "Bluetooth";
        case InputSource::AUX:       return "AUX";
        case InputSource::USB:       return "USB";
        default:                     return "unknown";
    }
}

class SourceTracker {
public:
    SourceTracker() : m_source(InputSource::UNKNOWN), m_switchCount(0) {}

    InputSource current() const { return m_source; }
    bool isKnown() const { return m_source != InputSource::UNKNOWN; }
    uint32_t switchCount() const { return m_switchCount; }

    void reset() {
        m_source = InputSource::UNKNOWN;
        m_switchCount = 0;
    }

    // Returns true when the tracked source changed.
    // SWITCHED_* only arrives if the source really changed, so its
    // absence after a SWITCH_* echo is not an error.
    bool onEvent(const PuckEvent& ev) {
        InputSource next = m_source;
        switch (ev.kind) {
            case PuckEventKind::SWITCH_BLUETOOTH:
            case PuckEventKind::SWITCHED_BLE:
                next = InputSource::BLUETOOTH;
                break;
            case PuckEventKind::SWITCH_AUX:
            case PuckEventKind::SWITCHED_AUX:
                next = InputSource::AUX;
                break;
            case PuckEventKind::SWITCH_USB:
            case PuckEventKind::SWITCHED_USB:
                next = InputSource::USB;
                break;
            default:
                return false;
        }

        if (next == m_source) return false;
        m_source = next;
        m_switchCount++;
        return true;
    }

private:
    InputSource m_source;
    uint32_t m_switchCount;
};
