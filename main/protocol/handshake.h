#pragma once

// -----------------------------------------------------------
// Handshake Coordinator - connect-time exchange with the puck
//   INITIATE    -> d4 05 01
//   ACKNOWLEDGE -> d4 00 01
//               -> d4 00 03 (connected)
// Pure state machine: returns the action to perform, the owner
// (PuckSession) does the writes and arms the timer.
// -----------------------------------------------------------

#include <stdint.h>
#include "puck_protocol.h"

enum class HandshakeState : uint8_t {
    IDLE = 0,
    AWAITING_INITIATE_ACK,
    AWAITING_ACKNOWLEDGE_ACK,
    AWAITING_CONNECTED,
    READY,
    FAILED
};

enum class HandshakeFailure : uint8_t {
    NONE = 0,
    TIMEOUT,
    WRITE_FAILED
};

// What the owner has to do after feeding the coordinator
struct HandshakeStep {
    bool        changed;       // state transitioned
    bool        send;          // write command
    PuckCommand command;
    bool        armTimer;      // (re)arm the per-step timer
    bool        cancelTimer;

    HandshakeStep()
        : changed(false)
        , send(false)
        , command(PuckCommand::INITIATE)
        , armTimer(false)
        , cancelTimer(false)
    {}
};

inline const char* handshakeStateName(HandshakeState s) {
    switch (s) {
        case HandshakeState::IDLE:                     return "IDLE";
        case HandshakeState::AWAITING_INITIATE_ACK:    return "AWAITING_INITIATE_ACK";
        case HandshakeState::AWAITING_ACKNOWLEDGE_ACK: return "AWAITING_ACKNOWLEDGE_ACK";
        case HandshakeState::AWAITING_CONNECTED:       return "AWAITING_CONNECTED";
        case HandshakeState::READY:                    return "READY";
        case HandshakeState::FAILED:                   return "FAILED";
        default:                                       return "?";
    }
}

inline const char* handshakeFailureName(HandshakeFailure f) {
    switch (f) {
        case HandshakeFailure::NONE:         return "none";
        case HandshakeFailure::TIMEOUT:      return "timeout";
        case HandshakeFailure::WRITE_FAILED: return "write failed";
        default:                             return "?";
    }
}

class HandshakeCoordinator {
public:
    HandshakeCoordinator()
        : m_state(HandshakeState::IDLE)
        , m_failure(HandshakeFailure::NONE)
    {}

    HandshakeState state() const { return m_state; }
    HandshakeFailure failure() const { return m_failure; }
    bool isReady() const { return m_state == HandshakeState::READY; }
    bool isFailed() const { return m_state == HandshakeState::FAILED; }

    // In progress = started and not yet READY/FAILED
    bool inProgress() const {
        return m_state == HandshakeState::AWAITING_INITIATE_ACK ||
               m_state == HandshakeState::AWAITING_ACKNOWLEDGE_ACK ||
               m_state == HandshakeState::AWAITING_CONNECTED;
    }

    void reset() {
        m_state = HandshakeState::IDLE;
        m_failure = HandshakeFailure::NONE;
    }

    // IDLE -> AWAITING_INITIATE_ACK, INITIATE goes out on entry
    HandshakeStep start() {
        HandshakeStep step;
        if (m_state != HandshakeState::IDLE) return step;

        m_state = HandshakeState::AWAITING_INITIATE_ACK;
        step.changed = true;
        step.send = true;
        step.command = PuckCommand::INITIATE;
        step.armTimer = true;
        return step;
    }

    // Anything but the expected response is ignored; the puck may still
    // be flushing confirmations from a previous connection.
    HandshakeStep onEvent(const PuckEvent& ev) {
        HandshakeStep step;
        switch (m_state) {
            case HandshakeState::AWAITING_INITIATE_ACK:
                if (ev.kind == PuckEventKind::INITIATE_RESPONSE) {
                    m_state = HandshakeState::AWAITING_ACKNOWLEDGE_ACK;
                    step.changed = true;
                    step.send = true;
                    step.command = PuckCommand::ACKNOWLEDGE;
                    step.armTimer = true;
                }
                break;
            case HandshakeState::AWAITING_ACKNOWLEDGE_ACK:
                if (ev.kind == PuckEventKind::ACKNOWLEDGE_RESPONSE) {
                    m_state = HandshakeState::AWAITING_CONNECTED;
                    step.changed = true;
                    step.armTimer = true;
                }
                break;
            case HandshakeState::AWAITING_CONNECTED:
                if (ev.kind == PuckEventKind::CONNECTED) {
                    m_state = HandshakeState::READY;
                    step.changed = true;
                    step.cancelTimer = true;
                }
                break;
            default:
                break;
        }
        return step;
    }

    HandshakeStep onTimeout() {
        return fail(HandshakeFailure::TIMEOUT);
    }

    HandshakeStep onWriteFailed() {
        return fail(HandshakeFailure::WRITE_FAILED);
    }

private:
    HandshakeStep fail(HandshakeFailure reason) {
        HandshakeStep step;
        if (!inProgress()) return step;
        m_state = HandshakeState::FAILED;
        m_failure = reason;
        step.changed = true;
        step.cancelTimer = true;
        return step;
    }

    HandshakeState m_state;
    HandshakeFailure m_failure;
};
