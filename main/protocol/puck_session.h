#pragma once

// -----------------------------------------------------------
// Session Controller - one connection to one puck
// Gates commands behind the handshake and routes notifications
// to the handshake coordinator or to the event subscriber.
// Not thread safe: every call must come from one task.
// -----------------------------------------------------------

#include <stddef.h>
#include <stdint.h>
#include "puck_protocol.h"
#include "puck_transport.h"
#include "handshake.h"

enum class SessionError : uint8_t {
    OK = 0,
    NOT_READY,                // handshake incomplete, retry after READY
    HANDSHAKE_TIMEOUT,        // terminal, reconnect
    DISCONNECTED,             // terminal, reconnect
    TRANSPORT_WRITE_FAILURE,  // write rejected; session is dropped
};

const char* sessionErrorString(SessionError err);

class PuckSession {
public:
    static constexpr uint32_t DEFAULT_STEP_TIMEOUT_MS = 2000;

    using EventCallback = void(*)(const PuckEvent& ev, void* arg);
    using StateCallback = void(*)(HandshakeState state, HandshakeFailure reason, void* arg);

    explicit PuckSession(uint32_t stepTimeoutMs = DEFAULT_STEP_TIMEOUT_MS);
    ~PuckSession();

    // Subscriber for events received once READY (UNRECOGNIZED included)
    void onEvent(EventCallback cb, void* arg);
    // Every handshake state transition, reported from the call causing it
    void onStateChange(StateCallback cb, void* arg);

    void setStepTimeout(uint32_t ms) { m_stepTimeoutMs = ms; }
    uint32_t stepTimeout() const { return m_stepTimeoutMs; }

    // Bind transport + timer and start the handshake. Any previous
    // session is dropped first. Both are borrowed until the session ends.
    SessionError establishSession(PuckTransport* transport, HandshakeTimer* timer);

    SessionError sendCommand(PuckCommand cmd);

    void onNotification(const uint8_t* data, size_t len);
    void onConnectionLost();
    void onTimerExpired(uint32_t generation);

    // Caller teardown
    void close();

    HandshakeState state() const { return m_handshake.state(); }
    HandshakeFailure failure() const { return m_handshake.failure(); }
    bool isActive() const { return m_transport != nullptr; }
    bool isReady() const { return isActive() && m_handshake.isReady(); }
    uint32_t timerGeneration() const { return m_generation; }

private:
    SessionError apply(const HandshakeStep& step);
    SessionError writeCommand(PuckCommand cmd);
    void handleWriteFailure();
    void detach();
    void reportState();

    static void notifyThunk(const uint8_t* data, size_t len, void* arg);
    static void disconnectThunk(void* arg);

    HandshakeCoordinator m_handshake;
    PuckTransport* m_transport;
    HandshakeTimer* m_timer;
    uint32_t m_stepTimeoutMs;
    uint32_t m_generation;

    EventCallback m_eventCb;
    void* m_eventArg;
    StateCallback m_stateCb;
    void* m_stateArg;
};
