#include "puck_session.h"

const char* sessionErrorString(SessionError err) {
    switch (err) {
        case SessionError::OK:                      return "ok";
        case SessionError::NOT_READY:               return "handshake not complete";
        case SessionError::HANDSHAKE_TIMEOUT:       return "handshake timed out";
        case SessionError::DISCONNECTED:            return "disconnected";
        case SessionError::TRANSPORT_WRITE_FAILURE: return "transport write failed";
        default:                                    return "?";
    }
}

PuckSession::PuckSession(uint32_t stepTimeoutMs)
    : m_transport(nullptr)
    , m_timer(nullptr)
    , m_stepTimeoutMs(stepTimeoutMs)
    , m_generation(0)
    , m_eventCb(nullptr)
    , m_eventArg(nullptr)
    , m_stateCb(nullptr)
    , m_stateArg(nullptr)
{
}

PuckSession::~PuckSession() {
    detach();
}

void PuckSession::onEvent(EventCallback cb, void* arg) {
    m_eventCb = cb;
    m_eventArg = arg;
}

void PuckSession::onStateChange(StateCallback cb, void* arg) {
    m_stateCb = cb;
    m_stateArg = arg;
}

SessionError PuckSession::establishSession(PuckTransport* transport, HandshakeTimer* timer) {
    if (!transport || !timer) return SessionError::DISCONNECTED;

    detach();
    m_handshake.reset();

    m_transport = transport;
    m_timer = timer;
    m_transport->subscribe(notifyThunk, this);
    m_transport->onDisconnect(disconnectThunk, this);

    return apply(m_handshake.start());
}

SessionError PuckSession::sendCommand(PuckCommand cmd) {
    if (!isActive()) return SessionError::DISCONNECTED;

    if (m_handshake.isFailed()) {
        return m_handshake.failure() == HandshakeFailure::TIMEOUT
            ? SessionError::HANDSHAKE_TIMEOUT
            : SessionError::DISCONNECTED;
    }

    if (!m_handshake.isReady() && !isHandshakeCommand(cmd)) {
        return SessionError::NOT_READY;
    }

    return writeCommand(cmd);
}

void PuckSession::onNotification(const uint8_t* data, size_t len) {
    if (!isActive()) return;

    PuckEvent ev = decodeNotification(data, len);

    if (m_handshake.isReady()) {
        if (m_eventCb) m_eventCb(ev, m_eventArg);
        return;
    }

    // A rejected ACKNOWLEDGE write already surfaced as FAILED(write failed)
    (void)apply(m_handshake.onEvent(ev));
}

void PuckSession::onConnectionLost() {
    bool changed = m_handshake.state() != HandshakeState::IDLE;
    detach();
    m_handshake.reset();
    if (changed) reportState();
}

void PuckSession::onTimerExpired(uint32_t generation) {
    if (!isActive() || generation != m_generation) return;
    (void)apply(m_handshake.onTimeout());
}

void PuckSession::close() {
    onConnectionLost();
}

// -----------------------------------------------------------
// Internals
// -----------------------------------------------------------

SessionError PuckSession::apply(const HandshakeStep& step) {
    if (step.cancelTimer && m_timer) {
        m_timer->cancel();
        ++m_generation;
    }

    if (step.changed) reportState();

    // State callback may have closed the session
    if (!isActive()) {
        return (step.send || step.armTimer) ? SessionError::DISCONNECTED : SessionError::OK;
    }

    if (step.send) {
        SessionError err = writeCommand(step.command);
        if (err != SessionError::OK) return err;
    }

    if (step.armTimer) {
        ++m_generation;
        m_timer->start(m_stepTimeoutMs, m_generation);
    }
    return SessionError::OK;
}

SessionError PuckSession::writeCommand(PuckCommand cmd) {
    PuckOpcode op = encodeCommand(cmd);
    if (!m_transport->write(op.bytes, sizeof(op.bytes))) {
        handleWriteFailure();
        return SessionError::TRANSPORT_WRITE_FAILURE;
    }
    return SessionError::OK;
}

// A rejected write means the link is gone. During the handshake this is
// a FAILED(write failed) outcome; once READY the session drops to IDLE.
void PuckSession::handleWriteFailure() {
    if (m_handshake.inProgress()) {
        (void)m_handshake.onWriteFailed();
        detach();
        reportState();
        return;
    }

    detach();
    m_handshake.reset();
    reportState();
}

void PuckSession::detach() {
    if (m_timer) m_timer->cancel();
    ++m_generation;

    if (m_transport) {
        m_transport->subscribe(nullptr, nullptr);
        m_transport->onDisconnect(nullptr, nullptr);
    }
    m_transport = nullptr;
    m_timer = nullptr;
}

void PuckSession::reportState() {
    if (m_stateCb) m_stateCb(m_handshake.state(), m_handshake.failure(), m_stateArg);
}

void PuckSession::notifyThunk(const uint8_t* data, size_t len, void* arg) {
    static_cast<PuckSession*>(arg)->onNotification(data, len);
}

void PuckSession::disconnectThunk(void* arg) {
    static_cast<PuckSession*>(arg)->onConnectionLost();
}
