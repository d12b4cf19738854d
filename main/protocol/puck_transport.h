#pragma once

// -----------------------------------------------------------
// Transport seams consumed by PuckSession
// Implemented by the BLE central on target and by mocks in tests
// -----------------------------------------------------------

#include <stddef.h>
#include <stdint.h>

class PuckTransport {
public:
    // Raw notification from the response characteristic
    using NotifyCallback = void(*)(const uint8_t* data, size_t len, void* arg);
    // Link to the puck is gone
    using DisconnectCallback = void(*)(void* arg);

    virtual ~PuckTransport() {}

    // Write to the command characteristic. false when the link is down.
    virtual bool write(const uint8_t* data, size_t len) = 0;

    // A null callback unsubscribes
    virtual void subscribe(NotifyCallback cb, void* arg) = 0;
    virtual void onDisconnect(DisconnectCallback cb, void* arg) = 0;
};

// One-shot timer for a handshake step. Expiry is reported back to the
// session with the generation passed to start().
class HandshakeTimer {
public:
    virtual ~HandshakeTimer() {}

    // Re-arming replaces any pending expiry
    virtual void start(uint32_t timeoutMs, uint32_t generation) = 0;
    virtual void cancel() = 0;
};
