#pragma once

// -----------------------------------------------------------
// Test doubles for the session seams
// MockTransport records writes and lets a test inject
// notifications and link loss; ManualTimer is fired by hand.
// -----------------------------------------------------------

#include <stdint.h>
#include <stddef.h>
#include <initializer_list>
#include <vector>
#include "protocol/puck_transport.h"

class MockTransport : public PuckTransport {
public:
    MockTransport()
        : failWrites(false)
        , m_notifyCb(nullptr)
        , m_notifyArg(nullptr)
        , m_disconnectCb(nullptr)
        , m_disconnectArg(nullptr)
    {}

    bool write(const uint8_t* data, size_t len) override {
        if (failWrites) return false;
        writes.push_back(std::vector<uint8_t>(data, data + len));
        return true;
    }

    void subscribe(NotifyCallback cb, void* arg) override {
        m_notifyCb = cb;
        m_notifyArg = arg;
    }

    void onDisconnect(DisconnectCallback cb, void* arg) override {
        m_disconnectCb = cb;
        m_disconnectArg = arg;
    }

    // Puck -> session
    void deliver(std::initializer_list<uint8_t> bytes) {
        std::vector<uint8_t> v(bytes);
        if (m_notifyCb) m_notifyCb(v.data(), v.size(), m_notifyArg);
    }

    void dropLink() {
        if (m_disconnectCb) m_disconnectCb(m_disconnectArg);
    }

    bool subscribed() const { return m_notifyCb != nullptr; }

    std::vector<uint8_t> lastWrite() const {
        return writes.empty() ? std::vector<uint8_t>() : writes.back();
    }

    std::vector<std::vector<uint8_t>> writes;
    bool failWrites;

private:
    NotifyCallback m_notifyCb;
    void* m_notifyArg;
    DisconnectCallback m_disconnectCb;
    void* m_disconnectArg;
};

class ManualTimer : public HandshakeTimer {
public:
    ManualTimer() : running(false), timeoutMs(0), generation(0), starts(0), cancels(0) {}

    void start(uint32_t ms, uint32_t gen) override {
        running = true;
        timeoutMs = ms;
        generation = gen;
        starts++;
    }

    void cancel() override {
        running = false;
        cancels++;
    }

    bool running;
    uint32_t timeoutMs;
    uint32_t generation;
    int starts;
    int cancels;
};
