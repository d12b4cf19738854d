#pragma once

// -----------------------------------------------------------
// esp_timer backed HandshakeTimer
// Expiry runs in the esp_timer task; it only forwards the
// generation so the owner can hand it to its own task.
// -----------------------------------------------------------

#include <stdint.h>
#include "esp_timer.h"
#include "esp_log.h"
#include "../protocol/puck_transport.h"

class EspHandshakeTimer : public HandshakeTimer {
public:
    using ExpiryCallback = void(*)(uint32_t generation, void* arg);

    EspHandshakeTimer()
        : m_timer(nullptr)
        , m_generation(0)
        , m_cb(nullptr)
        , m_arg(nullptr)
    {
    }

    ~EspHandshakeTimer() {
        if (m_timer) {
            esp_timer_stop(m_timer);
            esp_timer_delete(m_timer);
        }
    }

    bool init(ExpiryCallback cb, void* arg) {
        m_cb = cb;
        m_arg = arg;

        esp_timer_create_args_t args = {};
        args.callback = &EspHandshakeTimer::onExpired;
        args.arg = this;
        args.dispatch_method = ESP_TIMER_TASK;
        args.name = "puck_hs";

        esp_err_t err = esp_timer_create(&args, &m_timer);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "esp_timer_create failed: %s", esp_err_to_name(err));
            m_timer = nullptr;
            return false;
        }
        return true;
    }

    void start(uint32_t timeoutMs, uint32_t generation) override {
        if (!m_timer) return;
        esp_timer_stop(m_timer);  // ESP_ERR_INVALID_STATE when not running
        m_generation = generation;
        esp_err_t err = esp_timer_start_once(m_timer, (uint64_t)timeoutMs * 1000ULL);
        if (err != ESP_OK) {
            // Expire now rather than leave the handshake without a deadline
            ESP_LOGE(TAG, "esp_timer_start_once failed: %s", esp_err_to_name(err));
            if (m_cb) m_cb(generation, m_arg);
        }
    }

    void cancel() override {
        if (!m_timer) return;
        esp_timer_stop(m_timer);
    }

private:
    static constexpr const char* TAG = "HS_TMR";

    static void onExpired(void* arg) {
        EspHandshakeTimer* self = static_cast<EspHandshakeTimer*>(arg);
        if (self->m_cb) self->m_cb(self->m_generation, self->m_arg);
    }

    esp_timer_handle_t m_timer;
    volatile uint32_t m_generation;
    ExpiryCallback m_cb;
    void* m_arg;
};
