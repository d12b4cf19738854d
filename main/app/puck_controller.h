#pragma once

// -----------------------------------------------------------
// Puck Controller - owns the session and its task
// BLE (BTC task) and esp_timer callbacks only post messages;
// the "puck_session" task is the one caller of PuckSession.
// Reconnects with a fixed back-off after any link loss.
// -----------------------------------------------------------

#include <stdint.h>
#include <string.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "freertos/queue.h"
#include "freertos/event_groups.h"
#include "esp_log.h"
#include "../config/app_config.h"
#include "../protocol/puck_protocol.h"
#include "../protocol/puck_session.h"
#include "../protocol/source_tracker.h"
#include "../ble/ble_central.h"
#include "../storage/nvs_settings.h"
#include "esp_handshake_timer.h"

class PuckController : public PuckTransport {
public:
    PuckController(BleCentral& ble, NVSSettings& settings)
        : m_ble(ble)
        , m_settings(settings)
        , m_session(PUCK_HANDSHAKE_STEP_TIMEOUT_MS)
        , m_queue(nullptr)
        , m_events(nullptr)
        , m_task(nullptr)
        , m_sessionNotifyCb(nullptr)
        , m_sessionNotifyArg(nullptr)
        , m_sessionDisconnectCb(nullptr)
        , m_sessionDisconnectArg(nullptr)
        , m_rescanPending(false)
        , m_rescanAt(0)
    {
    }

    bool start() {
        const NVSSettings::Settings& cfg = m_settings.get();

        m_queue = xQueueCreate(PUCK_SESSION_QUEUE_LEN, sizeof(Message));
        m_events = xEventGroupCreate();
        if (!m_queue || !m_events) {
            ESP_LOGE(TAG, "Failed to create session queue/event group");
            return false;
        }

        if (!m_timer.init(timerExpired, this)) {
            return false;
        }

        m_session.setStepTimeout(cfg.stepTimeoutMs);
        m_session.onStateChange(sessionStateChanged, this);
        m_session.onEvent(sessionEvent, this);

        m_ble.setTarget(cfg.deviceName.c_str(), cfg.hasAddress ? cfg.puckAddress : nullptr);
        m_ble.setLinkCallback(linkEvent, this);
        m_ble.subscribe(bleNotify, this);
        m_ble.onDisconnect(bleDisconnected, this);

        BaseType_t ret = xTaskCreate(sessionTask, "puck_session", PUCK_SESSION_TASK_STACK,
                                     this, PUCK_SESSION_TASK_PRIO, &m_task);
        if (ret != pdPASS) {
            ESP_LOGE(TAG, "Task creation FAILED: puck_session=%d", ret);
            return false;
        }

        ESP_LOGI(TAG, "Session task started, step timeout %u ms", (unsigned)cfg.stepTimeoutMs);
        return m_ble.startScan(PUCK_SCAN_DURATION_S);
    }

    // Queue a command for the session task. Safe from any task.
    bool post(PuckCommand cmd) {
        if (!m_queue) return false;
        Message msg = {};
        msg.type = MsgType::COMMAND;
        msg.command = cmd;
        if (xQueueSend(m_queue, &msg, 0) != pdTRUE) {
            ESP_LOGW(TAG, "Session queue full, dropping %s", commandName(cmd));
            return false;
        }
        return true;
    }

    // Block until the handshake either completes or fails
    bool waitReady(uint32_t timeoutMs) {
        if (!m_events) return false;
        EventBits_t bits = xEventGroupWaitBits(m_events, READY_BIT | FAILED_BIT,
                                               pdFALSE, pdFALSE, pdMS_TO_TICKS(timeoutMs));
        return (bits & READY_BIT) != 0;
    }

    InputSource currentSource() const { return m_tracker.current(); }

    // ---------------- PuckTransport (session side) ----------------
    // Writes go straight to BLE; callbacks are replayed from the
    // session task so the session never runs in the BTC task.

    bool write(const uint8_t* data, size_t len) override {
        char hex[2 * PUCK_MAX_FRAME + 1];
        formatHex(data, len, hex, sizeof(hex));
        ESP_LOGD(TAG, "TX %s", hex);
        return m_ble.write(data, len);
    }

    void subscribe(NotifyCallback cb, void* arg) override {
        m_sessionNotifyCb = cb;
        m_sessionNotifyArg = arg;
    }

    void onDisconnect(DisconnectCallback cb, void* arg) override {
        m_sessionDisconnectCb = cb;
        m_sessionDisconnectArg = arg;
    }

private:
    static constexpr const char* TAG = "SESSION";
    static constexpr EventBits_t READY_BIT  = BIT0;
    static constexpr EventBits_t FAILED_BIT = BIT1;
    static constexpr size_t MAX_NOTIFY_LEN = 20;   // ATT payload at the default MTU

    enum class MsgType : uint8_t {
        LINK_UP = 0,
        LINK_FAILED,
        NOTIFY,
        DISCONNECTED,
        TIMER,
        COMMAND
    };

    struct Message {
        MsgType type;
        uint8_t data[MAX_NOTIFY_LEN];
        uint8_t len;
        uint32_t generation;
        PuckCommand command;
    };

    // ---------------- Producers (other tasks) ----------------

    void postFrom(const Message& msg) {
        if (xQueueSend(m_queue, &msg, 0) != pdTRUE) {
            ESP_LOGW(TAG, "Session queue full, message %d lost", (int)msg.type);
        }
    }

    static void linkEvent(BleCentral::LinkEvent ev, void* arg) {
        PuckController* self = static_cast<PuckController*>(arg);
        Message msg = {};
        msg.type = (ev == BleCentral::LinkEvent::LINK_UP) ? MsgType::LINK_UP : MsgType::LINK_FAILED;
        msg.generation = (uint32_t)ev;
        self->postFrom(msg);
    }

    static void bleNotify(const uint8_t* data, size_t len, void* arg) {
        PuckController* self = static_cast<PuckController*>(arg);
        Message msg = {};
        msg.type = MsgType::NOTIFY;
        msg.len = (uint8_t)(len < MAX_NOTIFY_LEN ? len : MAX_NOTIFY_LEN);
        if (data && msg.len) memcpy(msg.data, data, msg.len);
        self->postFrom(msg);
    }

    static void bleDisconnected(void* arg) {
        PuckController* self = static_cast<PuckController*>(arg);
        Message msg = {};
        msg.type = MsgType::DISCONNECTED;
        self->postFrom(msg);
    }

    static void timerExpired(uint32_t generation, void* arg) {
        PuckController* self = static_cast<PuckController*>(arg);
        Message msg = {};
        msg.type = MsgType::TIMER;
        msg.generation = generation;
        self->postFrom(msg);
    }

    // ---------------- Session task ----------------

    static void sessionTask(void* arg) {
        static_cast<PuckController*>(arg)->run();
    }

    void run() {
        Message msg;
        while (true) {
            if (xQueueReceive(m_queue, &msg, pdMS_TO_TICKS(100)) == pdTRUE) {
                handle(msg);
            }

            if (m_rescanPending && (int32_t)(xTaskGetTickCount() - m_rescanAt) >= 0) {
                m_rescanPending = false;
                ESP_LOGI(TAG, "Rescanning for puck");
                if (!m_ble.startScan(PUCK_SCAN_DURATION_S)) {
                    scheduleRescan();
                }
            }
        }
    }

    void handle(const Message& msg) {
        switch (msg.type) {
        case MsgType::LINK_UP: {
            xEventGroupClearBits(m_events, READY_BIT | FAILED_BIT);
            m_tracker.reset();
            SessionError err = m_session.establishSession(this, &m_timer);
            if (err != SessionError::OK) {
                ESP_LOGW(TAG, "Handshake start failed: %s", sessionErrorString(err));
            }
            break;
        }
        case MsgType::LINK_FAILED:
            ESP_LOGW(TAG, "Link attempt failed (%u)", (unsigned)msg.generation);
            scheduleRescan();
            break;
        case MsgType::NOTIFY: {
            char hex[2 * MAX_NOTIFY_LEN + 1];
            formatHex(msg.data, msg.len, hex, sizeof(hex));
            ESP_LOGD(TAG, "RX %s", hex);
            if (m_sessionNotifyCb) m_sessionNotifyCb(msg.data, msg.len, m_sessionNotifyArg);
            break;
        }
        case MsgType::DISCONNECTED:
            ESP_LOGW(TAG, "Puck disconnected");
            if (m_sessionDisconnectCb) m_sessionDisconnectCb(m_sessionDisconnectArg);
            m_tracker.reset();
            scheduleRescan();
            break;
        case MsgType::TIMER:
            m_session.onTimerExpired(msg.generation);
            break;
        case MsgType::COMMAND:
            sendCommand(msg.command);
            break;
        }
    }

    void sendCommand(PuckCommand cmd) {
        InputSource src = m_tracker.current();
        if (src == InputSource::AUX &&
            (cmd == PuckCommand::PLAY_PAUSE || cmd == PuckCommand::NEXT_TRACK ||
             cmd == PuckCommand::PREV_TRACK)) {
            ESP_LOGW(TAG, "%s has no effect on the AUX input", commandName(cmd));
        }

        SessionError err = m_session.sendCommand(cmd);
        if (err != SessionError::OK) {
            ESP_LOGW(TAG, "%s not sent: %s", commandName(cmd), sessionErrorString(err));
            return;
        }
        ESP_LOGI(TAG, "Sent %s", commandName(cmd));
    }

    void scheduleRescan() {
        if (m_rescanPending) return;
        m_rescanPending = true;
        m_rescanAt = xTaskGetTickCount() + pdMS_TO_TICKS(PUCK_RECONNECT_DELAY_MS);
    }

    // ---------------- Session callbacks (session task) ----------------

    static void sessionStateChanged(HandshakeState state, HandshakeFailure reason, void* arg) {
        static_cast<PuckController*>(arg)->onState(state, reason);
    }

    void onState(HandshakeState state, HandshakeFailure reason) {
        switch (state) {
        case HandshakeState::READY: {
            ESP_LOGI(TAG, "Handshake complete, puck ready");
            uint8_t addr[6];
            m_ble.getPeerAddress(addr);
            m_settings.savePuckAddress(addr);
            xEventGroupSetBits(m_events, READY_BIT);
            break;
        }
        case HandshakeState::FAILED:
            ESP_LOGE(TAG, "Handshake failed: %s", handshakeFailureName(reason));
            xEventGroupSetBits(m_events, FAILED_BIT);
            dropLink();
            break;
        case HandshakeState::IDLE:
            ESP_LOGI(TAG, "Session closed");
            xEventGroupClearBits(m_events, READY_BIT);
            // Write failure while READY leaves the link half open
            if (m_ble.isLinked()) dropLink();
            break;
        default:
            ESP_LOGI(TAG, "Handshake: %s", handshakeStateName(state));
            break;
        }
    }

    void dropLink() {
        // DISCONNECT_EVT schedules the rescan; without a link do it here
        if (!m_ble.disconnect()) scheduleRescan();
    }

    static void sessionEvent(const PuckEvent& ev, void* arg) {
        static_cast<PuckController*>(arg)->onPuckEvent(ev);
    }

    void onPuckEvent(const PuckEvent& ev) {
        if (ev.is(PuckEventKind::UNRECOGNIZED)) {
            char hex[2 * PUCK_MAX_FRAME + 1];
            formatHex(ev.data, ev.len, hex, sizeof(hex));
            ESP_LOGW(TAG, "Unrecognized notification %s (%u bytes)", hex, (unsigned)ev.rawLen);
            return;
        }

        ESP_LOGI(TAG, "Puck: %s", eventName(ev.kind));
        if (m_tracker.onEvent(ev)) {
            ESP_LOGI(TAG, "Input source: %s", inputSourceName(m_tracker.current()));
        }
    }

    BleCentral& m_ble;
    NVSSettings& m_settings;
    PuckSession m_session;
    SourceTracker m_tracker;
    EspHandshakeTimer m_timer;

    QueueHandle_t m_queue;
    EventGroupHandle_t m_events;
    TaskHandle_t m_task;

    NotifyCallback m_sessionNotifyCb;
    void* m_sessionNotifyArg;
    DisconnectCallback m_sessionDisconnectCb;
    void* m_sessionDisconnectArg;

    bool m_rescanPending;
    TickType_t m_rescanAt;
};
