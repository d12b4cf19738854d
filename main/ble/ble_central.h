#pragma once

// -----------------------------------------------------------
// BLE Central - Bluedroid GAP + GATT client for the Z407 puck
// Scans for the puck, connects, resolves the command/response
// characteristics and enables notifications. Acts as the raw
// PuckTransport; callbacks run in the Bluedroid (BTC) task.
// -----------------------------------------------------------

#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include "freertos/FreeRTOS.h"
#include "esp_bt.h"
#include "esp_bt_main.h"
#include "esp_gap_ble_api.h"
#include "esp_gattc_api.h"
#include "esp_gatt_defs.h"
#include "esp_log.h"
#include "../config/app_config.h"
#include "../protocol/puck_transport.h"

class BleCentral;
static BleCentral* s_centralInstance = nullptr;

class BleCentral : public PuckTransport {
public:
    enum class LinkEvent : uint8_t {
        LINK_UP = 0,        // characteristics resolved, notifications on
        SCAN_TIMEOUT,       // scan window elapsed without a match
        CONNECT_FAILED,     // open failed or link dropped before LINK_UP
        DISCOVERY_FAILED    // puck service/characteristics missing
    };

    using LinkCallback = void(*)(LinkEvent ev, void* arg);

    BleCentral()
        : m_gattcIf(ESP_GATT_IF_NONE)
        , m_connId(0)
        , m_registered(false)
        , m_scanRequested(false)
        , m_scanning(false)
        , m_connecting(false)
        , m_connected(false)
        , m_linked(false)
        , m_scanDurationSec(PUCK_SCAN_DURATION_S)
        , m_dropReason(LinkEvent::CONNECT_FAILED)
        , m_peerType(BLE_ADDR_TYPE_PUBLIC)
        , m_hasTargetAddr(false)
        , m_svcStart(0)
        , m_svcEnd(0)
        , m_serviceFound(false)
        , m_cmdHandle(0)
        , m_respHandle(0)
        , m_cccdHandle(0)
        , m_linkCb(nullptr)
        , m_linkArg(nullptr)
        , m_notifyCb(nullptr)
        , m_notifyArg(nullptr)
        , m_disconnectCb(nullptr)
        , m_disconnectArg(nullptr)
    {
        memset(m_peer, 0, sizeof(m_peer));
        memset(m_targetAddr, 0, sizeof(m_targetAddr));
        memset(m_targetName, 0, sizeof(m_targetName));
        memset(m_uuidCommand, 0, 16);
        memset(m_uuidResponse, 0, 16);
        memset(m_uuidService, 0, 16);
    }

    bool init() {
        s_centralInstance = this;

        uuid128FromString(PUCK_SERVICE_UUID, m_uuidService);
        uuid128FromString(PUCK_CHAR_UUID_COMMAND, m_uuidCommand);
        uuid128FromString(PUCK_CHAR_UUID_RESPONSE, m_uuidResponse);

        // Central only, no classic BT
        ESP_ERROR_CHECK(esp_bt_controller_mem_release(ESP_BT_MODE_CLASSIC_BT));

        esp_bt_controller_config_t bt_cfg = BT_CONTROLLER_INIT_CONFIG_DEFAULT();
        ESP_ERROR_CHECK(esp_bt_controller_init(&bt_cfg));
        ESP_ERROR_CHECK(esp_bt_controller_enable(ESP_BT_MODE_BLE));
        ESP_ERROR_CHECK(esp_bluedroid_init());
        ESP_ERROR_CHECK(esp_bluedroid_enable());

        ESP_ERROR_CHECK(esp_ble_gap_register_callback(gapEventHandler));
        ESP_ERROR_CHECK(esp_ble_gattc_register_callback(gattcEventHandler));
        ESP_ERROR_CHECK(esp_ble_gattc_app_register(GATTC_APP_ID));

        ESP_LOGI(TAG, "BLE central initialized");
        return true;
    }

    // Match by advertised name, or by address when one is known
    void setTarget(const char* name, const uint8_t* addr) {
        strncpy(m_targetName, name ? name : "", sizeof(m_targetName) - 1);
        m_targetName[sizeof(m_targetName) - 1] = '\0';
        m_hasTargetAddr = (addr != nullptr);
        if (addr) memcpy(m_targetAddr, addr, 6);
    }

    void setLinkCallback(LinkCallback cb, void* arg) {
        m_linkCb = cb;
        m_linkArg = arg;
    }

    bool startScan(uint32_t durationSec) {
        if (m_connected || m_connecting) {
            ESP_LOGW(TAG, "Scan requested while connected");
            return false;
        }
        m_scanDurationSec = durationSec;
        m_scanRequested = true;

        // GATTC registration still pending, REG_EVT starts the scan
        if (!m_registered) return true;
        return beginScan();
    }

    bool disconnect() {
        if (!m_connected) return false;
        esp_err_t err = esp_ble_gattc_close(m_gattcIf, m_connId);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "gattc_close failed: %s", esp_err_to_name(err));
            return false;
        }
        return true;
    }

    bool isLinked() const { return m_linked; }

    void getPeerAddress(uint8_t out[6]) const {
        memcpy(out, m_peer, 6);
    }

    static void formatAddress(const uint8_t addr[6], char out[18]) {
        snprintf(out, 18, "%02x:%02x:%02x:%02x:%02x:%02x",
                 addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
    }

    // ---------------- PuckTransport ----------------

    bool write(const uint8_t* data, size_t len) override {
        if (!m_linked || m_cmdHandle == 0) return false;

        esp_err_t err = esp_ble_gattc_write_char(m_gattcIf, m_connId, m_cmdHandle,
                                                 (uint16_t)len, const_cast<uint8_t*>(data),
                                                 ESP_GATT_WRITE_TYPE_RSP, ESP_GATT_AUTH_REQ_NONE);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Command write failed: %s", esp_err_to_name(err));
            return false;
        }
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

private:
    static constexpr const char* TAG = "BLE_C";
    static constexpr uint16_t GATTC_APP_ID = 0;

    // UUID parsing helper, output little-endian
    static void uuid128FromString(const char* str, uint8_t* out) {
        uint8_t temp[16];
        memset(temp, 0, 16);
        int idx = 0;
        for (int i = 0; str[i] && idx < 32; i++) {
            char c = str[i];
            if (c == '-') continue;
            int val = 0;
            if (c >= '0' && c <= '9') val = c - '0';
            else if (c >= 'a' && c <= 'f') val = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') val = c - 'A' + 10;
            else continue;

            if ((idx & 1) == 0) {
                temp[idx >> 1] = (uint8_t)(val << 4);
            } else {
                temp[idx >> 1] |= (uint8_t)val;
            }
            idx++;
        }
        for (int i = 0; i < 16; i++) {
            out[i] = temp[15 - i];
        }
    }

    bool isPuckService(const esp_bt_uuid_t& uuid) const {
        if (uuid.len == ESP_UUID_LEN_16) return uuid.uuid.uuid16 == PUCK_SERVICE_UUID16;
        if (uuid.len == ESP_UUID_LEN_128) return memcmp(uuid.uuid.uuid128, m_uuidService, 16) == 0;
        return false;
    }

    // Static callback wrappers
    static void gapEventHandler(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t* param) {
        if (s_centralInstance) s_centralInstance->handleGapEvent(event, param);
    }

    static void gattcEventHandler(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if,
                                  esp_ble_gattc_cb_param_t* param) {
        if (s_centralInstance) s_centralInstance->handleGattcEvent(event, gattc_if, param);
    }

    void reportLink(LinkEvent ev) {
        if (m_linkCb) m_linkCb(ev, m_linkArg);
    }

    // ---------------- Scanning ----------------

    bool beginScan() {
        esp_ble_scan_params_t params = {};
        params.scan_type = BLE_SCAN_TYPE_ACTIVE;
        params.own_addr_type = BLE_ADDR_TYPE_PUBLIC;
        params.scan_filter_policy = BLE_SCAN_FILTER_ALLOW_ALL;
        params.scan_interval = 0x50;
        params.scan_window = 0x30;
        params.scan_duplicate = BLE_SCAN_DUPLICATE_DISABLE;

        esp_err_t err = esp_ble_gap_set_scan_params(&params);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "set_scan_params failed: %s", esp_err_to_name(err));
            m_scanRequested = false;
            return false;
        }
        return true;
    }

    bool matchesTarget(esp_ble_gap_cb_param_t::ble_scan_result_evt_param& r) const {
        if (m_hasTargetAddr && memcmp(r.bda, m_targetAddr, 6) == 0) return true;
        if (!m_targetName[0]) return false;

        uint8_t nameLen = 0;
        uint8_t* name = esp_ble_resolve_adv_data(r.ble_adv, ESP_BLE_AD_TYPE_NAME_CMPL, &nameLen);
        if (!name) {
            name = esp_ble_resolve_adv_data(r.ble_adv, ESP_BLE_AD_TYPE_NAME_SHORT, &nameLen);
        }
        if (!name || nameLen == 0) return false;

        size_t want = strlen(m_targetName);
        return nameLen == want && memcmp(name, m_targetName, want) == 0;
    }

    void handleGapEvent(esp_gap_ble_cb_event_t event, esp_ble_gap_cb_param_t* param) {
        switch (event) {
        case ESP_GAP_BLE_SCAN_PARAM_SET_COMPLETE_EVT:
            if (param->scan_param_cmpl.status != ESP_BT_STATUS_SUCCESS) {
                ESP_LOGE(TAG, "Scan params rejected: 0x%x", param->scan_param_cmpl.status);
                m_scanRequested = false;
                reportLink(LinkEvent::SCAN_TIMEOUT);
                break;
            }
            if (m_scanRequested) {
                esp_err_t err = esp_ble_gap_start_scanning(m_scanDurationSec);
                if (err != ESP_OK) {
                    ESP_LOGE(TAG, "start_scanning failed: %s", esp_err_to_name(err));
                    m_scanRequested = false;
                    reportLink(LinkEvent::SCAN_TIMEOUT);
                }
            }
            break;
        case ESP_GAP_BLE_SCAN_START_COMPLETE_EVT:
            if (param->scan_start_cmpl.status != ESP_BT_STATUS_SUCCESS) {
                ESP_LOGE(TAG, "Scan start failed: 0x%x", param->scan_start_cmpl.status);
                m_scanRequested = false;
                reportLink(LinkEvent::SCAN_TIMEOUT);
            } else {
                m_scanning = true;
                ESP_LOGI(TAG, "Scanning for '%s' (%u s)", m_targetName, (unsigned)m_scanDurationSec);
            }
            break;
        case ESP_GAP_BLE_SCAN_RESULT_EVT:
            handleScanResult(param->scan_rst);
            break;
        case ESP_GAP_BLE_SCAN_STOP_COMPLETE_EVT:
            m_scanning = false;
            if (m_connecting) openPeer();
            break;
        default:
            break;
        }
    }

    void handleScanResult(esp_ble_gap_cb_param_t::ble_scan_result_evt_param& r) {
        switch (r.search_evt) {
        case ESP_GAP_SEARCH_INQ_RES_EVT:
            if (!m_scanning || m_connecting || !matchesTarget(r)) break;
            {
                char addr[18];
                formatAddress(r.bda, addr);
                ESP_LOGI(TAG, "Puck found at %s (rssi %d), connecting", addr, r.rssi);
            }
            memcpy(m_peer, r.bda, 6);
            m_peerType = r.ble_addr_type;
            m_connecting = true;
            m_scanRequested = false;
            if (esp_ble_gap_stop_scanning() != ESP_OK) {
                // Not scanning anymore, open right away
                m_scanning = false;
                openPeer();
            }
            break;
        case ESP_GAP_SEARCH_INQ_CMPL_EVT:
            m_scanning = false;
            if (!m_connecting) {
                m_scanRequested = false;
                ESP_LOGW(TAG, "Scan finished, '%s' not found", m_targetName);
                reportLink(LinkEvent::SCAN_TIMEOUT);
            }
            break;
        default:
            break;
        }
    }

    void openPeer() {
        esp_err_t err = esp_ble_gattc_open(m_gattcIf, m_peer, m_peerType, true);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "gattc_open failed: %s", esp_err_to_name(err));
            m_connecting = false;
            reportLink(LinkEvent::CONNECT_FAILED);
        }
    }

    // ---------------- GATT client ----------------

    void handleGattcEvent(esp_gattc_cb_event_t event, esp_gatt_if_t gattc_if,
                          esp_ble_gattc_cb_param_t* param) {
        switch (event) {
        case ESP_GATTC_REG_EVT:
            if (param->reg.status != ESP_GATT_OK) {
                ESP_LOGE(TAG, "GATTC app register failed: %d", param->reg.status);
                break;
            }
            m_gattcIf = gattc_if;
            m_registered = true;
            if (m_scanRequested) beginScan();
            break;
        case ESP_GATTC_OPEN_EVT:
            handleOpen(param);
            break;
        case ESP_GATTC_CFG_MTU_EVT:
            if (param->cfg_mtu.status != ESP_GATT_OK) {
                ESP_LOGW(TAG, "MTU exchange failed: %d", param->cfg_mtu.status);
            }
            searchService();
            break;
        case ESP_GATTC_SEARCH_RES_EVT:
            if (isPuckService(param->search_res.srvc_id.uuid)) {
                m_svcStart = param->search_res.start_handle;
                m_svcEnd = param->search_res.end_handle;
                m_serviceFound = true;
            }
            break;
        case ESP_GATTC_SEARCH_CMPL_EVT:
            handleSearchComplete(param);
            break;
        case ESP_GATTC_REG_FOR_NOTIFY_EVT:
            handleRegForNotify(param);
            break;
        case ESP_GATTC_WRITE_DESCR_EVT:
            if (param->write.status != ESP_GATT_OK) {
                ESP_LOGE(TAG, "CCCD write failed: %d", param->write.status);
                failDiscovery();
                break;
            }
            linkUp();
            break;
        case ESP_GATTC_NOTIFY_EVT:
            if (param->notify.handle == m_respHandle && m_notifyCb) {
                m_notifyCb(param->notify.value, param->notify.value_len, m_notifyArg);
            }
            break;
        case ESP_GATTC_WRITE_CHAR_EVT:
            if (param->write.status != ESP_GATT_OK) {
                ESP_LOGW(TAG, "Command write rejected: %d", param->write.status);
            }
            break;
        case ESP_GATTC_DISCONNECT_EVT:
            handleDisconnect(param);
            break;
        default:
            break;
        }
    }

    void handleOpen(esp_ble_gattc_cb_param_t* param) {
        m_connecting = false;
        if (param->open.status != ESP_GATT_OK) {
            ESP_LOGE(TAG, "Connect failed: %d", param->open.status);
            reportLink(LinkEvent::CONNECT_FAILED);
            return;
        }

        m_connId = param->open.conn_id;
        memcpy(m_peer, param->open.remote_bda, 6);
        m_connected = true;
        m_dropReason = LinkEvent::CONNECT_FAILED;
        m_serviceFound = false;
        m_svcStart = m_svcEnd = 0;
        m_cmdHandle = m_respHandle = m_cccdHandle = 0;

        char addr[18];
        formatAddress(m_peer, addr);
        ESP_LOGI(TAG, "Connected to %s, conn_id=%d", addr, m_connId);

        esp_err_t err = esp_ble_gattc_send_mtu_req(m_gattcIf, m_connId);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "MTU request failed: %s", esp_err_to_name(err));
            searchService();
        }
    }

    void searchService() {
        esp_bt_uuid_t uuid = {};
        uuid.len = ESP_UUID_LEN_16;
        uuid.uuid.uuid16 = PUCK_SERVICE_UUID16;
        esp_err_t err = esp_ble_gattc_search_service(m_gattcIf, m_connId, &uuid);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "Service search failed: %s", esp_err_to_name(err));
            failDiscovery();
        }
    }

    bool findChar(const uint8_t* uuid128, esp_gattc_char_elem_t& out) {
        esp_bt_uuid_t uuid = {};
        uuid.len = ESP_UUID_LEN_128;
        memcpy(uuid.uuid.uuid128, uuid128, 16);

        uint16_t count = 1;
        esp_gatt_status_t st = esp_ble_gattc_get_char_by_uuid(m_gattcIf, m_connId,
                                                             m_svcStart, m_svcEnd,
                                                             uuid, &out, &count);
        return st == ESP_GATT_OK && count > 0;
    }

    void handleSearchComplete(esp_ble_gattc_cb_param_t* param) {
        if (param->search_cmpl.status != ESP_GATT_OK || !m_serviceFound) {
            ESP_LOGE(TAG, "Puck service not found (status %d)", param->search_cmpl.status);
            failDiscovery();
            return;
        }

        esp_gattc_char_elem_t cmdChar = {};
        esp_gattc_char_elem_t respChar = {};
        if (!findChar(m_uuidCommand, cmdChar)) {
            ESP_LOGE(TAG, "Command characteristic not found");
            failDiscovery();
            return;
        }
        if (!findChar(m_uuidResponse, respChar)) {
            ESP_LOGE(TAG, "Response characteristic not found");
            failDiscovery();
            return;
        }
        m_cmdHandle = cmdChar.char_handle;
        m_respHandle = respChar.char_handle;

        // CCCD of the response characteristic
        esp_bt_uuid_t cccdUuid = {};
        cccdUuid.len = ESP_UUID_LEN_16;
        cccdUuid.uuid.uuid16 = ESP_GATT_UUID_CHAR_CLIENT_CONFIG;
        esp_gattc_descr_elem_t descr = {};
        uint16_t count = 1;
        if (esp_ble_gattc_get_descr_by_char_handle(m_gattcIf, m_connId, m_respHandle,
                                                   cccdUuid, &descr, &count) == ESP_GATT_OK && count > 0) {
            m_cccdHandle = descr.handle;
        }

        ESP_LOGI(TAG, "Puck service [%u..%u] cmd=%u resp=%u cccd=%u",
                 m_svcStart, m_svcEnd, m_cmdHandle, m_respHandle, m_cccdHandle);

        esp_err_t err = esp_ble_gattc_register_for_notify(m_gattcIf, m_peer, m_respHandle);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "register_for_notify failed: %s", esp_err_to_name(err));
            failDiscovery();
        }
    }

    void handleRegForNotify(esp_ble_gattc_cb_param_t* param) {
        if (param->reg_for_notify.status != ESP_GATT_OK) {
            ESP_LOGE(TAG, "Notify registration failed: %d", param->reg_for_notify.status);
            failDiscovery();
            return;
        }

        if (m_cccdHandle == 0) {
            ESP_LOGW(TAG, "No CCCD on response characteristic, assuming notifications on");
            linkUp();
            return;
        }

        uint8_t enable[2] = { 0x01, 0x00 };
        esp_err_t err = esp_ble_gattc_write_char_descr(m_gattcIf, m_connId, m_cccdHandle,
                                                       sizeof(enable), enable,
                                                       ESP_GATT_WRITE_TYPE_RSP, ESP_GATT_AUTH_REQ_NONE);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "CCCD write failed: %s", esp_err_to_name(err));
            failDiscovery();
        }
    }

    void linkUp() {
        m_linked = true;
        ESP_LOGI(TAG, "Puck link up");
        reportLink(LinkEvent::LINK_UP);
    }

    // Reported once the link is actually down
    void failDiscovery() {
        m_dropReason = LinkEvent::DISCOVERY_FAILED;
        if (!disconnect()) {
            m_dropReason = LinkEvent::CONNECT_FAILED;
            reportLink(LinkEvent::DISCOVERY_FAILED);
        }
    }

    void handleDisconnect(esp_ble_gattc_cb_param_t* param) {
        bool wasLinked = m_linked;
        m_linked = false;
        m_connected = false;
        m_connecting = false;
        m_cmdHandle = m_respHandle = m_cccdHandle = 0;

        ESP_LOGI(TAG, "Disconnected, reason=0x%x", param->disconnect.reason);

        LinkEvent reason = m_dropReason;
        m_dropReason = LinkEvent::CONNECT_FAILED;
        if (wasLinked) {
            if (m_disconnectCb) m_disconnectCb(m_disconnectArg);
        } else {
            reportLink(reason);
        }
    }

    // GATT interface
    esp_gatt_if_t m_gattcIf;
    uint16_t m_connId;
    volatile bool m_registered;
    volatile bool m_scanRequested;
    volatile bool m_scanning;
    volatile bool m_connecting;
    volatile bool m_connected;
    volatile bool m_linked;
    uint32_t m_scanDurationSec;
    LinkEvent m_dropReason;

    // Peer
    esp_bd_addr_t m_peer;
    esp_ble_addr_type_t m_peerType;
    uint8_t m_targetAddr[6];
    bool m_hasTargetAddr;
    char m_targetName[32];

    // Attribute handles
    uint16_t m_svcStart;
    uint16_t m_svcEnd;
    bool m_serviceFound;
    uint16_t m_cmdHandle;
    uint16_t m_respHandle;
    uint16_t m_cccdHandle;

    // UUIDs (little-endian)
    uint8_t m_uuidService[16];
    uint8_t m_uuidCommand[16];
    uint8_t m_uuidResponse[16];

    // Callbacks
    LinkCallback m_linkCb;
    void* m_linkArg;
    NotifyCallback m_notifyCb;
    void* m_notifyArg;
    DisconnectCallback m_disconnectCb;
    void* m_disconnectArg;
};
