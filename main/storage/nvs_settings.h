#pragma once

// -----------------------------------------------------------
// NVS Settings - persistent storage for the puck controller
// Last connected puck, handshake timeout, button mapping
// -----------------------------------------------------------

#include <string>
#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include "nvs_flash.h"
#include "nvs.h"
#include "esp_log.h"
#include "../config/app_config.h"
#include "../protocol/puck_protocol.h"

// Short / long press command for one button
struct ButtonBinding {
    PuckCommand shortPress;
    PuckCommand longPress;
};

class NVSSettings {
public:
    // Settings structure
    struct Settings {
        std::string deviceName;
        uint8_t puckAddress[6];
        bool hasAddress;
        uint32_t stepTimeoutMs;
        ButtonBinding buttons[PUCK_BUTTON_COUNT];

        Settings()
            : deviceName(PUCK_DEFAULT_DEVICE_NAME)
            , puckAddress{}
            , hasAddress(false)
            , stepTimeoutMs(PUCK_HANDSHAKE_STEP_TIMEOUT_MS)
        {
            buttons[0].shortPress = PuckCommand::VOLUME_UP;
            buttons[0].longPress  = PuckCommand::BASS_UP;
            buttons[1].shortPress = PuckCommand::VOLUME_DOWN;
            buttons[1].longPress  = PuckCommand::BASS_DOWN;
            buttons[2].shortPress = PuckCommand::PLAY_PAUSE;
            buttons[2].longPress  = PuckCommand::NEXT_TRACK;
        }
    };

    NVSSettings() {}

    // Load all settings from NVS (stores internally)
    bool load() {
        return load(m_settings);
    }

    const Settings& get() const { return m_settings; }

    // Load all settings from NVS (explicit struct)
    bool load(Settings &settings) {
        settings = Settings();

        nvs_handle_t h;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &h);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "NVS open failed (%s), using defaults", esp_err_to_name(err));
            return false;
        }

        // Puck name
        char buf[32];
        size_t len = sizeof(buf);
        err = nvs_get_str(h, NVS_KEY_DEVNAME, buf, &len);
        if (err == ESP_OK && len > 1) {
            settings.deviceName.assign(buf, len - 1);
        }

        // Last puck address
        len = sizeof(settings.puckAddress);
        err = nvs_get_blob(h, NVS_KEY_ADDR, settings.puckAddress, &len);
        settings.hasAddress = (err == ESP_OK && len == sizeof(settings.puckAddress));
        if (!settings.hasAddress) {
            memset(settings.puckAddress, 0, sizeof(settings.puckAddress));
        }

        // Handshake step timeout
        uint32_t tmo = 0;
        if (nvs_get_u32(h, NVS_KEY_STEP_TMO, &tmo) == ESP_OK && tmo > 0) {
            settings.stepTimeoutMs = tmo;
        }

        // Button mapping, stored as command names
        for (unsigned i = 0; i < PUCK_BUTTON_COUNT; ++i) {
            loadBinding(h, i, 's', settings.buttons[i].shortPress);
            loadBinding(h, i, 'l', settings.buttons[i].longPress);
        }

        nvs_close(h);

        ESP_LOGI(TAG, "NVS loaded: name='%s', addr=%s, step_tmo=%u ms",
                 settings.deviceName.c_str(),
                 settings.hasAddress ? "stored" : "none",
                 (unsigned)settings.stepTimeoutMs);
        return true;
    }

    // Remember the puck that completed a handshake
    bool savePuckAddress(const uint8_t addr[6]) {
        if (m_settings.hasAddress && memcmp(m_settings.puckAddress, addr, 6) == 0) {
            return true;
        }

        nvs_handle_t h;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READWRITE, &h);
        if (err != ESP_OK) {
            ESP_LOGW(TAG, "NVS open failed: %s", esp_err_to_name(err));
            return false;
        }
        err = nvs_set_blob(h, NVS_KEY_ADDR, addr, 6);
        if (err == ESP_OK) err = nvs_commit(h);
        nvs_close(h);

        if (err != ESP_OK) {
            ESP_LOGW(TAG, "Saving puck address failed: %s", esp_err_to_name(err));
            return false;
        }

        memcpy(m_settings.puckAddress, addr, 6);
        m_settings.hasAddress = true;
        return true;
    }

private:
    static constexpr const char* TAG = "NVS";

    static void loadBinding(nvs_handle_t h, unsigned idx, char kind, PuckCommand &out) {
        char key[16];
        snprintf(key, sizeof(key), NVS_KEY_BTN_FMT, idx + 1, kind);

        char name[24];
        size_t len = sizeof(name);
        if (nvs_get_str(h, key, name, &len) != ESP_OK) return;

        PuckCommand cmd;
        if (!commandFromName(name, cmd) || isHandshakeCommand(cmd)) {
            ESP_LOGW(TAG, "Ignoring button mapping %s='%s'", key, name);
            return;
        }
        out = cmd;
    }

    Settings m_settings;
};
