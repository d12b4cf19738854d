#include <stdint.h>
#include <string.h>

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "esp_system.h"
#include "esp_log.h"
#include "esp_err.h"

#include "nvs_flash.h"

#include "config/app_config.h"
#include "storage/nvs_settings.h"
#include "ble/ble_central.h"
#include "app/puck_controller.h"
#include "input/buttons.h"

// -----------------------------------------------------------
// General config
// -----------------------------------------------------------

static const char *TAG = "PUCK";

static NVSSettings    g_settings;
static BleCentral     g_ble;
static PuckController g_controller(g_ble, g_settings);

// -----------------------------------------------------------
// app_main
// -----------------------------------------------------------

extern "C" void app_main(void) {
    // NVS
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES || ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        ESP_ERROR_CHECK(nvs_flash_init());
    }

    ESP_LOGI(TAG, "Booting Z407 puck remote v%s (ESP-IDF + BLE central)...", PUCK_FIRMWARE_VERSION);

    // Load settings
    g_settings.load();
    const NVSSettings::Settings& cfg = g_settings.get();
    if (cfg.hasAddress) {
        char addr[18];
        BleCentral::formatAddress(cfg.puckAddress, addr);
        ESP_LOGI(TAG, "Last puck: %s", addr);
    }

    // Bluetooth (controller + GATT client)
    g_ble.init();

    if (!g_controller.start()) {
        ESP_LOGE(TAG, "Session controller failed to start");
        return;
    }

    static ButtonInput buttons(g_controller, cfg.buttons);
    if (!buttons.start()) {
        ESP_LOGE(TAG, "Button input failed to start");
    }

    ESP_LOGI(TAG, "Looking for '%s'", cfg.deviceName.c_str());

    if (g_controller.waitReady(PUCK_READY_WAIT_MS)) {
        ESP_LOGI(TAG, "System ready: puck connected, buttons active");
    } else {
        ESP_LOGW(TAG, "Puck not ready after %u ms, still retrying in background",
                 (unsigned)PUCK_READY_WAIT_MS);
    }
}
