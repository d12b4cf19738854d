#pragma once

// -----------------------------------------------------------
// Button input - debounced GPIO buttons mapped to puck commands
// Short press / long press per button, active low with pull-up
// -----------------------------------------------------------

#include <stdint.h>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "driver/gpio.h"
#include "esp_timer.h"
#include "esp_log.h"
#include "../config/app_config.h"
#include "../storage/nvs_settings.h"
#include "../app/puck_controller.h"

class ButtonInput {
public:
    ButtonInput(PuckController& controller, const ButtonBinding* bindings)
        : m_controller(controller)
    {
        static const int pins[PUCK_BUTTON_COUNT] = {
            PUCK_BUTTON1_GPIO, PUCK_BUTTON2_GPIO, PUCK_BUTTON3_GPIO
        };
        for (int i = 0; i < PUCK_BUTTON_COUNT; ++i) {
            m_buttons[i].gpio = pins[i];
            m_buttons[i].binding = bindings[i];
            m_buttons[i].lastReading = true;
            m_buttons[i].pressed = false;
            m_buttons[i].lastDebounceMs = 0;
            m_buttons[i].pressStartMs = 0;
        }
    }

    bool start() {
        gpio_config_t io = {};
        io.intr_type = GPIO_INTR_DISABLE;
        io.mode = GPIO_MODE_INPUT;
        io.pin_bit_mask = 0;
        for (int i = 0; i < PUCK_BUTTON_COUNT; ++i) {
            io.pin_bit_mask |= (1ULL << m_buttons[i].gpio);
        }
        io.pull_down_en = GPIO_PULLDOWN_DISABLE;
        io.pull_up_en   = GPIO_PULLUP_ENABLE;
        esp_err_t err = gpio_config(&io);
        if (err != ESP_OK) {
            ESP_LOGE(TAG, "gpio_config failed: %s", esp_err_to_name(err));
            return false;
        }

        for (int i = 0; i < PUCK_BUTTON_COUNT; ++i) {
            ESP_LOGI(TAG, "Button %d (GPIO %d): short=%s long=%s", i + 1, m_buttons[i].gpio,
                     commandName(m_buttons[i].binding.shortPress),
                     commandName(m_buttons[i].binding.longPress));
        }

        BaseType_t ret = xTaskCreate(buttonsTask, "buttons_task", PUCK_BUTTON_TASK_STACK,
                                     this, PUCK_BUTTON_TASK_PRIO, nullptr);
        if (ret != pdPASS) {
            ESP_LOGE(TAG, "Task creation FAILED: buttons=%d", ret);
            return false;
        }
        return true;
    }

private:
    static constexpr const char* TAG = "BTN";

    struct Button {
        int gpio;
        ButtonBinding binding;
        bool lastReading;
        bool pressed;
        uint32_t lastDebounceMs;
        uint32_t pressStartMs;
    };

    static uint32_t millis32() {
        return (uint32_t)(esp_timer_get_time() / 1000ULL);
    }

    static void buttonsTask(void* arg) {
        static_cast<ButtonInput*>(arg)->run();
    }

    void run() {
        ESP_LOGI(TAG, "buttons_task started");
        while (true) {
            uint32_t now = millis32();
            for (int i = 0; i < PUCK_BUTTON_COUNT; ++i) {
                poll(m_buttons[i], now);
            }
            vTaskDelay(pdMS_TO_TICKS(10));
        }
    }

    void poll(Button& b, uint32_t now) {
        bool reading = gpio_get_level((gpio_num_t)b.gpio);
        if (reading != b.lastReading) {
            b.lastDebounceMs = now;
        }
        if ((now - b.lastDebounceMs) > PUCK_BUTTON_DEBOUNCE_MS) {
            if (!b.pressed && reading == 0) {
                b.pressed = true;
                b.pressStartMs = now;
            } else if (b.pressed && reading == 1) {
                b.pressed = false;
                uint32_t pressDuration = now - b.pressStartMs;
                PuckCommand cmd = (pressDuration < PUCK_BUTTON_LONG_PRESS_MS)
                                  ? b.binding.shortPress
                                  : b.binding.longPress;
                ESP_LOGI(TAG, "GPIO %d %s press -> %s", b.gpio,
                         pressDuration < PUCK_BUTTON_LONG_PRESS_MS ? "short" : "long",
                         commandName(cmd));
                m_controller.post(cmd);
            }
        }
        b.lastReading = reading;
    }

    PuckController& m_controller;
    Button m_buttons[PUCK_BUTTON_COUNT];
};
