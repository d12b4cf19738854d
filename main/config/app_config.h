#pragma once

// -----------------------------------------------------------
// Configuration header - firmware defaults
// Any CONFIG_PUCK_* entry present in sdkconfig takes precedence
// -----------------------------------------------------------

#include "sdkconfig.h"

// Puck identity (GATT layout of the Logitech Z407 control puck)
#ifdef CONFIG_PUCK_DEVICE_NAME
#define PUCK_DEFAULT_DEVICE_NAME    CONFIG_PUCK_DEVICE_NAME
#else
#define PUCK_DEFAULT_DEVICE_NAME    "Logitech Z407"
#endif

#define PUCK_SERVICE_UUID16         0xFDC2
#define PUCK_SERVICE_UUID           "0000fdc2-0000-1000-8000-00805f9b34fb"
#define PUCK_CHAR_UUID_COMMAND      "c2e758b9-0e78-41e0-b0cb-98a593193fc5"
#define PUCK_CHAR_UUID_RESPONSE     "b84ac9c6-29c5-46d4-bba1-9d534784330f"

// Handshake
#ifdef CONFIG_PUCK_HANDSHAKE_STEP_TIMEOUT_MS
#define PUCK_HANDSHAKE_STEP_TIMEOUT_MS CONFIG_PUCK_HANDSHAKE_STEP_TIMEOUT_MS
#else
#define PUCK_HANDSHAKE_STEP_TIMEOUT_MS 2000
#endif

// Scan / reconnect
#ifdef CONFIG_PUCK_SCAN_DURATION_S
#define PUCK_SCAN_DURATION_S        CONFIG_PUCK_SCAN_DURATION_S
#else
#define PUCK_SCAN_DURATION_S        10
#endif

#ifdef CONFIG_PUCK_RECONNECT_DELAY_MS
#define PUCK_RECONNECT_DELAY_MS     CONFIG_PUCK_RECONNECT_DELAY_MS
#else
#define PUCK_RECONNECT_DELAY_MS     3000
#endif

#define PUCK_READY_WAIT_MS          30000

// GPIO Configuration (active low, internal pull-up)
#ifdef CONFIG_PUCK_BUTTON1_GPIO
#define PUCK_BUTTON1_GPIO           CONFIG_PUCK_BUTTON1_GPIO
#define PUCK_BUTTON2_GPIO           CONFIG_PUCK_BUTTON2_GPIO
#define PUCK_BUTTON3_GPIO           CONFIG_PUCK_BUTTON3_GPIO
#else
#define PUCK_BUTTON1_GPIO           18
#define PUCK_BUTTON2_GPIO           21
#define PUCK_BUTTON3_GPIO           19
#endif

#define PUCK_BUTTON_COUNT           3
#define PUCK_BUTTON_DEBOUNCE_MS     25
#define PUCK_BUTTON_LONG_PRESS_MS   1000

// Tasks
#define PUCK_SESSION_TASK_STACK     4096
#define PUCK_SESSION_TASK_PRIO      6
#define PUCK_SESSION_QUEUE_LEN      16
#define PUCK_BUTTON_TASK_STACK      2048
#define PUCK_BUTTON_TASK_PRIO       5

// NVS Keys (not configurable, internal constants)
#define NVS_NAMESPACE               "puck"
#define NVS_KEY_DEVNAME             "devname"
#define NVS_KEY_ADDR                "addr"
#define NVS_KEY_STEP_TMO            "step_tmo"
#define NVS_KEY_BTN_FMT             "btn%u_%c"   // btn1_s / btn1_l

// Firmware version
#define PUCK_FIRMWARE_VERSION       "1.0.0"
