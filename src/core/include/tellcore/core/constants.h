#pragma once

/**
 * @file constants.h
 * @brief The TELLSTICK_* constants of the Telldus Core C API
 *
 * Values are part of the native ABI and must match telldus-core.h.
 */

namespace tellcore {
namespace constants {

// Device methods
constexpr int TELLSTICK_TURNON = 1;
constexpr int TELLSTICK_TURNOFF = 2;
constexpr int TELLSTICK_BELL = 4;
constexpr int TELLSTICK_TOGGLE = 8;
constexpr int TELLSTICK_DIM = 16;
constexpr int TELLSTICK_LEARN = 32;
constexpr int TELLSTICK_EXECUTE = 64;
constexpr int TELLSTICK_UP = 128;
constexpr int TELLSTICK_DOWN = 256;
constexpr int TELLSTICK_STOP = 512;

// Sensor value types
constexpr int TELLSTICK_TEMPERATURE = 1;
constexpr int TELLSTICK_HUMIDITY = 2;
constexpr int TELLSTICK_RAINRATE = 4;
constexpr int TELLSTICK_RAINTOTAL = 8;
constexpr int TELLSTICK_WINDDIRECTION = 16;
constexpr int TELLSTICK_WINDAVERAGE = 32;
constexpr int TELLSTICK_WINDGUST = 64;

// Error codes
constexpr int TELLSTICK_SUCCESS = 0;
constexpr int TELLSTICK_ERROR_NOT_FOUND = -1;
constexpr int TELLSTICK_ERROR_PERMISSION_DENIED = -2;
constexpr int TELLSTICK_ERROR_DEVICE_NOT_FOUND = -3;
constexpr int TELLSTICK_ERROR_METHOD_NOT_SUPPORTED = -4;
constexpr int TELLSTICK_ERROR_COMMUNICATION = -5;
constexpr int TELLSTICK_ERROR_CONNECTING_SERVICE = -6;
constexpr int TELLSTICK_ERROR_UNKNOWN_RESPONSE = -7;
constexpr int TELLSTICK_ERROR_SYNTAX = -8;
constexpr int TELLSTICK_ERROR_BROKEN_PIPE = -9;
constexpr int TELLSTICK_ERROR_COMMUNICATING_SERVICE = -10;
constexpr int TELLSTICK_ERROR_CONFIG_SYNTAX = -11;
constexpr int TELLSTICK_ERROR_UNKNOWN = -99;

// Device types
constexpr int TELLSTICK_TYPE_DEVICE = 1;
constexpr int TELLSTICK_TYPE_GROUP = 2;
constexpr int TELLSTICK_TYPE_SCENE = 3;

// Controller types
constexpr int TELLSTICK_CONTROLLER_TELLSTICK = 1;
constexpr int TELLSTICK_CONTROLLER_TELLSTICK_DUO = 2;
constexpr int TELLSTICK_CONTROLLER_TELLSTICK_NET = 3;

// Device changes
constexpr int TELLSTICK_DEVICE_ADDED = 1;
constexpr int TELLSTICK_DEVICE_CHANGED = 2;
constexpr int TELLSTICK_DEVICE_REMOVED = 3;
constexpr int TELLSTICK_DEVICE_STATE_CHANGED = 4;

// Change types
constexpr int TELLSTICK_CHANGE_NAME = 1;
constexpr int TELLSTICK_CHANGE_PROTOCOL = 2;
constexpr int TELLSTICK_CHANGE_MODEL = 3;
constexpr int TELLSTICK_CHANGE_METHOD = 4;
constexpr int TELLSTICK_CHANGE_AVAILABLE = 5;
constexpr int TELLSTICK_CHANGE_FIRMWARE = 6;

} // namespace constants
} // namespace tellcore
