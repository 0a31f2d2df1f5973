#pragma once

/**
 * @file native_api.h
 * @brief Function and callback types of the Telldus Core C ABI
 *
 * These mirror telldus-core.h. On Windows every exported function and every
 * callback uses __stdcall.
 */

#ifdef _WIN32
#define TELLCORE_CALLCONV __stdcall
#else
#define TELLCORE_CALLCONV
#endif

namespace tellcore {
namespace native {

extern "C" {

typedef void(TELLCORE_CALLCONV *TDDeviceEvent)(int deviceId, int method,
                                               const char* data,
                                               int callbackId, void* context);
typedef void(TELLCORE_CALLCONV *TDDeviceChangeEvent)(int deviceId,
                                                     int changeEvent,
                                                     int changeType,
                                                     int callbackId,
                                                     void* context);
typedef void(TELLCORE_CALLCONV *TDRawDeviceEvent)(const char* data,
                                                  int controllerId,
                                                  int callbackId,
                                                  void* context);
typedef void(TELLCORE_CALLCONV *TDSensorEvent)(const char* protocol,
                                               const char* model, int id,
                                               int dataType, const char* value,
                                               int timestamp, int callbackId,
                                               void* context);
typedef void(TELLCORE_CALLCONV *TDControllerEvent)(int controllerId,
                                                   int changeEvent,
                                                   int changeType,
                                                   const char* newValue,
                                                   int callbackId,
                                                   void* context);

} // extern "C"

// Lifecycle
using InitFn = void(TELLCORE_CALLCONV *)();
using CloseFn = void(TELLCORE_CALLCONV *)();
using ReleaseStringFn = void(TELLCORE_CALLCONV *)(char* string);
using GetErrorStringFn = char* (TELLCORE_CALLCONV *)(int errorNo);

// Callbacks
using RegisterDeviceEventFn = int(TELLCORE_CALLCONV *)(TDDeviceEvent, void*);
using RegisterDeviceChangeEventFn = int(TELLCORE_CALLCONV *)(TDDeviceChangeEvent, void*);
using RegisterRawDeviceEventFn = int(TELLCORE_CALLCONV *)(TDRawDeviceEvent, void*);
using RegisterSensorEventFn = int(TELLCORE_CALLCONV *)(TDSensorEvent, void*);
using RegisterControllerEventFn = int(TELLCORE_CALLCONV *)(TDControllerEvent, void*);
using UnregisterCallbackFn = int(TELLCORE_CALLCONV *)(int callbackId);

// Device control
using DeviceCommandFn = int(TELLCORE_CALLCONV *)(int deviceId);
using DimFn = int(TELLCORE_CALLCONV *)(int deviceId, unsigned char level);
using MethodsFn = int(TELLCORE_CALLCONV *)(int deviceId, int methodsSupported);
using DeviceStringFn = char* (TELLCORE_CALLCONV *)(int deviceId);

// Device enumeration and configuration
using CountFn = int(TELLCORE_CALLCONV *)();
using IndexFn = int(TELLCORE_CALLCONV *)(int index);
using SetDeviceStringFn = bool(TELLCORE_CALLCONV *)(int deviceId, const char* value);
using GetDeviceParameterFn = char* (TELLCORE_CALLCONV *)(int deviceId,
                                                         const char* name,
                                                         const char* defaultValue);
using SetDeviceParameterFn = bool(TELLCORE_CALLCONV *)(int deviceId,
                                                       const char* name,
                                                       const char* value);
using RemoveDeviceFn = bool(TELLCORE_CALLCONV *)(int deviceId);

// Raw commands and controllers
using SendRawCommandFn = int(TELLCORE_CALLCONV *)(const char* command, int reserved);
using ControllerConnectionFn = void(TELLCORE_CALLCONV *)(int vid, int pid,
                                                          const char* serial);

// Sensors
using SensorFn = int(TELLCORE_CALLCONV *)(char* protocol, int protocolLen,
                                          char* model, int modelLen, int* id,
                                          int* dataTypes);
using SensorValueFn = int(TELLCORE_CALLCONV *)(const char* protocol,
                                               const char* model, int id,
                                               int dataType, char* value,
                                               int len, int* timestamp);

// Controllers
using ControllerFn = int(TELLCORE_CALLCONV *)(int* controllerId,
                                              int* controllerType, char* name,
                                              int nameLen, int* available);
using ControllerValueFn = int(TELLCORE_CALLCONV *)(int controllerId,
                                                   const char* name,
                                                   char* value, int valueLen);
using SetControllerValueFn = int(TELLCORE_CALLCONV *)(int controllerId,
                                                      const char* name,
                                                      const char* value);
using RemoveControllerFn = int(TELLCORE_CALLCONV *)(int controllerId);

} // namespace native
} // namespace tellcore
