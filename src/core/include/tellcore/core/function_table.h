#pragma once

#include "tellcore/core/errors.h"
#include "tellcore/core/native_api.h"

#include <array>
#include <cstddef>
#include <vector>

namespace tellcore {
namespace core {

class ModuleLoader;

/**
 * @brief Every entry point of the Telldus Core C API known to the binding
 */
enum class FunctionId : std::size_t {
    INIT,
    CLOSE,
    RELEASE_STRING,
    GET_ERROR_STRING,

    REGISTER_DEVICE_EVENT,
    REGISTER_DEVICE_CHANGE_EVENT,
    REGISTER_RAW_DEVICE_EVENT,
    REGISTER_SENSOR_EVENT,
    REGISTER_CONTROLLER_EVENT,
    UNREGISTER_CALLBACK,

    TURN_ON,
    TURN_OFF,
    BELL,
    DIM,
    EXECUTE,
    UP,
    DOWN,
    STOP,
    LEARN,
    METHODS,
    LAST_SENT_COMMAND,
    LAST_SENT_VALUE,

    GET_NUMBER_OF_DEVICES,
    GET_DEVICE_ID,
    GET_DEVICE_TYPE,

    GET_NAME,
    SET_NAME,
    GET_PROTOCOL,
    SET_PROTOCOL,
    GET_MODEL,
    SET_MODEL,

    GET_DEVICE_PARAMETER,
    SET_DEVICE_PARAMETER,

    ADD_DEVICE,
    REMOVE_DEVICE,

    SEND_RAW_COMMAND,

    CONNECT_TELLSTICK_CONTROLLER,
    DISCONNECT_TELLSTICK_CONTROLLER,

    SENSOR,
    SENSOR_VALUE,

    CONTROLLER,
    CONTROLLER_VALUE,
    SET_CONTROLLER_VALUE,
    REMOVE_CONTROLLER,

    COUNT
};

constexpr std::size_t kFunctionCount = static_cast<std::size_t>(FunctionId::COUNT);

enum class ReturnKind { NONE, INTEGER, BOOLEAN, STRING };

enum class ParamKind {
    INTEGER,        ///< int
    BYTE,           ///< unsigned char
    TEXT,           ///< const char*, encoded text
    TEXT_BUFFER,    ///< char*, caller allocated output buffer
    INT_OUT,        ///< int*, output parameter
    EVENT_CALLBACK, ///< native callback function pointer
    CONTEXT,        ///< void*, always null
    STRING_REF      ///< char*, string previously returned by the library
};

enum class ErrorPolicy {
    NONE,
    CHECK_INTEGER,  ///< negative result is an error code
    CHECK_BOOLEAN,  ///< false is TELLSTICK_ERROR_DEVICE_NOT_FOUND
    RELEASE_STRING  ///< copy out, then tdReleaseString
};

/**
 * @brief Static description of one native entry point
 */
struct FunctionEntry {
    FunctionId id;
    const char* name;
    ReturnKind returnKind;
    std::vector<ParamKind> parameters;
    ErrorPolicy policy;
};

/**
 * @brief The descriptor table, ordered by FunctionId
 */
const std::vector<FunctionEntry>& functionEntries();

const FunctionEntry& functionEntry(FunctionId id);

/**
 * @brief Maps a FunctionId onto its native function pointer type
 */
template <FunctionId Id> struct FunctionSignature;

#define TELLCORE_FUNCTION_SIGNATURE(ID, TYPE)              \
    template <> struct FunctionSignature<FunctionId::ID> { \
        using Type = native::TYPE;                         \
    }

TELLCORE_FUNCTION_SIGNATURE(INIT, InitFn);
TELLCORE_FUNCTION_SIGNATURE(CLOSE, CloseFn);
TELLCORE_FUNCTION_SIGNATURE(RELEASE_STRING, ReleaseStringFn);
TELLCORE_FUNCTION_SIGNATURE(GET_ERROR_STRING, GetErrorStringFn);
TELLCORE_FUNCTION_SIGNATURE(REGISTER_DEVICE_EVENT, RegisterDeviceEventFn);
TELLCORE_FUNCTION_SIGNATURE(REGISTER_DEVICE_CHANGE_EVENT, RegisterDeviceChangeEventFn);
TELLCORE_FUNCTION_SIGNATURE(REGISTER_RAW_DEVICE_EVENT, RegisterRawDeviceEventFn);
TELLCORE_FUNCTION_SIGNATURE(REGISTER_SENSOR_EVENT, RegisterSensorEventFn);
TELLCORE_FUNCTION_SIGNATURE(REGISTER_CONTROLLER_EVENT, RegisterControllerEventFn);
TELLCORE_FUNCTION_SIGNATURE(UNREGISTER_CALLBACK, UnregisterCallbackFn);
TELLCORE_FUNCTION_SIGNATURE(TURN_ON, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(TURN_OFF, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(BELL, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(DIM, DimFn);
TELLCORE_FUNCTION_SIGNATURE(EXECUTE, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(UP, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(DOWN, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(STOP, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(LEARN, DeviceCommandFn);
TELLCORE_FUNCTION_SIGNATURE(METHODS, MethodsFn);
TELLCORE_FUNCTION_SIGNATURE(LAST_SENT_COMMAND, MethodsFn);
TELLCORE_FUNCTION_SIGNATURE(LAST_SENT_VALUE, DeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(GET_NUMBER_OF_DEVICES, CountFn);
TELLCORE_FUNCTION_SIGNATURE(GET_DEVICE_ID, IndexFn);
TELLCORE_FUNCTION_SIGNATURE(GET_DEVICE_TYPE, IndexFn);
TELLCORE_FUNCTION_SIGNATURE(GET_NAME, DeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(SET_NAME, SetDeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(GET_PROTOCOL, DeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(SET_PROTOCOL, SetDeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(GET_MODEL, DeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(SET_MODEL, SetDeviceStringFn);
TELLCORE_FUNCTION_SIGNATURE(GET_DEVICE_PARAMETER, GetDeviceParameterFn);
TELLCORE_FUNCTION_SIGNATURE(SET_DEVICE_PARAMETER, SetDeviceParameterFn);
TELLCORE_FUNCTION_SIGNATURE(ADD_DEVICE, CountFn);
TELLCORE_FUNCTION_SIGNATURE(REMOVE_DEVICE, RemoveDeviceFn);
TELLCORE_FUNCTION_SIGNATURE(SEND_RAW_COMMAND, SendRawCommandFn);
TELLCORE_FUNCTION_SIGNATURE(CONNECT_TELLSTICK_CONTROLLER, ControllerConnectionFn);
TELLCORE_FUNCTION_SIGNATURE(DISCONNECT_TELLSTICK_CONTROLLER, ControllerConnectionFn);
TELLCORE_FUNCTION_SIGNATURE(SENSOR, SensorFn);
TELLCORE_FUNCTION_SIGNATURE(SENSOR_VALUE, SensorValueFn);
TELLCORE_FUNCTION_SIGNATURE(CONTROLLER, ControllerFn);
TELLCORE_FUNCTION_SIGNATURE(CONTROLLER_VALUE, ControllerValueFn);
TELLCORE_FUNCTION_SIGNATURE(SET_CONTROLLER_VALUE, SetControllerValueFn);
TELLCORE_FUNCTION_SIGNATURE(REMOVE_CONTROLLER, RemoveControllerFn);

#undef TELLCORE_FUNCTION_SIGNATURE

/**
 * @brief Entry points resolved against one loaded module
 *
 * Symbols missing from the module (older telldus-core versions) are left
 * unbound; get() on them raises NotSupportedError.
 */
class FunctionTable {
public:
    /**
     * @brief Resolve every entry of the descriptor table
     * @return Number of entry points found
     */
    std::size_t bind(const ModuleLoader& loader, void* module);

    void clear();

    bool has(FunctionId id) const {
        return slots_[static_cast<std::size_t>(id)] != nullptr;
    }

    std::size_t boundCount() const;

    template <FunctionId Id> typename FunctionSignature<Id>::Type get() const {
        void* address = slots_[static_cast<std::size_t>(Id)];
        if (!address) {
            throw NotSupportedError(functionEntry(Id).name);
        }
        return reinterpret_cast<typename FunctionSignature<Id>::Type>(address);
    }

private:
    std::array<void*, kFunctionCount> slots_{};
};

} // namespace core
} // namespace tellcore
