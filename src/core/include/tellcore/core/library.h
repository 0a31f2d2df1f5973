#pragma once

#include "tellcore/core/call_marshaler.h"
#include "tellcore/core/callback_bridge.h"
#include "tellcore/core/callback_dispatcher.h"
#include "tellcore/core/library_config.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tellcore {
namespace core {

/**
 * @brief One entry of the tdSensor enumeration
 */
struct SensorInfo {
    std::string protocol;
    std::string model;
    int id = 0;
    int dataTypes = 0;
};

/**
 * @brief Result of tdSensorValue
 */
struct SensorReading {
    std::string value;
    int timestamp = 0;
};

/**
 * @brief One entry of the tdController enumeration
 */
struct ControllerInfo {
    int id = 0;
    int type = 0;
    std::string name;
    int available = 0;
};

/**
 * @brief Handle on the Telldus Core library
 *
 * Any number of instances may exist; they share one native session through
 * NativeHandle. Every method maps onto one native call, with negative or false
 * results raised as NativeCallError.
 *
 * Callbacks need a dispatcher. The first instance constructed with one
 * installs it for the whole generation; later instances may pass the same
 * dispatcher or none.
 */
class Library {
public:
    /**
     * @param libraryName Library file name or path, empty for the platform
     * default
     * @param dispatcher Callback dispatcher, may be null
     * @throws LoadError if the library cannot be loaded
     * @throws ContractViolation if a different dispatcher is already active
     */
    explicit Library(const std::string& libraryName = "",
                     std::shared_ptr<CallbackDispatcher> dispatcher = nullptr);

    /**
     * @brief Construct from a configuration; the dispatcher is created from
     * config.dispatcher
     */
    explicit Library(const LibraryConfig& config);

    Library(const LibraryConfig& config,
            std::shared_ptr<CallbackDispatcher> dispatcher);

    ~Library();

    Library(const Library&) = delete;
    Library& operator=(const Library&) = delete;

    // Device control
    void turnOn(int deviceId);
    void turnOff(int deviceId);
    void bell(int deviceId);
    void dim(int deviceId, std::uint8_t level);
    void execute(int deviceId);
    void up(int deviceId);
    void down(int deviceId);
    void stop(int deviceId);
    void learn(int deviceId);
    int methods(int deviceId, int methodsSupported);
    int lastSentCommand(int deviceId, int methodsSupported);
    std::string lastSentValue(int deviceId);

    // Device enumeration
    int getNumberOfDevices();
    int getDeviceId(int index);
    int getDeviceType(int deviceId);

    // Device configuration
    std::string getName(int deviceId);
    void setName(int deviceId, const TextArg& name);
    std::string getProtocol(int deviceId);
    void setProtocol(int deviceId, const TextArg& protocol);
    std::string getModel(int deviceId);
    void setModel(int deviceId, const TextArg& model);
    std::string getDeviceParameter(int deviceId, const TextArg& name,
                                   const TextArg& defaultValue);
    void setDeviceParameter(int deviceId, const TextArg& name,
                            const TextArg& value);

    /**
     * @return Id of the new, unconfigured device
     */
    int addDevice();
    void removeDevice(int deviceId);

    int sendRawCommand(const TextArg& command, int reserved = 0);

    void connectTellStickController(int vendorId, int productId,
                                    const TextArg& serial);
    void disconnectTellStickController(int vendorId, int productId,
                                       const TextArg& serial);

    /**
     * @brief Next sensor of the enumeration
     * @return Empty when the enumeration is exhausted
     */
    std::optional<SensorInfo> sensor();

    SensorReading sensorValue(const TextArg& protocol, const TextArg& model,
                              int id, int dataType);

    /**
     * @brief Next controller of the enumeration
     * @return Empty when the enumeration is exhausted
     */
    std::optional<ControllerInfo> controller();

    std::string controllerValue(int controllerId, const TextArg& name);
    void setControllerValue(int controllerId, const TextArg& name,
                            const TextArg& value);
    void removeController(int controllerId);

    std::string getErrorString(int errorCode);

    // Callbacks
    int registerDeviceEvent(DeviceEventCallback callback);
    int registerDeviceChangeEvent(DeviceChangeEventCallback callback);
    int registerRawDeviceEvent(RawDeviceEventCallback callback);
    int registerSensorEvent(SensorEventCallback callback);
    int registerControllerEvent(ControllerEventCallback callback);
    void unregisterCallback(int callbackId);

    /**
     * @brief The dispatcher active for this generation, may be null
     */
    std::shared_ptr<CallbackDispatcher> callbackDispatcher() const;

private:
    void acquire(const std::string& libraryName,
                 std::shared_ptr<CallbackDispatcher> dispatcher);

    std::unique_ptr<CallMarshaler> marshaler_;
};

} // namespace core
} // namespace tellcore
