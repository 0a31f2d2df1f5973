#pragma once

#include "tellcore/client/controller.h"
#include "tellcore/client/device.h"
#include "tellcore/client/sensor.h"
#include "tellcore/core/library.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tellcore {
namespace client {

/**
 * @brief Entry point of the object level API
 *
 * Wraps a shared core::Library and hands out Device, Sensor and Controller
 * objects bound to it.
 */
class TelldusCore {
public:
    /**
     * @param libraryPath Library file name or path, empty for the platform
     * default
     * @param dispatcher Dispatcher for event callbacks, may be null
     */
    explicit TelldusCore(const std::string& libraryPath = "",
                         std::shared_ptr<core::CallbackDispatcher> dispatcher = nullptr);

    explicit TelldusCore(const core::LibraryConfig& config);

    explicit TelldusCore(std::shared_ptr<core::Library> library);

    std::vector<std::shared_ptr<Device>> devices();

    /**
     * @brief Enumerate all sensors
     */
    std::vector<Sensor> sensors();

    /**
     * @brief Enumerate all controllers
     */
    std::vector<Controller> controllers();

    /**
     * @brief Create and configure a new device
     *
     * If any step after tdAddDevice fails the half created device is removed
     * and the error is rethrown.
     */
    std::shared_ptr<Device> addDevice(
        const std::string& name, const std::string& protocol,
        const std::optional<std::string>& model = std::nullopt,
        const std::map<std::string, std::string>& parameters = {});

    /**
     * @brief Create a group device containing the given devices
     */
    std::shared_ptr<DeviceGroup> addGroup(const std::string& name,
                                          const std::vector<int>& deviceIds);

    int sendRawCommand(const std::string& command, int reserved = 0);

    void connectController(int vendorId, int productId, const std::string& serial);
    void disconnectController(int vendorId, int productId, const std::string& serial);

    int registerDeviceEvent(core::DeviceEventCallback callback);
    int registerDeviceChangeEvent(core::DeviceChangeEventCallback callback);
    int registerRawDeviceEvent(core::RawDeviceEventCallback callback);
    int registerSensorEvent(core::SensorEventCallback callback);
    int registerControllerEvent(core::ControllerEventCallback callback);
    void unregisterCallback(int callbackId);

    std::shared_ptr<core::CallbackDispatcher> callbackDispatcher() const;

    const std::shared_ptr<core::Library>& library() const { return library_; }

private:
    std::shared_ptr<core::Library> library_;
};

} // namespace client
} // namespace tellcore
