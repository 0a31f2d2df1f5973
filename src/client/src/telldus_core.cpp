#include "tellcore/client/telldus_core.h"

#include "common/logger.h"

#include <algorithm>
#include <stdexcept>

namespace tellcore {
namespace client {

namespace {
constexpr const char* kComponent = "TelldusCore";
constexpr const char* kGroupProtocol = "group";
} // namespace

TelldusCore::TelldusCore(const std::string& libraryPath,
                         std::shared_ptr<core::CallbackDispatcher> dispatcher)
    : library_(std::make_shared<core::Library>(libraryPath, std::move(dispatcher))) {}

TelldusCore::TelldusCore(const core::LibraryConfig& config)
    : library_(std::make_shared<core::Library>(config)) {}

TelldusCore::TelldusCore(std::shared_ptr<core::Library> library)
    : library_(std::move(library)) {
    if (!library_) {
        throw std::invalid_argument("TelldusCore requires a library");
    }
}

std::vector<std::shared_ptr<Device>> TelldusCore::devices() {
    std::vector<std::shared_ptr<Device>> devices;
    const int count = library_->getNumberOfDevices();
    devices.reserve(count);
    for (int i = 0; i < count; ++i) {
        devices.push_back(Device::create(library_->getDeviceId(i), library_));
    }
    return devices;
}

std::vector<Sensor> TelldusCore::sensors() {
    std::vector<Sensor> sensors;
    while (auto info = library_->sensor()) {
        sensors.emplace_back(std::move(*info), library_);
    }
    return sensors;
}

std::vector<Controller> TelldusCore::controllers() {
    std::vector<Controller> controllers;
    while (auto info = library_->controller()) {
        controllers.emplace_back(std::move(*info), library_);
    }
    return controllers;
}

std::shared_ptr<Device>
TelldusCore::addDevice(const std::string& name, const std::string& protocol,
                       const std::optional<std::string>& model,
                       const std::map<std::string, std::string>& parameters) {
    const int id = library_->addDevice();
    std::shared_ptr<Device> device =
        protocol == kGroupProtocol
            ? std::static_pointer_cast<Device>(std::make_shared<DeviceGroup>(id, library_))
            : std::make_shared<Device>(id, library_);
    try {
        device->setName(name);
        device->setProtocol(protocol);
        if (model) {
            device->setModel(*model);
        }
        for (const auto &[key, value] : parameters) {
            device->setParameter(key, value);
        }
    } catch (const std::exception& e) {
        common::logWarning("Failed to configure device " + std::to_string(id) +
                               ", removing it: " + e.what(),
                           kComponent);
        try {
            device->remove();
        } catch (const core::TellcoreError& removeError) {
            common::logError("Failed to remove device " + std::to_string(id) + ": " +
                                 removeError.what(),
                             kComponent);
        }
        throw;
    }
    return device;
}

std::shared_ptr<DeviceGroup>
TelldusCore::addGroup(const std::string& name,
                      const std::vector<int>& deviceIds) {
    std::vector<int> members;
    for (int id : deviceIds) {
        if (std::find(members.begin(), members.end(), id) == members.end()) {
            members.push_back(id);
        }
    }
    std::map<std::string, std::string> parameters;
    parameters[deviceParameterName(DeviceParameter::DEVICES)] =
        DeviceGroup::formatMemberList(members);
    return std::static_pointer_cast<DeviceGroup>(
        addDevice(name, kGroupProtocol, std::nullopt, parameters));
}

int TelldusCore::sendRawCommand(const std::string& command, int reserved) {
    return library_->sendRawCommand(command, reserved);
}

void TelldusCore::connectController(int vendorId, int productId,
                                    const std::string& serial) {
    library_->connectTellStickController(vendorId, productId, serial);
}

void TelldusCore::disconnectController(int vendorId, int productId,
                                       const std::string& serial) {
    library_->disconnectTellStickController(vendorId, productId, serial);
}

int TelldusCore::registerDeviceEvent(core::DeviceEventCallback callback) {
    return library_->registerDeviceEvent(std::move(callback));
}

int TelldusCore::registerDeviceChangeEvent(
    core::DeviceChangeEventCallback callback) {
    return library_->registerDeviceChangeEvent(std::move(callback));
}

int TelldusCore::registerRawDeviceEvent(core::RawDeviceEventCallback callback) {
    return library_->registerRawDeviceEvent(std::move(callback));
}

int TelldusCore::registerSensorEvent(core::SensorEventCallback callback) {
    return library_->registerSensorEvent(std::move(callback));
}

int TelldusCore::registerControllerEvent(
    core::ControllerEventCallback callback) {
    return library_->registerControllerEvent(std::move(callback));
}

void TelldusCore::unregisterCallback(int callbackId) {
    library_->unregisterCallback(callbackId);
}

std::shared_ptr<core::CallbackDispatcher>
TelldusCore::callbackDispatcher() const {
    return library_->callbackDispatcher();
}

} // namespace client
} // namespace tellcore
