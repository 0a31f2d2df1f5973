#include "tellcore/core/library.h"
#include "tellcore/core/constants.h"
#include "tellcore/core/native_handle.h"

#include "common/logger.h"

namespace tellcore {
namespace core {

namespace {

constexpr const char* kComponent = "Library";

// Instances built from the same configuration share the active dispatcher of
// the generation; a dispatcher of another kind is rejected on install.
std::shared_ptr<CallbackDispatcher> dispatcherFor(const LibraryConfig& config) {
    auto active = CallbackBridge::getInstance().dispatcher();
    if (active && config.matchesDispatcher(active)) {
        return active;
    }
    return config.createDispatcher();
}

} // namespace

Library::Library(const std::string& libraryName,
                 std::shared_ptr<CallbackDispatcher> dispatcher) {
    acquire(libraryName, std::move(dispatcher));
}

Library::Library(const LibraryConfig& config)
    : Library(config, dispatcherFor(config)) {}

Library::Library(const LibraryConfig& config,
                 std::shared_ptr<CallbackDispatcher> dispatcher) {
    config.applyEncoding();
    acquire(config.libraryPath, std::move(dispatcher));
}

void Library::acquire(const std::string& libraryName,
                      std::shared_ptr<CallbackDispatcher> dispatcher) {
    auto& handle = NativeHandle::getInstance();
    handle.open(libraryName);
    try {
        CallbackBridge::getInstance().installDispatcher(std::move(dispatcher));
    } catch (...) {
        handle.release();
        throw;
    }
    marshaler_ = std::make_unique<CallMarshaler>(handle.functions());
}

Library::~Library() {
    try {
        const std::size_t removed = CallbackBridge::getInstance().unregisterOwnedBy(this);
        if (removed > 0) {
            common::logDebug("Removed " + std::to_string(removed) +
                                 " callbacks on destruction",
                             kComponent);
        }
    } catch (const std::exception& e) {
        common::logError(std::string("Failed to remove callbacks: ") + e.what(),
                         kComponent);
    }
    try {
        NativeHandle::getInstance().release();
    } catch (const std::exception& e) {
        common::logError(std::string("Failed to release library: ") + e.what(),
                         kComponent);
    }
}

void Library::turnOn(int deviceId) {
    marshaler_->invoke<FunctionId::TURN_ON>(deviceId);
}

void Library::turnOff(int deviceId) {
    marshaler_->invoke<FunctionId::TURN_OFF>(deviceId);
}

void Library::bell(int deviceId) {
    marshaler_->invoke<FunctionId::BELL>(deviceId);
}

void Library::dim(int deviceId, std::uint8_t level) {
    marshaler_->invoke<FunctionId::DIM>(deviceId,
                                        static_cast<unsigned char>(level));
}

void Library::execute(int deviceId) {
    marshaler_->invoke<FunctionId::EXECUTE>(deviceId);
}

void Library::up(int deviceId) {
    marshaler_->invoke<FunctionId::UP>(deviceId);
}

void Library::down(int deviceId) {
    marshaler_->invoke<FunctionId::DOWN>(deviceId);
}

void Library::stop(int deviceId) {
    marshaler_->invoke<FunctionId::STOP>(deviceId);
}

void Library::learn(int deviceId) {
    marshaler_->invoke<FunctionId::LEARN>(deviceId);
}

int Library::methods(int deviceId, int methodsSupported) {
    return marshaler_->invoke<FunctionId::METHODS>(deviceId, methodsSupported);
}

int Library::lastSentCommand(int deviceId, int methodsSupported) {
    return marshaler_->invoke<FunctionId::LAST_SENT_COMMAND>(deviceId,
                                                             methodsSupported);
}

std::string Library::lastSentValue(int deviceId) {
    return marshaler_->invoke<FunctionId::LAST_SENT_VALUE>(deviceId).value_or("");
}

int Library::getNumberOfDevices() {
    return marshaler_->invoke<FunctionId::GET_NUMBER_OF_DEVICES>();
}

int Library::getDeviceId(int index) {
    return marshaler_->invoke<FunctionId::GET_DEVICE_ID>(index);
}

int Library::getDeviceType(int deviceId) {
    return marshaler_->invoke<FunctionId::GET_DEVICE_TYPE>(deviceId);
}

std::string Library::getName(int deviceId) {
    return marshaler_->invoke<FunctionId::GET_NAME>(deviceId).value_or("");
}

void Library::setName(int deviceId, const TextArg& name) {
    marshaler_->invoke<FunctionId::SET_NAME>(deviceId, name.c_str());
}

std::string Library::getProtocol(int deviceId) {
    return marshaler_->invoke<FunctionId::GET_PROTOCOL>(deviceId).value_or("");
}

void Library::setProtocol(int deviceId, const TextArg& protocol) {
    marshaler_->invoke<FunctionId::SET_PROTOCOL>(deviceId, protocol.c_str());
}

std::string Library::getModel(int deviceId) {
    return marshaler_->invoke<FunctionId::GET_MODEL>(deviceId).value_or("");
}

void Library::setModel(int deviceId, const TextArg& model) {
    marshaler_->invoke<FunctionId::SET_MODEL>(deviceId, model.c_str());
}

std::string Library::getDeviceParameter(int deviceId, const TextArg& name,
                                        const TextArg& defaultValue) {
    return marshaler_
        ->invoke<FunctionId::GET_DEVICE_PARAMETER>(deviceId, name.c_str(),
                                                   defaultValue.c_str())
        .value_or("");
}

void Library::setDeviceParameter(int deviceId, const TextArg& name,
                                 const TextArg& value) {
    marshaler_->invoke<FunctionId::SET_DEVICE_PARAMETER>(deviceId, name.c_str(),
                                                         value.c_str());
}

int Library::addDevice() {
    return marshaler_->invoke<FunctionId::ADD_DEVICE>();
}

void Library::removeDevice(int deviceId) {
    marshaler_->invoke<FunctionId::REMOVE_DEVICE>(deviceId);
}

int Library::sendRawCommand(const TextArg& command, int reserved) {
    return marshaler_->invoke<FunctionId::SEND_RAW_COMMAND>(command.c_str(),
                                                            reserved);
}

void Library::connectTellStickController(int vendorId, int productId,
                                         const TextArg& serial) {
    marshaler_->invoke<FunctionId::CONNECT_TELLSTICK_CONTROLLER>(
        vendorId, productId, serial.c_str());
}

void Library::disconnectTellStickController(int vendorId, int productId,
                                            const TextArg& serial) {
    marshaler_->invoke<FunctionId::DISCONNECT_TELLSTICK_CONTROLLER>(
        vendorId, productId, serial.c_str());
}

std::optional<SensorInfo> Library::sensor() {
    char protocol[kSensorBufferSize] = {};
    char model[kSensorBufferSize] = {};
    int id = 0;
    int dataTypes = 0;

    const int result = marshaler_->table().get<FunctionId::SENSOR>()(
        protocol, kSensorBufferSize, model, kSensorBufferSize, &id, &dataTypes);
    if (result == constants::TELLSTICK_ERROR_DEVICE_NOT_FOUND) {
        return std::nullopt;
    }
    marshaler_->checkInteger(result);

    SensorInfo info;
    info.protocol = CallMarshaler::decodeBuffer(protocol, sizeof(protocol));
    info.model = CallMarshaler::decodeBuffer(model, sizeof(model));
    info.id = id;
    info.dataTypes = dataTypes;
    return info;
}

SensorReading Library::sensorValue(const TextArg& protocol,
                                   const TextArg& model, int id,
                                   int dataType) {
    char value[kSensorBufferSize] = {};
    int timestamp = 0;

    marshaler_->invoke<FunctionId::SENSOR_VALUE>(protocol.c_str(), model.c_str(),
                                                 id, dataType, value,
                                                 kSensorBufferSize, &timestamp);

    SensorReading reading;
    reading.value = CallMarshaler::decodeBuffer(value, sizeof(value));
    reading.timestamp = timestamp;
    return reading;
}

std::optional<ControllerInfo> Library::controller() {
    int id = 0;
    int type = 0;
    char name[kControllerBufferSize] = {};
    int available = 0;

    const int result = marshaler_->table().get<FunctionId::CONTROLLER>()(
        &id, &type, name, kControllerBufferSize, &available);
    if (result == constants::TELLSTICK_ERROR_NOT_FOUND) {
        return std::nullopt;
    }
    marshaler_->checkInteger(result);

    ControllerInfo info;
    info.id = id;
    info.type = type;
    info.name = CallMarshaler::decodeBuffer(name, sizeof(name));
    info.available = available;
    return info;
}

std::string Library::controllerValue(int controllerId, const TextArg& name) {
    char value[kControllerBufferSize] = {};
    marshaler_->invoke<FunctionId::CONTROLLER_VALUE>(controllerId, name.c_str(),
                                                     value, kControllerBufferSize);
    return CallMarshaler::decodeBuffer(value, sizeof(value));
}

void Library::setControllerValue(int controllerId, const TextArg& name,
                                 const TextArg& value) {
    marshaler_->invoke<FunctionId::SET_CONTROLLER_VALUE>(
        controllerId, name.c_str(), value.c_str());
}

void Library::removeController(int controllerId) {
    marshaler_->invoke<FunctionId::REMOVE_CONTROLLER>(controllerId);
}

std::string Library::getErrorString(int errorCode) {
    return marshaler_->invoke<FunctionId::GET_ERROR_STRING>(errorCode)
        .value_or("");
}

int Library::registerDeviceEvent(DeviceEventCallback callback) {
    return CallbackBridge::getInstance().registerDeviceEvent(std::move(callback),
                                                             this);
}

int Library::registerDeviceChangeEvent(DeviceChangeEventCallback callback) {
    return CallbackBridge::getInstance().registerDeviceChangeEvent(
        std::move(callback), this);
}

int Library::registerRawDeviceEvent(RawDeviceEventCallback callback) {
    return CallbackBridge::getInstance().registerRawDeviceEvent(
        std::move(callback), this);
}

int Library::registerSensorEvent(SensorEventCallback callback) {
    return CallbackBridge::getInstance().registerSensorEvent(std::move(callback),
                                                             this);
}

int Library::registerControllerEvent(ControllerEventCallback callback) {
    return CallbackBridge::getInstance().registerControllerEvent(
        std::move(callback), this);
}

void Library::unregisterCallback(int callbackId) {
    CallbackBridge::getInstance().unregisterCallback(callbackId);
}

std::shared_ptr<CallbackDispatcher> Library::callbackDispatcher() const {
    return CallbackBridge::getInstance().dispatcher();
}

} // namespace core
} // namespace tellcore
