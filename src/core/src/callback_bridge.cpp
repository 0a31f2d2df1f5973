#include "tellcore/core/callback_bridge.h"
#include "tellcore/core/call_marshaler.h"
#include "tellcore/core/errors.h"
#include "tellcore/core/native_handle.h"
#include "tellcore/core/string_encoding.h"

#include "common/logger.h"

#include <stdexcept>

namespace tellcore {
namespace core {

namespace {

constexpr const char* kComponent = "CallbackBridge";

std::string decodeText(const char* text) {
    return StringEncoding::getInstance().decode(text ? text : "");
}

bool hasTarget(const EventCallback& callback) {
    return std::visit([](const auto& function) { return static_cast<bool>(function); },
                      callback);
}

} // namespace

CallbackBridge& CallbackBridge::getInstance() {
    static CallbackBridge instance;
    return instance;
}

int CallbackBridge::registerDeviceEvent(DeviceEventCallback callback,
                                        const void* owner) {
    return registerCallback(EventKind::DEVICE, std::move(callback), owner);
}

int CallbackBridge::registerDeviceChangeEvent(DeviceChangeEventCallback callback,
                                              const void* owner) {
    return registerCallback(EventKind::DEVICE_CHANGE, std::move(callback), owner);
}

int CallbackBridge::registerRawDeviceEvent(RawDeviceEventCallback callback,
                                           const void* owner) {
    return registerCallback(EventKind::RAW_DEVICE, std::move(callback), owner);
}

int CallbackBridge::registerSensorEvent(SensorEventCallback callback,
                                        const void* owner) {
    return registerCallback(EventKind::SENSOR, std::move(callback), owner);
}

int CallbackBridge::registerControllerEvent(ControllerEventCallback callback,
                                            const void* owner) {
    return registerCallback(EventKind::CONTROLLER, std::move(callback), owner);
}

int CallbackBridge::registerCallback(EventKind kind, EventCallback callback,
                                     const void* owner) {
    if (!hasTarget(callback)) {
        throw std::invalid_argument("Cannot register an empty callback");
    }

    // The lock is held across the native call so that an event arriving before
    // the id is stored finds it once the lock is released.
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dispatcher_) {
        throw ContractViolation(
            "A callback dispatcher must be installed before registering callbacks");
    }

    CallMarshaler marshaler(NativeHandle::getInstance().functions());
    int id = 0;
    switch (kind) {
        case EventKind::DEVICE:
            id = marshaler.invoke<FunctionId::REGISTER_DEVICE_EVENT>(&onDeviceEvent, nullptr);
            break;
        case EventKind::DEVICE_CHANGE:
            id = marshaler.invoke<FunctionId::REGISTER_DEVICE_CHANGE_EVENT>(
                &onDeviceChangeEvent, nullptr);
            break;
        case EventKind::RAW_DEVICE:
            id = marshaler.invoke<FunctionId::REGISTER_RAW_DEVICE_EVENT>(&onRawDeviceEvent,
                                                                         nullptr);
            break;
        case EventKind::SENSOR:
            id = marshaler.invoke<FunctionId::REGISTER_SENSOR_EVENT>(&onSensorEvent, nullptr);
            break;
        case EventKind::CONTROLLER:
            id = marshaler.invoke<FunctionId::REGISTER_CONTROLLER_EVENT>(&onControllerEvent,
                                                                         nullptr);
            break;
    }

    auto registration = std::make_unique<CallbackRegistration>();
    registration->id = id;
    registration->serial = nextSerial_++;
    registration->kind = kind;
    registration->callback = std::move(callback);
    registration->owner = owner;
    registrations_[id] = std::move(registration);

    common::logDebug("Registered " + eventKindToString(kind) + " callback " +
                         std::to_string(id),
                     kComponent);
    return id;
}

void CallbackBridge::unregisterCallback(int callbackId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registrations_.erase(callbackId);
    }
    CallMarshaler marshaler(NativeHandle::getInstance().functions());
    marshaler.invoke<FunctionId::UNREGISTER_CALLBACK>(callbackId);
    common::logDebug("Unregistered callback " + std::to_string(callbackId),
                     kComponent);
}

std::size_t CallbackBridge::unregisterOwnedBy(const void* owner) {
    std::vector<int> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = registrations_.begin(); it != registrations_.end();) {
            if (it->second->owner == owner) {
                ids.push_back(it->first);
                it = registrations_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return unregisterIds(ids);
}

std::size_t CallbackBridge::unregisterAll() {
    std::vector<int> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : registrations_) {
            ids.push_back(entry.first);
        }
        registrations_.clear();
    }
    return unregisterIds(ids);
}

std::size_t CallbackBridge::unregisterIds(const std::vector<int>& ids) {
    CallMarshaler marshaler(NativeHandle::getInstance().functions());
    for (int id : ids) {
        try {
            marshaler.invoke<FunctionId::UNREGISTER_CALLBACK>(id);
        } catch (const TellcoreError& e) {
            common::logWarning("Failed to unregister callback " + std::to_string(id) +
                                   ": " + e.what(),
                               kComponent);
        }
    }
    return ids.size();
}

bool CallbackBridge::isRegistered(int callbackId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.count(callbackId) != 0;
}

bool CallbackBridge::resolves(int callbackId, std::uint64_t serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(callbackId);
    return it != registrations_.end() && it->second->serial == serial;
}

std::size_t CallbackBridge::registrationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

std::vector<int> CallbackBridge::registeredIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> ids;
    ids.reserve(registrations_.size());
    for (const auto& entry : registrations_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void CallbackBridge::installDispatcher(
    std::shared_ptr<CallbackDispatcher> dispatcher) {
    if (!dispatcher) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (dispatcher_ && dispatcher_ != dispatcher) {
        throw ContractViolation(
            "A different callback dispatcher is already active");
    }
    dispatcher_ = std::move(dispatcher);
}

void CallbackBridge::clearDispatcher() {
    std::lock_guard<std::mutex> lock(mutex_);
    dispatcher_.reset();
}

std::shared_ptr<CallbackDispatcher> CallbackBridge::dispatcher() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatcher_;
}

template <typename Callback, typename... Args>
void CallbackBridge::dispatch(int callbackId, EventKind kind, Args... args) {
    Callback callback;
    std::uint64_t serial = 0;
    std::shared_ptr<CallbackDispatcher> dispatcher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = registrations_.find(callbackId);
        if (it == registrations_.end()) {
            return;
        }
        const auto* typed = std::get_if<Callback>(&it->second->callback);
        if (!typed) {
            common::logWarning("Callback " + std::to_string(callbackId) +
                                   " is not a " + eventKindToString(kind) +
                                   " callback",
                               kComponent);
            return;
        }
        callback = *typed;
        serial = it->second->serial;
        dispatcher = dispatcher_;
    }
    if (!dispatcher) {
        return;
    }

    PendingEvent event;
    event.callbackId = callbackId;
    event.kind = kind;
    event.invoke = [this, callback, callbackId, serial, args...]() {
        if (!resolves(callbackId, serial)) {
            return;
        }
        callback(args..., callbackId);
    };
    dispatcher->onCallback(std::move(event));
}

void TELLCORE_CALLCONV CallbackBridge::onDeviceEvent(int deviceId, int method,
                                                     const char* data,
                                                     int callbackId, void*) {
    try {
        getInstance().dispatch<DeviceEventCallback>(callbackId, EventKind::DEVICE,
                                                    deviceId, method,
                                                    decodeText(data));
    } catch (const std::exception& e) {
        common::logError(std::string("Device event dropped: ") + e.what(),
                         kComponent);
    }
}

void TELLCORE_CALLCONV CallbackBridge::onDeviceChangeEvent(int deviceId,
                                                           int changeEvent,
                                                           int changeType,
                                                           int callbackId,
                                                           void*) {
    try {
        getInstance().dispatch<DeviceChangeEventCallback>(
            callbackId, EventKind::DEVICE_CHANGE, deviceId, changeEvent, changeType);
    } catch (const std::exception& e) {
        common::logError(std::string("Device change event dropped: ") + e.what(),
                         kComponent);
    }
}

void TELLCORE_CALLCONV CallbackBridge::onRawDeviceEvent(const char* data,
                                                        int controllerId,
                                                        int callbackId, void*) {
    try {
        getInstance().dispatch<RawDeviceEventCallback>(
            callbackId, EventKind::RAW_DEVICE, decodeText(data), controllerId);
    } catch (const std::exception& e) {
        common::logError(std::string("Raw device event dropped: ") + e.what(),
                         kComponent);
    }
}

void TELLCORE_CALLCONV CallbackBridge::onSensorEvent(
    const char* protocol, const char* model, int id, int dataType,
    const char* value, int timestamp, int callbackId, void*) {
    try {
        getInstance().dispatch<SensorEventCallback>(
            callbackId, EventKind::SENSOR, decodeText(protocol), decodeText(model),
            id, dataType, decodeText(value), timestamp);
    } catch (const std::exception& e) {
        common::logError(std::string("Sensor event dropped: ") + e.what(),
                         kComponent);
    }
}

void TELLCORE_CALLCONV CallbackBridge::onControllerEvent(int controllerId,
                                                         int changeEvent,
                                                         int changeType,
                                                         const char* newValue,
                                                         int callbackId,
                                                         void*) {
    try {
        getInstance().dispatch<ControllerEventCallback>(
            callbackId, EventKind::CONTROLLER, controllerId, changeEvent,
            changeType, decodeText(newValue));
    } catch (const std::exception& e) {
        common::logError(std::string("Controller event dropped: ") + e.what(),
                         kComponent);
    }
}

} // namespace core
} // namespace tellcore
