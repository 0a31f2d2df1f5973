#pragma once

#include "tellcore/core/callback_dispatcher.h"
#include "tellcore/core/native_api.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace tellcore {
namespace core {

// Consumer callbacks receive the native arguments with the trailing context
// removed; the registration id stays as the last argument.
using DeviceEventCallback =
    std::function<void(int deviceId, int method, const std::string& data,
                       int callbackId)>;
using DeviceChangeEventCallback =
    std::function<void(int deviceId, int changeEvent, int changeType,
                       int callbackId)>;
using RawDeviceEventCallback =
    std::function<void(const std::string& data, int controllerId,
                       int callbackId)>;
using SensorEventCallback = std::function<void(
    const std::string& protocol, const std::string& model, int id,
    int dataType, const std::string& value, int timestamp, int callbackId)>;
using ControllerEventCallback =
    std::function<void(int controllerId, int changeEvent, int changeType,
                       const std::string& newValue, int callbackId)>;

using EventCallback =
    std::variant<DeviceEventCallback, DeviceChangeEventCallback,
                 RawDeviceEventCallback, SensorEventCallback,
                 ControllerEventCallback>;

/**
 * @brief One live registration with the native library
 *
 * Native ids restart with every tdInit; serial is unique for the lifetime of
 * the process.
 */
struct CallbackRegistration {
    int id = 0;
    std::uint64_t serial = 0;
    EventKind kind = EventKind::DEVICE;
    EventCallback callback;
    const void* owner = nullptr;
};

/**
 * @brief Routes native events to consumer callbacks
 *
 * Holds the registration map and the dispatcher of the current generation.
 * The static thunks handed to the native library run on its callback thread;
 * they look the registration up by id and pass a PendingEvent to the
 * dispatcher. Events whose registration is gone, either when the native
 * library calls back or when the dispatcher delivers, are dropped. A later
 * registration that reuses the native id does not receive them.
 */
class CallbackBridge {
public:
    static CallbackBridge& getInstance();

    /**
     * @brief Register a callback with the native library
     * @param owner Opaque tag used by unregisterOwnedBy()
     * @return The native registration id
     * @throws ContractViolation if no dispatcher is installed
     * @throws NativeCallError if the native registration fails
     * @throws NotSupportedError if the library lacks the entry point
     */
    int registerDeviceEvent(DeviceEventCallback callback, const void* owner = nullptr);
    int registerDeviceChangeEvent(DeviceChangeEventCallback callback, const void* owner = nullptr);
    int registerRawDeviceEvent(RawDeviceEventCallback callback, const void* owner = nullptr);
    int registerSensorEvent(SensorEventCallback callback, const void* owner = nullptr);
    int registerControllerEvent(ControllerEventCallback callback, const void* owner = nullptr);

    /**
     * @brief Remove a registration, then unregister it natively
     * @throws NativeCallError if the native call fails
     */
    void unregisterCallback(int callbackId);

    /**
     * @brief Best-effort removal of every registration made by owner
     * @return Number of registrations removed
     */
    std::size_t unregisterOwnedBy(const void* owner);

    /**
     * @brief Best-effort removal of every registration
     * @return Number of registrations removed
     */
    std::size_t unregisterAll();

    bool isRegistered(int callbackId) const;
    std::size_t registrationCount() const;
    std::vector<int> registeredIds() const;

    /**
     * @brief Install the dispatcher of the current generation
     *
     * Installing the active dispatcher again is a no-op.
     *
     * @throws ContractViolation if a different dispatcher is active
     */
    void installDispatcher(std::shared_ptr<CallbackDispatcher> dispatcher);

    void clearDispatcher();

    std::shared_ptr<CallbackDispatcher> dispatcher() const;

private:
    CallbackBridge() = default;
    CallbackBridge(const CallbackBridge&) = delete;
    CallbackBridge& operator=(const CallbackBridge&) = delete;

    int registerCallback(EventKind kind, EventCallback callback, const void* owner);
    std::size_t unregisterIds(const std::vector<int>& ids);
    bool resolves(int callbackId, std::uint64_t serial) const;

    template <typename Callback, typename... Args>
    void dispatch(int callbackId, EventKind kind, Args... args);

    static void TELLCORE_CALLCONV onDeviceEvent(int deviceId, int method,
                                                const char* data, int callbackId,
                                                void* context);
    static void TELLCORE_CALLCONV onDeviceChangeEvent(int deviceId, int changeEvent,
                                                      int changeType, int callbackId,
                                                      void* context);
    static void TELLCORE_CALLCONV onRawDeviceEvent(const char* data, int controllerId,
                                                   int callbackId, void* context);
    static void TELLCORE_CALLCONV onSensorEvent(const char* protocol, const char* model,
                                                int id, int dataType, const char* value,
                                                int timestamp, int callbackId,
                                                void* context);
    static void TELLCORE_CALLCONV onControllerEvent(int controllerId, int changeEvent,
                                                    int changeType, const char* newValue,
                                                    int callbackId, void* context);

    mutable std::mutex mutex_;
    std::map<int, std::unique_ptr<CallbackRegistration>> registrations_;
    std::uint64_t nextSerial_ = 1;
    std::shared_ptr<CallbackDispatcher> dispatcher_;
};

} // namespace core
} // namespace tellcore
