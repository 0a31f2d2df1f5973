#include "tellcore/core/function_table.h"
#include "tellcore/core/module_loader.h"

#include "common/logger.h"

namespace tellcore {
namespace core {

namespace {

using P = ParamKind;
using R = ReturnKind;
using E = ErrorPolicy;

const std::vector<FunctionEntry>& buildEntries() {
    static const std::vector<FunctionEntry> entries = {
        {FunctionId::INIT, "tdInit", R::NONE, {}, E::NONE},
        {FunctionId::CLOSE, "tdClose", R::NONE, {}, E::NONE},
        {FunctionId::RELEASE_STRING, "tdReleaseString", R::NONE, {P::STRING_REF}, E::NONE},
        {FunctionId::GET_ERROR_STRING, "tdGetErrorString", R::STRING, {P::INTEGER}, E::RELEASE_STRING},

        {FunctionId::REGISTER_DEVICE_EVENT, "tdRegisterDeviceEvent", R::INTEGER,
           {P::EVENT_CALLBACK, P::CONTEXT}, E::CHECK_INTEGER},
        {FunctionId::REGISTER_DEVICE_CHANGE_EVENT, "tdRegisterDeviceChangeEvent", R::INTEGER,
           {P::EVENT_CALLBACK, P::CONTEXT}, E::CHECK_INTEGER},
        {FunctionId::REGISTER_RAW_DEVICE_EVENT, "tdRegisterRawDeviceEvent", R::INTEGER,
           {P::EVENT_CALLBACK, P::CONTEXT}, E::CHECK_INTEGER},
        {FunctionId::REGISTER_SENSOR_EVENT, "tdRegisterSensorEvent", R::INTEGER,
           {P::EVENT_CALLBACK, P::CONTEXT}, E::CHECK_INTEGER},
        {FunctionId::REGISTER_CONTROLLER_EVENT, "tdRegisterControllerEvent", R::INTEGER,
           {P::EVENT_CALLBACK, P::CONTEXT}, E::CHECK_INTEGER},
        {FunctionId::UNREGISTER_CALLBACK, "tdUnregisterCallback", R::INTEGER, {P::INTEGER},
           E::CHECK_INTEGER},

        {FunctionId::TURN_ON, "tdTurnOn", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::TURN_OFF, "tdTurnOff", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::BELL, "tdBell", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::DIM, "tdDim", R::INTEGER, {P::INTEGER, P::BYTE}, E::CHECK_INTEGER},
        {FunctionId::EXECUTE, "tdExecute", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::UP, "tdUp", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::DOWN, "tdDown", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::STOP, "tdStop", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::LEARN, "tdLearn", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::METHODS, "tdMethods", R::INTEGER, {P::INTEGER, P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::LAST_SENT_COMMAND, "tdLastSentCommand", R::INTEGER, {P::INTEGER, P::INTEGER},
           E::CHECK_INTEGER},
        {FunctionId::LAST_SENT_VALUE, "tdLastSentValue", R::STRING, {P::INTEGER}, E::RELEASE_STRING},

        {FunctionId::GET_NUMBER_OF_DEVICES, "tdGetNumberOfDevices", R::INTEGER, {}, E::CHECK_INTEGER},
        {FunctionId::GET_DEVICE_ID, "tdGetDeviceId", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::GET_DEVICE_TYPE, "tdGetDeviceType", R::INTEGER, {P::INTEGER}, E::CHECK_INTEGER},

        {FunctionId::GET_NAME, "tdGetName", R::STRING, {P::INTEGER}, E::RELEASE_STRING},
        {FunctionId::SET_NAME, "tdSetName", R::BOOLEAN, {P::INTEGER, P::TEXT}, E::CHECK_BOOLEAN},
        {FunctionId::GET_PROTOCOL, "tdGetProtocol", R::STRING, {P::INTEGER}, E::RELEASE_STRING},
        {FunctionId::SET_PROTOCOL, "tdSetProtocol", R::BOOLEAN, {P::INTEGER, P::TEXT},
           E::CHECK_BOOLEAN},
        {FunctionId::GET_MODEL, "tdGetModel", R::STRING, {P::INTEGER}, E::RELEASE_STRING},
        {FunctionId::SET_MODEL, "tdSetModel", R::BOOLEAN, {P::INTEGER, P::TEXT}, E::CHECK_BOOLEAN},

        {FunctionId::GET_DEVICE_PARAMETER, "tdGetDeviceParameter", R::STRING,
           {P::INTEGER, P::TEXT, P::TEXT}, E::RELEASE_STRING},
        {FunctionId::SET_DEVICE_PARAMETER, "tdSetDeviceParameter", R::BOOLEAN,
           {P::INTEGER, P::TEXT, P::TEXT}, E::CHECK_BOOLEAN},

        {FunctionId::ADD_DEVICE, "tdAddDevice", R::INTEGER, {}, E::CHECK_INTEGER},
        {FunctionId::REMOVE_DEVICE, "tdRemoveDevice", R::BOOLEAN, {P::INTEGER}, E::CHECK_BOOLEAN},

        {FunctionId::SEND_RAW_COMMAND, "tdSendRawCommand", R::INTEGER, {P::TEXT, P::INTEGER},
           E::CHECK_INTEGER},

        {FunctionId::CONNECT_TELLSTICK_CONTROLLER, "tdConnectTellStickController", R::NONE,
           {P::INTEGER, P::INTEGER, P::TEXT}, E::NONE},
        {FunctionId::DISCONNECT_TELLSTICK_CONTROLLER, "tdDisconnectTellStickController", R::NONE,
           {P::INTEGER, P::INTEGER, P::TEXT}, E::NONE},

        {FunctionId::SENSOR, "tdSensor", R::INTEGER,
           {P::TEXT_BUFFER, P::INTEGER, P::TEXT_BUFFER, P::INTEGER, P::INT_OUT, P::INT_OUT},
           E::CHECK_INTEGER},
        {FunctionId::SENSOR_VALUE, "tdSensorValue", R::INTEGER,
           {P::TEXT, P::TEXT, P::INTEGER, P::INTEGER, P::TEXT_BUFFER, P::INTEGER, P::INT_OUT},
           E::CHECK_INTEGER},

        {FunctionId::CONTROLLER, "tdController", R::INTEGER,
           {P::INT_OUT, P::INT_OUT, P::TEXT_BUFFER, P::INTEGER, P::INT_OUT}, E::CHECK_INTEGER},
        {FunctionId::CONTROLLER_VALUE, "tdControllerValue", R::INTEGER,
           {P::INTEGER, P::TEXT, P::TEXT_BUFFER, P::INTEGER}, E::CHECK_INTEGER},
        {FunctionId::SET_CONTROLLER_VALUE, "tdSetControllerValue", R::INTEGER,
           {P::INTEGER, P::TEXT, P::TEXT}, E::CHECK_INTEGER},
        {FunctionId::REMOVE_CONTROLLER, "tdRemoveController", R::INTEGER, {P::INTEGER},
           E::CHECK_INTEGER},
    };
    return entries;
}

} // namespace

const std::vector<FunctionEntry>& functionEntries() { return buildEntries(); }

const FunctionEntry& functionEntry(FunctionId id) {
    return buildEntries().at(static_cast<std::size_t>(id));
}

std::size_t FunctionTable::bind(const ModuleLoader& loader, void* module) {
    clear();
    std::size_t found = 0;
    for (const auto& entry : functionEntries()) {
        void* address = loader.symbol(module, entry.name);
        if (!address) {
            common::logDebug(std::string("Symbol not exported: ") + entry.name,
                             "FunctionTable");
            continue;
        }
        slots_[static_cast<std::size_t>(entry.id)] = address;
        ++found;
    }
    return found;
}

void FunctionTable::clear() { slots_.fill(nullptr); }

std::size_t FunctionTable::boundCount() const {
    std::size_t count = 0;
    for (void* slot : slots_) {
        if (slot) {
            ++count;
        }
    }
    return count;
}

} // namespace core
} // namespace tellcore
