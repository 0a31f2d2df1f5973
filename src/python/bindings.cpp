#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "tellcore/client/telldus_core.h"
#include "tellcore/core/constants.h"
#include "tellcore/core/errors.h"
#include "tellcore/core/library.h"
#include "tellcore/core/string_encoding.h"

#include "common/logger.h"

namespace py = pybind11;

using namespace tellcore;
using namespace tellcore::core;
using namespace tellcore::client;

namespace {

void bind_constants(py::module& m) {
    py::module c = m.def_submodule("constants", "TELLSTICK_* constants");

#define TELLCORE_EXPORT_CONSTANT(NAME) c.attr(#NAME) = constants::NAME

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TURNON);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TURNOFF);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_BELL);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TOGGLE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DIM);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_LEARN);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_EXECUTE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_UP);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DOWN);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_STOP);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TEMPERATURE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_HUMIDITY);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_RAINRATE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_RAINTOTAL);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_WINDDIRECTION);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_WINDAVERAGE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_WINDGUST);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_SUCCESS);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_NOT_FOUND);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_PERMISSION_DENIED);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_DEVICE_NOT_FOUND);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_METHOD_NOT_SUPPORTED);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_COMMUNICATION);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_CONNECTING_SERVICE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_UNKNOWN_RESPONSE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_SYNTAX);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_BROKEN_PIPE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_COMMUNICATING_SERVICE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_CONFIG_SYNTAX);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_ERROR_UNKNOWN);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TYPE_DEVICE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TYPE_GROUP);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_TYPE_SCENE);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CONTROLLER_TELLSTICK);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CONTROLLER_TELLSTICK_DUO);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CONTROLLER_TELLSTICK_NET);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DEVICE_ADDED);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DEVICE_CHANGED);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DEVICE_REMOVED);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_DEVICE_STATE_CHANGED);

    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_NAME);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_PROTOCOL);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_MODEL);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_METHOD);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_AVAILABLE);
    TELLCORE_EXPORT_CONSTANT(TELLSTICK_CHANGE_FIRMWARE);

#undef TELLCORE_EXPORT_CONSTANT
}

void bind_errors(py::module& m) {
    static py::exception<TellcoreError> baseError(m, "TellcoreError");
    static py::exception<NativeCallError> telldusError(m, "TelldusError",
                                                       baseError.ptr());
    static py::exception<LoadError> loadError(m, "LoadError", baseError.ptr());
    static py::exception<NotSupportedError> notSupportedError(
        m, "NotSupportedError", baseError.ptr());

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) {
                std::rethrow_exception(p);
            }
        } catch (const NativeCallError& e) {
            py::object type = py::reinterpret_borrow<py::object>(telldusError.ptr());
            py::object instance = type(e.what());
            instance.attr("error") = e.code();
            PyErr_SetObject(telldusError.ptr(), instance.ptr());
        } catch (const LoadError& e) {
            PyErr_SetString(loadError.ptr(), e.what());
        } catch (const NotSupportedError& e) {
            PyErr_SetString(notSupportedError.ptr(), e.what());
        } catch (const ContractViolation& e) {
            PyErr_SetString(PyExc_RuntimeError, e.what());
        }
    });
}

void bind_dispatchers(py::module& m) {
    py::class_<CallbackDispatcher, std::shared_ptr<CallbackDispatcher>>(
        m, "CallbackDispatcher");

    py::class_<DirectCallbackDispatcher, CallbackDispatcher,
               std::shared_ptr<DirectCallbackDispatcher>>(
        m, "DirectCallbackDispatcher",
        "Runs callbacks on the thread of the native library")
        .def(py::init<>());

    py::class_<QueuedCallbackDispatcher, CallbackDispatcher,
               std::shared_ptr<QueuedCallbackDispatcher>>(
        m, "QueuedCallbackDispatcher",
        "Queues callbacks until the application processes them")
        .def(py::init<>())
        .def("process_callback",
             py::overload_cast<bool>(&QueuedCallbackDispatcher::processOne),
             py::arg("block") = true,
             py::call_guard<py::gil_scoped_release>(),
             "Deliver the oldest queued callback")
        .def("process_callback_timeout",
             py::overload_cast<std::chrono::milliseconds>(
                 &QueuedCallbackDispatcher::processOne),
             py::arg("timeout"), py::call_guard<py::gil_scoped_release>(),
             "Deliver the oldest queued callback, waiting at most timeout")
        .def("process_pending_callbacks",
             &QueuedCallbackDispatcher::processAllPending,
             py::call_guard<py::gil_scoped_release>(),
             "Deliver every queued callback")
        .def_property_readonly("pending", &QueuedCallbackDispatcher::pendingCount);
}

void bind_library(py::module& m) {
    py::class_<SensorInfo>(m, "SensorInfo")
        .def_readonly("protocol", &SensorInfo::protocol)
        .def_readonly("model", &SensorInfo::model)
        .def_readonly("id", &SensorInfo::id)
        .def_readonly("datatypes", &SensorInfo::dataTypes);

    py::class_<SensorReading>(m, "SensorReading")
        .def_readonly("value", &SensorReading::value)
        .def_readonly("timestamp", &SensorReading::timestamp);

    py::class_<ControllerInfo>(m, "ControllerInfo")
        .def_readonly("id", &ControllerInfo::id)
        .def_readonly("type", &ControllerInfo::type)
        .def_readonly("name", &ControllerInfo::name)
        .def_readonly("available", &ControllerInfo::available);

    py::class_<Library, std::shared_ptr<Library>>(m, "Library")
        .def(py::init<const std::string&, std::shared_ptr<CallbackDispatcher>>(),
             py::arg("name") = "", py::arg("callback_dispatcher") = nullptr)
        .def("turn_on", &Library::turnOn)
        .def("turn_off", &Library::turnOff)
        .def("bell", &Library::bell)
        .def("dim", &Library::dim)
        .def("execute", &Library::execute)
        .def("up", &Library::up)
        .def("down", &Library::down)
        .def("stop", &Library::stop)
        .def("learn", &Library::learn)
        .def("methods", &Library::methods)
        .def("last_sent_command", &Library::lastSentCommand)
        .def("last_sent_value", &Library::lastSentValue)
        .def("get_number_of_devices", &Library::getNumberOfDevices)
        .def("get_device_id", &Library::getDeviceId)
        .def("get_device_type", &Library::getDeviceType)
        .def("get_name", &Library::getName)
        .def("set_name", [](Library& l, int id, const std::string& name) {
            l.setName(id, name);
        })
        .def("get_protocol", &Library::getProtocol)
        .def("set_protocol", [](Library& l, int id, const std::string& protocol) {
            l.setProtocol(id, protocol);
        })
        .def("get_model", &Library::getModel)
        .def("set_model", [](Library& l, int id, const std::string& model) {
            l.setModel(id, model);
        })
        .def("get_device_parameter",
             [](Library& l, int id, const std::string& name,
                const std::string& defaultValue) {
                 return l.getDeviceParameter(id, name, defaultValue);
             })
        .def("set_device_parameter",
             [](Library& l, int id, const std::string& name,
                const std::string& value) {
                 l.setDeviceParameter(id, name, value);
             })
        .def("add_device", &Library::addDevice)
        .def("remove_device", &Library::removeDevice)
        .def("send_raw_command",
             [](Library& l, const std::string& command, int reserved) {
                 return l.sendRawCommand(command, reserved);
             },
             py::arg("command"), py::arg("reserved") = 0)
        .def("connect_tellstick_controller",
             [](Library& l, int vid, int pid, const std::string& serial) {
                 l.connectTellStickController(vid, pid, serial);
             })
        .def("disconnect_tellstick_controller",
             [](Library& l, int vid, int pid, const std::string& serial) {
                 l.disconnectTellStickController(vid, pid, serial);
             })
        .def("sensor", &Library::sensor)
        .def("sensor_value",
             [](Library& l, const std::string& protocol, const std::string& model,
                int id, int datatype) {
                 return l.sensorValue(protocol, model, id, datatype);
             })
        .def("controller", &Library::controller)
        .def("controller_value",
             [](Library& l, int id, const std::string& name) {
                 return l.controllerValue(id, name);
             })
        .def("set_controller_value",
             [](Library& l, int id, const std::string& name,
                const std::string& value) { l.setControllerValue(id, name, value); })
        .def("remove_controller", &Library::removeController)
        .def("get_error_string", &Library::getErrorString)
        .def("register_device_event", &Library::registerDeviceEvent)
        .def("register_device_change_event", &Library::registerDeviceChangeEvent)
        .def("register_raw_device_event", &Library::registerRawDeviceEvent)
        .def("register_sensor_event", &Library::registerSensorEvent)
        .def("register_controller_event", &Library::registerControllerEvent)
        .def("unregister_callback", &Library::unregisterCallback)
        .def_property_readonly("callback_dispatcher", &Library::callbackDispatcher);
}

void bind_client(py::module& m) {
    py::enum_<DeviceParameter>(m, "DeviceParameter")
        .value("DEVICES", DeviceParameter::DEVICES)
        .value("HOUSE", DeviceParameter::HOUSE)
        .value("UNIT", DeviceParameter::UNIT)
        .value("CODE", DeviceParameter::CODE)
        .value("SYSTEM", DeviceParameter::SYSTEM)
        .value("UNITS", DeviceParameter::UNITS)
        .value("FADE", DeviceParameter::FADE);

    py::class_<Device, std::shared_ptr<Device>>(m, "Device")
        .def_property_readonly("id", &Device::id)
        .def_property("name", &Device::name, &Device::setName)
        .def_property("protocol", &Device::protocol, &Device::setProtocol)
        .def_property("model", &Device::model, &Device::setModel)
        .def_property_readonly("type", &Device::type)
        .def("parameters", &Device::parameters)
        .def("get_parameter",
             py::overload_cast<const std::string&>(&Device::getParameter,
                                                    py::const_))
        .def("set_parameter",
             py::overload_cast<const std::string&, const std::string&>(
                 &Device::setParameter))
        .def("remove", &Device::remove)
        .def("turn_on", &Device::turnOn)
        .def("turn_off", &Device::turnOff)
        .def("bell", &Device::bell)
        .def("dim", &Device::dim)
        .def("execute", &Device::execute)
        .def("up", &Device::up)
        .def("down", &Device::down)
        .def("stop", &Device::stop)
        .def("learn", &Device::learn)
        .def("methods", &Device::methods)
        .def("last_sent_command", &Device::lastSentCommand)
        .def("last_sent_value", &Device::lastSentValue);

    py::class_<DeviceGroup, Device, std::shared_ptr<DeviceGroup>>(m, "DeviceGroup")
        .def("add_to_group",
             py::overload_cast<const std::vector<int>&>(&DeviceGroup::addToGroup))
        .def("add_to_group", py::overload_cast<int>(&DeviceGroup::addToGroup))
        .def("remove_from_group",
             py::overload_cast<const std::vector<int>&>(
                 &DeviceGroup::removeFromGroup))
        .def("remove_from_group",
             py::overload_cast<int>(&DeviceGroup::removeFromGroup))
        .def("devices_in_group", &DeviceGroup::devicesInGroup);

    py::class_<SensorValue>(m, "SensorValue")
        .def_property_readonly("datatype", &SensorValue::datatype)
        .def_property_readonly("value", &SensorValue::value)
        .def_property_readonly("timestamp", &SensorValue::timestamp);

    py::class_<Sensor>(m, "Sensor")
        .def_property_readonly("protocol", &Sensor::protocol)
        .def_property_readonly("model", &Sensor::model)
        .def_property_readonly("id", &Sensor::id)
        .def_property_readonly("datatypes", &Sensor::datatypes)
        .def("has_value", &Sensor::has)
        .def("value", &Sensor::value)
        .def("has_temperature", &Sensor::hasTemperature)
        .def("temperature", &Sensor::temperature)
        .def("has_humidity", &Sensor::hasHumidity)
        .def("humidity", &Sensor::humidity)
        .def("has_rainrate", &Sensor::hasRainRate)
        .def("rainrate", &Sensor::rainRate)
        .def("has_raintotal", &Sensor::hasRainTotal)
        .def("raintotal", &Sensor::rainTotal)
        .def("has_winddirection", &Sensor::hasWindDirection)
        .def("winddirection", &Sensor::windDirection)
        .def("has_windaverage", &Sensor::hasWindAverage)
        .def("windaverage", &Sensor::windAverage)
        .def("has_windgust", &Sensor::hasWindGust)
        .def("windgust", &Sensor::windGust);

    py::enum_<ControllerProperty>(m, "ControllerProperty")
        .value("NAME", ControllerProperty::NAME)
        .value("SERIAL", ControllerProperty::SERIAL)
        .value("FIRMWARE", ControllerProperty::FIRMWARE)
        .value("AVAILABLE", ControllerProperty::AVAILABLE);

    py::class_<Controller>(m, "Controller")
        .def_property_readonly("id", &Controller::id)
        .def_property_readonly("type", &Controller::type)
        .def_property_readonly("name", &Controller::name)
        .def_property_readonly("available", &Controller::available)
        .def("property", &Controller::property)
        .def("set_property", &Controller::setProperty)
        .def("serial", &Controller::serial)
        .def("firmware", &Controller::firmware)
        .def("set_name", &Controller::setName)
        .def("remove", &Controller::remove);

    py::class_<TelldusCore>(m, "TelldusCore")
        .def(py::init<const std::string&, std::shared_ptr<CallbackDispatcher>>(),
             py::arg("library_path") = "", py::arg("callback_dispatcher") = nullptr)
        .def("devices", &TelldusCore::devices)
        .def("sensors", &TelldusCore::sensors)
        .def("controllers", &TelldusCore::controllers)
        .def("add_device", &TelldusCore::addDevice, py::arg("name"),
             py::arg("protocol"), py::arg("model") = py::none(),
             py::arg("parameters") = std::map<std::string, std::string>())
        .def("add_group", &TelldusCore::addGroup, py::arg("name"),
             py::arg("devices"))
        .def("send_raw_command", &TelldusCore::sendRawCommand,
             py::arg("command"), py::arg("reserved") = 0)
        .def("connect_controller", &TelldusCore::connectController)
        .def("disconnect_controller", &TelldusCore::disconnectController)
        .def("register_device_event", &TelldusCore::registerDeviceEvent)
        .def("register_device_change_event",
             &TelldusCore::registerDeviceChangeEvent)
        .def("register_raw_device_event", &TelldusCore::registerRawDeviceEvent)
        .def("register_sensor_event", &TelldusCore::registerSensorEvent)
        .def("register_controller_event", &TelldusCore::registerControllerEvent)
        .def("unregister_callback", &TelldusCore::unregisterCallback)
        .def_property_readonly("callback_dispatcher",
                               &TelldusCore::callbackDispatcher);
}

} // namespace

PYBIND11_MODULE(pytellcore, m) {
    m.doc() = "Python bindings for the Telldus Core home automation library";

    m.def(
        "set_log_level",
        [](const std::string& level) {
            common::setLogLevel(common::parseLogLevel(level));
        },
        py::arg("level"), "Set the log level of the binding");

    m.def(
        "set_string_encoding",
        [](const std::string& encoding) {
            StringEncoding::getInstance().setEncoding(encoding);
        },
        py::arg("encoding"), "Set the encoding of strings passed to the library");

    bind_constants(m);
    bind_errors(m);
    bind_dispatchers(m);
    bind_library(m);
    bind_client(m);
}
