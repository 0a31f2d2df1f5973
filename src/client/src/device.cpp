#include "tellcore/client/device.h"
#include "tellcore/core/constants.h"

#include "common/logger.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace tellcore {
namespace client {

namespace {

// Returned by tdGetDeviceParameter when the parameter is not set
constexpr const char* kUnsetParameter = "$%!)(INVALID)(!%$";

constexpr const char* kDevicesParameter = "devices";

void appendUnique(std::vector<int>& ids, int id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace

std::string deviceParameterName(DeviceParameter parameter) {
    switch (parameter) {
        case DeviceParameter::DEVICES:
            return kDevicesParameter;
        case DeviceParameter::HOUSE:
            return "house";
        case DeviceParameter::UNIT:
            return "unit";
        case DeviceParameter::CODE:
            return "code";
        case DeviceParameter::SYSTEM:
            return "system";
        case DeviceParameter::UNITS:
            return "units";
        case DeviceParameter::FADE:
            return "fade";
    }
    throw std::invalid_argument("Unknown device parameter");
}

Device::Device(int id, std::shared_ptr<core::Library> library)
    : library_(std::move(library)), id_(id) {
    if (!library_) {
        throw std::invalid_argument("Device requires a library");
    }
}

std::shared_ptr<Device> Device::create(int id,
                                       std::shared_ptr<core::Library> library) {
    if (library->getDeviceType(id) == constants::TELLSTICK_TYPE_GROUP) {
        return std::make_shared<DeviceGroup>(id, std::move(library));
    }
    return std::make_shared<Device>(id, std::move(library));
}

const std::vector<DeviceParameter>& Device::knownParameters() {
    static const std::vector<DeviceParameter> parameters = {
        DeviceParameter::DEVICES, DeviceParameter::HOUSE,
        DeviceParameter::UNIT,    DeviceParameter::CODE,
        DeviceParameter::SYSTEM,  DeviceParameter::UNITS,
        DeviceParameter::FADE};
    return parameters;
}

std::string Device::name() const { return library_->getName(id_); }

void Device::setName(const std::string& name) { library_->setName(id_, name); }

std::string Device::protocol() const { return library_->getProtocol(id_); }

void Device::setProtocol(const std::string& protocol) {
    library_->setProtocol(id_, protocol);
}

std::string Device::model() const { return library_->getModel(id_); }

void Device::setModel(const std::string& model) {
    library_->setModel(id_, model);
}

int Device::type() const { return library_->getDeviceType(id_); }

std::map<std::string, std::string> Device::parameters() const {
    std::map<std::string, std::string> result;
    for (DeviceParameter parameter : knownParameters()) {
        if (auto value = getParameter(parameter)) {
            result[deviceParameterName(parameter)] = *value;
        }
    }
    return result;
}

std::optional<std::string> Device::getParameter(const std::string& name) const {
    std::string value =
        library_->getDeviceParameter(id_, name, core::TextArg(kUnsetParameter));
    if (value == kUnsetParameter) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> Device::getParameter(DeviceParameter parameter) const {
    return getParameter(deviceParameterName(parameter));
}

void Device::setParameter(const std::string& name, const std::string& value) {
    library_->setDeviceParameter(id_, name, value);
}

void Device::setParameter(DeviceParameter parameter, const std::string& value) {
    setParameter(deviceParameterName(parameter), value);
}

void Device::remove() { library_->removeDevice(id_); }

void Device::turnOn() { library_->turnOn(id_); }

void Device::turnOff() { library_->turnOff(id_); }

void Device::bell() { library_->bell(id_); }

void Device::dim(std::uint8_t level) { library_->dim(id_, level); }

void Device::execute() { library_->execute(id_); }

void Device::up() { library_->up(id_); }

void Device::down() { library_->down(id_); }

void Device::stop() { library_->stop(id_); }

void Device::learn() { library_->learn(id_); }

int Device::methods(int methodsSupported) const {
    return library_->methods(id_, methodsSupported);
}

int Device::lastSentCommand(int methodsSupported) const {
    return library_->lastSentCommand(id_, methodsSupported);
}

std::string Device::lastSentValue() const {
    return library_->lastSentValue(id_);
}

void DeviceGroup::addToGroup(const std::vector<int>& deviceIds) {
    std::vector<int> members = memberIds();
    for (int id : deviceIds) {
        appendUnique(members, id);
    }
    storeMembers(members);
}

void DeviceGroup::addToGroup(int deviceId) {
    addToGroup(std::vector<int>{deviceId});
}

void DeviceGroup::removeFromGroup(const std::vector<int>& deviceIds) {
    std::vector<int> members = memberIds();
    members.erase(std::remove_if(members.begin(), members.end(),
                                 [&deviceIds](int id) {
                                     return std::find(deviceIds.begin(),
                                                      deviceIds.end(),
                                                      id) != deviceIds.end();
                                 }),
                  members.end());
    storeMembers(members);
}

void DeviceGroup::removeFromGroup(int deviceId) {
    removeFromGroup(std::vector<int>{deviceId});
}

std::vector<int> DeviceGroup::memberIds() const {
    auto value = getParameter(DeviceParameter::DEVICES);
    if (!value) {
        return {};
    }
    return parseMemberList(*value);
}

std::vector<std::shared_ptr<Device>> DeviceGroup::devicesInGroup() const {
    std::vector<std::shared_ptr<Device>> devices;
    for (int id : memberIds()) {
        devices.push_back(Device::create(id, library_));
    }
    return devices;
}

std::vector<int> DeviceGroup::parseMemberList(const std::string& value) {
    std::vector<int> ids;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        item = item.substr(first, item.find_last_not_of(" \t") - first + 1);
        try {
            appendUnique(ids, std::stoi(item));
        } catch (const std::exception&) {
            common::logWarning("Ignoring invalid group member '" + item + "'",
                               "DeviceGroup");
        }
    }
    return ids;
}

std::string DeviceGroup::formatMemberList(const std::vector<int>& deviceIds) {
    std::string result;
    for (int id : deviceIds) {
        if (!result.empty()) {
            result += ",";
        }
        result += std::to_string(id);
    }
    return result;
}

void DeviceGroup::storeMembers(const std::vector<int>& deviceIds) {
    setParameter(DeviceParameter::DEVICES, formatMemberList(deviceIds));
}

} // namespace client
} // namespace tellcore
