#pragma once

#include "tellcore/core/library.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tellcore {
namespace client {

/**
 * @brief Device parameters known to Telldus Core
 */
enum class DeviceParameter { DEVICES, HOUSE, UNIT, CODE, SYSTEM, UNITS, FADE };

/**
 * @brief Native name of a parameter, e.g. "house"
 */
std::string deviceParameterName(DeviceParameter parameter);

/**
 * @brief A device configured in Telldus Core
 */
class Device {
public:
    Device(int id, std::shared_ptr<core::Library> library);
    virtual ~Device() = default;

    /**
     * @brief Wrap an existing device id, as a DeviceGroup if the native type
     * is TELLSTICK_TYPE_GROUP
     */
    static std::shared_ptr<Device> create(int id,
                                          std::shared_ptr<core::Library> library);

    /**
     * @brief All parameters in DeviceParameter order
     */
    static const std::vector<DeviceParameter>& knownParameters();

    int id() const { return id_; }

    std::string name() const;
    void setName(const std::string& name);
    std::string protocol() const;
    void setProtocol(const std::string& protocol);
    std::string model() const;
    void setModel(const std::string& model);
    int type() const;

    /**
     * @brief Every known parameter that is set on the device
     */
    std::map<std::string, std::string> parameters() const;

    /**
     * @return Empty if the parameter is not set
     */
    std::optional<std::string> getParameter(const std::string& name) const;
    std::optional<std::string> getParameter(DeviceParameter parameter) const;

    void setParameter(const std::string& name, const std::string& value);
    void setParameter(DeviceParameter parameter, const std::string& value);

    void remove();

    void turnOn();
    void turnOff();
    void bell();
    void dim(std::uint8_t level);
    void execute();
    void up();
    void down();
    void stop();
    void learn();

    int methods(int methodsSupported) const;
    int lastSentCommand(int methodsSupported) const;
    std::string lastSentValue() const;

protected:
    std::shared_ptr<core::Library> library_;

private:
    int id_;
};

/**
 * @brief A device of type group; members are kept in the "devices" parameter
 * as a comma separated list of ids
 */
class DeviceGroup : public Device {
public:
    using Device::Device;

    /**
     * @brief Append devices that are not members yet
     */
    void addToGroup(const std::vector<int>& deviceIds);
    void addToGroup(int deviceId);

    /**
     * @brief Remove members; ids that are not members are ignored
     */
    void removeFromGroup(const std::vector<int>& deviceIds);
    void removeFromGroup(int deviceId);

    std::vector<int> memberIds() const;

    std::vector<std::shared_ptr<Device>> devicesInGroup() const;

    /**
     * @brief Parse a "devices" parameter value
     */
    static std::vector<int> parseMemberList(const std::string& value);

    static std::string formatMemberList(const std::vector<int>& deviceIds);

private:
    void storeMembers(const std::vector<int>& deviceIds);
};

} // namespace client
} // namespace tellcore
