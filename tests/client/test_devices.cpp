#include <gtest/gtest.h>

#include "../framework/telldus_test_base.h"

#include "tellcore/client/telldus_core.h"
#include "tellcore/core/constants.h"

#include <algorithm>
#include <iterator>
#include <map>
#include <mutex>

using namespace tellcore::client;
using namespace tellcore::constants;
using tellcore::core::NativeCallError;
using tellcore::testing::MockTelldusCore;
using tellcore::testing::TelldusTestBase;
using ::testing::_;
using ::testing::Return;

namespace {

/**
 * @brief In-memory device registry behind the device entry points
 */
class DeviceStore {
public:
    struct Entry {
        std::string name;
        std::string protocol;
        std::string model;
        std::map<std::string, std::string> parameters;
    };

    void add(int id, Entry entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        devices_[id] = std::move(entry);
        nextId_ = std::max(nextId_, id + 1);
    }

    bool contains(int id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.count(id) != 0;
    }

    std::map<std::string, std::string> parameters(int id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return devices_.at(id).parameters;
    }

    void install(MockTelldusCore& mock) {
        ON_CALL(mock, tdGetNumberOfDevices()).WillByDefault([this] {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(devices_.size());
        });
        ON_CALL(mock, tdGetDeviceId(_)).WillByDefault([this](int index) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (index < 0 || index >= static_cast<int>(devices_.size())) {
                return TELLSTICK_ERROR_DEVICE_NOT_FOUND;
            }
            return std::next(devices_.begin(), index)->first;
        });
        ON_CALL(mock, tdGetDeviceType(_)).WillByDefault([this](int id) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = devices_.find(id);
            if (it == devices_.end()) {
                return TELLSTICK_ERROR_DEVICE_NOT_FOUND;
            }
            return it->second.protocol == "group" ? TELLSTICK_TYPE_GROUP
                                                  : TELLSTICK_TYPE_DEVICE;
        });

        ON_CALL(mock, tdGetName(_)).WillByDefault([this, &mock](int id) {
            return mock.makeString(field(id, &Entry::name));
        });
        ON_CALL(mock, tdGetProtocol(_)).WillByDefault([this, &mock](int id) {
            return mock.makeString(field(id, &Entry::protocol));
        });
        ON_CALL(mock, tdGetModel(_)).WillByDefault([this, &mock](int id) {
            return mock.makeString(field(id, &Entry::model));
        });
        ON_CALL(mock, tdSetName(_, _)).WillByDefault([this](int id, const char* value) {
            return setField(id, &Entry::name, value);
        });
        ON_CALL(mock, tdSetProtocol(_, _)).WillByDefault([this](int id, const char* value) {
            return setField(id, &Entry::protocol, value);
        });
        ON_CALL(mock, tdSetModel(_, _)).WillByDefault([this](int id, const char* value) {
            return setField(id, &Entry::model, value);
        });

        ON_CALL(mock, tdGetDeviceParameter(_, _, _))
            .WillByDefault([this, &mock](int id, const char* name, const char* defaultValue) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto device = devices_.find(id);
                if (device != devices_.end()) {
                    auto it = device->second.parameters.find(name);
                    if (it != device->second.parameters.end()) {
                        return mock.makeString(it->second);
                    }
                }
                return mock.makeString(defaultValue);
            });
        // Like the service, an empty value removes the parameter
        ON_CALL(mock, tdSetDeviceParameter(_, _, _))
            .WillByDefault([this](int id, const char* name, const char* value) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto device = devices_.find(id);
                if (device == devices_.end()) {
                    return false;
                }
                if (*value == '\0') {
                    device->second.parameters.erase(name);
                } else {
                    device->second.parameters[name] = value;
                }
                return true;
            });

        ON_CALL(mock, tdAddDevice()).WillByDefault([this] {
            std::lock_guard<std::mutex> lock(mutex_);
            const int id = nextId_++;
            devices_[id] = Entry{};
            return id;
        });
        ON_CALL(mock, tdRemoveDevice(_)).WillByDefault([this](int id) {
            std::lock_guard<std::mutex> lock(mutex_);
            return devices_.erase(id) != 0;
        });
    }

private:
    std::string field(int id, std::string Entry::*member) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(id);
        return it == devices_.end() ? std::string() : it->second.*member;
    }

    bool setField(int id, std::string Entry::*member, const char* value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            return false;
        }
        it->second.*member = value;
        return true;
    }

    mutable std::mutex mutex_;
    std::map<int, Entry> devices_;
    int nextId_ = 1;
};

} // namespace

class DeviceTest : public TelldusTestBase {
protected:
    void SetUp() override {
        TelldusTestBase::SetUp();
        store_.install(mock());
    }

    DeviceStore store_;
};

TEST_F(DeviceTest, EnumerateDevices) {
    for (int index = 0; index < 3; ++index) {
        store_.add(index * 3, {"device" + std::to_string(index), "arctech",
                               "codeswitch", {}});
    }

    TelldusCore core;
    auto devices = core.devices();
    ASSERT_EQ(devices.size(), 3u);
    for (int index = 0; index < 3; ++index) {
        EXPECT_EQ(devices[index]->id(), index * 3);
        EXPECT_EQ(devices[index]->name(), "device" + std::to_string(index));
        EXPECT_EQ(devices[index]->protocol(), "arctech");
        EXPECT_EQ(devices[index]->model(), "codeswitch");
    }
}

TEST_F(DeviceTest, GroupDevicesAreWrappedAsGroups) {
    store_.add(1, {"lamp", "arctech", "selflearning-switch", {}});
    store_.add(2, {"all", "group", "", {{"devices", "1"}}});

    TelldusCore core;
    auto devices = core.devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(std::dynamic_pointer_cast<DeviceGroup>(devices[0]), nullptr);
    auto group = std::dynamic_pointer_cast<DeviceGroup>(devices[1]);
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->memberIds(), std::vector<int>({1}));
}

TEST_F(DeviceTest, CommandsReachTheLibrary) {
    auto actor = [](int id) {
        return id == 3 ? TELLSTICK_SUCCESS : TELLSTICK_ERROR_DEVICE_NOT_FOUND;
    };
    ON_CALL(mock(), tdTurnOn(_)).WillByDefault(actor);
    ON_CALL(mock(), tdTurnOff(_)).WillByDefault(actor);
    ON_CALL(mock(), tdExecute(_)).WillByDefault(actor);
    ON_CALL(mock(), tdUp(_)).WillByDefault(actor);
    ON_CALL(mock(), tdDown(_)).WillByDefault(actor);
    ON_CALL(mock(), tdStop(_)).WillByDefault(actor);
    ON_CALL(mock(), tdLearn(_)).WillByDefault(actor);
    ON_CALL(mock(), tdBell(_)).WillByDefault(Return(TELLSTICK_ERROR_METHOD_NOT_SUPPORTED));
    EXPECT_CALL(mock(), tdDim(3, 50)).WillOnce(Return(TELLSTICK_SUCCESS));

    auto library = std::make_shared<tellcore::core::Library>();
    Device device(3, library);
    device.turnOn();
    device.turnOff();
    device.dim(50);
    device.execute();
    device.up();
    device.down();
    device.stop();
    device.learn();

    try {
        device.bell();
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.code(), TELLSTICK_ERROR_METHOD_NOT_SUPPORTED);
    }

    Device missing(4, library);
    try {
        missing.turnOn();
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.code(), TELLSTICK_ERROR_DEVICE_NOT_FOUND);
    }
}

TEST_F(DeviceTest, MethodQueries) {
    const int supported = TELLSTICK_TURNON | TELLSTICK_TURNOFF | TELLSTICK_DIM;
    EXPECT_CALL(mock(), tdMethods(3, supported))
        .WillOnce(Return(TELLSTICK_TURNON | TELLSTICK_TURNOFF));
    EXPECT_CALL(mock(), tdLastSentCommand(3, supported)).WillOnce(Return(TELLSTICK_DIM));
    EXPECT_CALL(mock(), tdLastSentValue(3)).WillOnce([this](int) {
        return mock().makeString("128");
    });

    Device device(3, std::make_shared<tellcore::core::Library>());
    EXPECT_EQ(device.methods(supported), TELLSTICK_TURNON | TELLSTICK_TURNOFF);
    EXPECT_EQ(device.lastSentCommand(supported), TELLSTICK_DIM);
    EXPECT_EQ(device.lastSentValue(), "128");
    EXPECT_EQ(mock().outstandingStrings(), 0u);
}

TEST_F(DeviceTest, ParametersReportOnlyWhatIsSet) {
    store_.add(7, {"switch", "arctech", "codeswitch", {{"house", "A"}, {"unit", "3"}}});

    Device device(7, std::make_shared<tellcore::core::Library>());
    const std::map<std::string, std::string> expected = {{"house", "A"}, {"unit", "3"}};
    EXPECT_EQ(device.parameters(), expected);
    EXPECT_EQ(device.getParameter(DeviceParameter::HOUSE), std::optional<std::string>("A"));
    EXPECT_FALSE(device.getParameter("code").has_value());

    device.setParameter(DeviceParameter::CODE, "0110");
    EXPECT_EQ(device.getParameter("code"), std::optional<std::string>("0110"));
}

TEST_F(DeviceTest, AddDeviceConfiguresEverything) {
    TelldusCore core;
    auto device = core.addDevice("Hall", "arctech", std::string("selflearning-switch"),
                                 {{"house", "12345"}, {"unit", "1"}});

    EXPECT_EQ(device->name(), "Hall");
    EXPECT_EQ(device->protocol(), "arctech");
    EXPECT_EQ(device->model(), "selflearning-switch");
    const std::map<std::string, std::string> expected = {{"house", "12345"}, {"unit", "1"}};
    EXPECT_EQ(store_.parameters(device->id()), expected);
}

TEST_F(DeviceTest, FailedAddDeviceIsRolledBack) {
    EXPECT_CALL(mock(), tdSetProtocol(_, _)).WillOnce(Return(false));

    TelldusCore core;
    int createdId = 0;
    EXPECT_CALL(mock(), tdAddDevice()).WillOnce([&] {
        createdId = 42;
        store_.add(createdId, {});
        return createdId;
    });
    EXPECT_CALL(mock(), tdRemoveDevice(42)).WillOnce(Return(true));

    EXPECT_THROW(core.addDevice("Broken", "nosuchprotocol"), NativeCallError);
    EXPECT_EQ(createdId, 42);
}

TEST_F(DeviceTest, RemoveDevice) {
    store_.add(5, {"old", "arctech", "codeswitch", {}});
    Device device(5, std::make_shared<tellcore::core::Library>());
    device.remove();
    EXPECT_FALSE(store_.contains(5));
    EXPECT_THROW(device.remove(), NativeCallError);
}

TEST_F(DeviceTest, GroupMembership) {
    TelldusCore core;
    auto group = core.addGroup("test", {1, 2, 3, 4});
    EXPECT_EQ(group->protocol(), "group");
    EXPECT_EQ(store_.parameters(group->id()).at("devices"), "1,2,3,4");

    group->addToGroup(5);
    EXPECT_EQ(store_.parameters(group->id()).at("devices"), "1,2,3,4,5");

    group->addToGroup(std::vector<int>{5, 1});
    EXPECT_EQ(store_.parameters(group->id()).at("devices"), "1,2,3,4,5");

    group->removeFromGroup(std::vector<int>{3, 2, 6, 2, 1});
    EXPECT_EQ(store_.parameters(group->id()).at("devices"), "4,5");

    group->removeFromGroup(4);
    EXPECT_EQ(store_.parameters(group->id()).at("devices"), "5");

    group->removeFromGroup(std::vector<int>{5});
    EXPECT_TRUE(store_.parameters(group->id()).empty());
    EXPECT_TRUE(group->memberIds().empty());
}

TEST_F(DeviceTest, GroupDeduplicatesInitialMembers) {
    TelldusCore core;
    auto group = core.addGroup("dupes", {2, 2, 1});
    EXPECT_EQ(group->memberIds(), std::vector<int>({2, 1}));
}

TEST_F(DeviceTest, DevicesInGroupResolveMembers) {
    store_.add(1, {"a", "arctech", "codeswitch", {}});
    store_.add(2, {"b", "arctech", "codeswitch", {}});

    TelldusCore core;
    auto group = core.addGroup("pair", {1, 2});
    auto members = group->devicesInGroup();
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0]->name(), "a");
    EXPECT_EQ(members[1]->name(), "b");
}

TEST(DeviceGroupParsingTest, MemberListParsing) {
    tellcore::common::initLogger("", tellcore::common::LogLevel::OFF);
    EXPECT_EQ(DeviceGroup::parseMemberList("1,2,3"), std::vector<int>({1, 2, 3}));
    EXPECT_EQ(DeviceGroup::parseMemberList(" 4 , 5,,x, 4"), std::vector<int>({4, 5}));
    EXPECT_TRUE(DeviceGroup::parseMemberList("").empty());
    EXPECT_TRUE(DeviceGroup::parseMemberList("  ").empty());
    EXPECT_EQ(DeviceGroup::formatMemberList({7, 8}), "7,8");
    EXPECT_EQ(DeviceGroup::formatMemberList({}), "");
}

TEST(DeviceParameterTest, NativeNames) {
    std::vector<std::string> names;
    for (auto parameter : Device::knownParameters()) {
        names.push_back(deviceParameterName(parameter));
    }
    EXPECT_EQ(names, (std::vector<std::string>{"devices", "house", "unit", "code",
                                               "system", "units", "fade"}));
}
