#include <gtest/gtest.h>

#include "../framework/mock_telldus_core.h"

#include "tellcore/core/function_table.h"

#include <common/logger.h>

#include <set>
#include <string>

using namespace tellcore::core;
using tellcore::testing::MockModuleLoader;
using tellcore::testing::MockTelldusCore;

class FunctionTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        tellcore::common::initLogger("", tellcore::common::LogLevel::WARN);
    }

    ::testing::NiceMock<MockTelldusCore> mock_;
    MockModuleLoader loader_;
};

TEST_F(FunctionTableTest, DescriptorTableIsOrderedById) {
    const auto& entries = functionEntries();
    ASSERT_EQ(entries.size(), kFunctionCount);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ(static_cast<std::size_t>(entries[i].id), i) << entries[i].name;
    }
}

TEST_F(FunctionTableTest, NamesAreUniqueNativeSymbols) {
    std::set<std::string> names;
    for (const auto& entry : functionEntries()) {
        EXPECT_EQ(std::string(entry.name).rfind("td", 0), 0u) << entry.name;
        EXPECT_TRUE(names.insert(entry.name).second) << entry.name;
    }
}

TEST_F(FunctionTableTest, PoliciesFollowReturnKinds) {
    for (const auto& entry : functionEntries()) {
        switch (entry.returnKind) {
        case ReturnKind::STRING:
            EXPECT_EQ(entry.policy, ErrorPolicy::RELEASE_STRING) << entry.name;
            break;
        case ReturnKind::BOOLEAN:
            EXPECT_EQ(entry.policy, ErrorPolicy::CHECK_BOOLEAN) << entry.name;
            break;
        case ReturnKind::NONE:
            EXPECT_EQ(entry.policy, ErrorPolicy::NONE) << entry.name;
            break;
        case ReturnKind::INTEGER:
            EXPECT_EQ(entry.policy, ErrorPolicy::CHECK_INTEGER) << entry.name;
            break;
        }
    }
}

TEST_F(FunctionTableTest, SpecificEntries) {
    EXPECT_STREQ(functionEntry(FunctionId::DIM).name, "tdDim");
    EXPECT_EQ(functionEntry(FunctionId::DIM).parameters,
              (std::vector<ParamKind>{ParamKind::INTEGER, ParamKind::BYTE}));

    EXPECT_STREQ(functionEntry(FunctionId::REMOVE_DEVICE).name, "tdRemoveDevice");
    EXPECT_EQ(functionEntry(FunctionId::REMOVE_DEVICE).returnKind, ReturnKind::BOOLEAN);

    const auto& sensor = functionEntry(FunctionId::SENSOR);
    ASSERT_EQ(sensor.parameters.size(), 6u);
    EXPECT_EQ(sensor.parameters[0], ParamKind::TEXT_BUFFER);
    EXPECT_EQ(sensor.parameters[4], ParamKind::INT_OUT);

    EXPECT_EQ(functionEntry(FunctionId::REGISTER_SENSOR_EVENT).parameters,
              (std::vector<ParamKind>{ParamKind::EVENT_CALLBACK, ParamKind::CONTEXT}));
}

TEST_F(FunctionTableTest, BindResolvesEverySymbol) {
    FunctionTable table;
    int module = 0;
    EXPECT_EQ(table.bind(loader_, &module), kFunctionCount);
    EXPECT_EQ(table.boundCount(), kFunctionCount);
    for (const auto& entry : functionEntries()) {
        EXPECT_TRUE(table.has(entry.id)) << entry.name;
    }
}

TEST_F(FunctionTableTest, MissingSymbolsStayUnbound) {
    loader_.missingSymbols = {"tdController", "tdControllerValue",
                              "tdSetControllerValue", "tdRemoveController"};
    FunctionTable table;
    int module = 0;
    EXPECT_EQ(table.bind(loader_, &module), kFunctionCount - 4);
    EXPECT_FALSE(table.has(FunctionId::CONTROLLER));
    EXPECT_TRUE(table.has(FunctionId::SENSOR));

    try {
        table.get<FunctionId::CONTROLLER>();
        FAIL() << "Expected NotSupportedError";
    } catch (const NotSupportedError& e) {
        EXPECT_EQ(e.functionName(), "tdController");
    }
}

TEST_F(FunctionTableTest, BoundEntryForwardsToLibrary) {
    FunctionTable table;
    int module = 0;
    table.bind(loader_, &module);

    EXPECT_CALL(mock_, tdDim(7, 128)).WillOnce(::testing::Return(0));
    EXPECT_EQ(table.get<FunctionId::DIM>()(7, 128), 0);
}

TEST_F(FunctionTableTest, ClearUnbindsEverything) {
    FunctionTable table;
    int module = 0;
    table.bind(loader_, &module);
    table.clear();
    EXPECT_EQ(table.boundCount(), 0u);
    EXPECT_THROW(table.get<FunctionId::INIT>(), NotSupportedError);
}
