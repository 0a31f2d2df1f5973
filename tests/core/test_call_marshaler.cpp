#include <gtest/gtest.h>

#include "../framework/mock_telldus_core.h"

#include "tellcore/core/call_marshaler.h"
#include "tellcore/core/constants.h"
#include "tellcore/core/string_encoding.h"

#include <common/logger.h>

#include <cstring>

using namespace tellcore::core;
using namespace tellcore::constants;
using tellcore::testing::MockModuleLoader;
using tellcore::testing::MockTelldusCore;
using ::testing::_;
using ::testing::Return;

class CallMarshalerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tellcore::common::initLogger("", tellcore::common::LogLevel::WARN);
        mock_.setupDefaultBehavior();
        table_.bind(loader_, &module_);
        StringEncoding::getInstance().setEncoding("utf-8");
    }

    void TearDown() override {
        StringEncoding::getInstance().setEncoding("utf-8");
    }

    ::testing::NiceMock<MockTelldusCore> mock_;
    MockModuleLoader loader_;
    int module_ = 0;
    FunctionTable table_;
    CallMarshaler marshaler_{table_};
};

TEST_F(CallMarshalerTest, IntegerResultIsReturned) {
    EXPECT_CALL(mock_, tdGetNumberOfDevices()).WillOnce(Return(3));
    EXPECT_EQ(marshaler_.invoke<FunctionId::GET_NUMBER_OF_DEVICES>(), 3);
}

TEST_F(CallMarshalerTest, NegativeResultRaisesWithRawCode) {
    EXPECT_CALL(mock_, tdTurnOn(1)).WillOnce(Return(TELLSTICK_ERROR_METHOD_NOT_SUPPORTED));
    try {
        marshaler_.invoke<FunctionId::TURN_ON>(1);
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.code(), TELLSTICK_ERROR_METHOD_NOT_SUPPORTED);
        EXPECT_EQ(e.errorCode(), ErrorCode::METHOD_NOT_SUPPORTED);
    }
}

TEST_F(CallMarshalerTest, UnknownCodeKeepsRawValue) {
    EXPECT_CALL(mock_, tdTurnOff(1)).WillOnce(Return(-42));
    try {
        marshaler_.invoke<FunctionId::TURN_OFF>(1);
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.code(), -42);
        EXPECT_EQ(e.errorCode(), ErrorCode::UNKNOWN);
    }
}

TEST_F(CallMarshalerTest, ErrorDescriptionComesFromLibrary) {
    EXPECT_CALL(mock_, tdGetErrorString(TELLSTICK_ERROR_COMMUNICATION))
        .WillOnce([this](int) { return mock_.makeString("Cable unplugged"); });
    EXPECT_CALL(mock_, tdBell(2)).WillOnce(Return(TELLSTICK_ERROR_COMMUNICATION));

    try {
        marshaler_.invoke<FunctionId::BELL>(2);
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.description(), "Cable unplugged");
    }
    EXPECT_EQ(mock_.outstandingStrings(), 0u);
}

TEST_F(CallMarshalerTest, ErrorDescriptionFallsBackWhenUnavailable) {
    EXPECT_EQ(marshaler_.errorString(TELLSTICK_ERROR_DEVICE_NOT_FOUND),
              "Device not found");
}

TEST_F(CallMarshalerTest, FalseBooleanIsDeviceNotFound) {
    EXPECT_CALL(mock_, tdSetName(4, _)).WillOnce(Return(false));
    try {
        marshaler_.invoke<FunctionId::SET_NAME>(4, "kitchen");
        FAIL() << "Expected NativeCallError";
    } catch (const NativeCallError& e) {
        EXPECT_EQ(e.code(), TELLSTICK_ERROR_DEVICE_NOT_FOUND);
    }
}

TEST_F(CallMarshalerTest, StringIsCopiedAndReleasedOnce) {
    char* native = mock_.makeString("Lamp");
    EXPECT_CALL(mock_, tdGetName(1)).WillOnce(Return(native));
    EXPECT_CALL(mock_, tdReleaseString(native)).Times(1);

    auto name = marshaler_.invoke<FunctionId::GET_NAME>(1);
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "Lamp");
}

TEST_F(CallMarshalerTest, NullStringIsNotReleased) {
    EXPECT_CALL(mock_, tdGetModel(1)).WillOnce(Return(nullptr));
    EXPECT_CALL(mock_, tdReleaseString(_)).Times(0);
    EXPECT_FALSE(marshaler_.invoke<FunctionId::GET_MODEL>(1).has_value());
}

TEST_F(CallMarshalerTest, StringsAreDecodedFromNativeEncoding) {
    StringEncoding::getInstance().setEncoding("iso-8859-1");
    EXPECT_CALL(mock_, tdGetName(1)).WillOnce([this](int) {
        return mock_.makeString("K\xf6k");
    });
    EXPECT_EQ(marshaler_.invoke<FunctionId::GET_NAME>(1).value(), "K\xc3\xb6k");
}

TEST_F(CallMarshalerTest, TextArgumentsAreEncoded) {
    StringEncoding::getInstance().setEncoding("iso-8859-1");
    std::string received;
    EXPECT_CALL(mock_, tdSetName(1, _)).WillOnce([&](int, const char* value) {
        received = value;
        return true;
    });

    TextArg name(std::string("K\xc3\xb6k"));
    marshaler_.invoke<FunctionId::SET_NAME>(1, name.c_str());
    EXPECT_EQ(received, "K\xf6k");
}

TEST_F(CallMarshalerTest, NativeBytesPassUnchanged) {
    StringEncoding::getInstance().setEncoding("iso-8859-1");
    TextArg raw(NativeBytes{"S\xf6\x01"});
    EXPECT_EQ(raw.native(), "S\xf6\x01");
}

TEST_F(CallMarshalerTest, DecodeBufferStopsAtTerminator) {
    char buffer[8] = {'a', 'b', 'c', '\0', 'x', 'y', 'z', 'w'};
    EXPECT_EQ(CallMarshaler::decodeBuffer(buffer, sizeof(buffer)), "abc");

    char full[3] = {'a', 'b', 'c'};
    EXPECT_EQ(CallMarshaler::decodeBuffer(full, sizeof(full)), "abc");
}

TEST_F(CallMarshalerTest, UnboundEntryRaisesNotSupported) {
    loader_.missingSymbols = {"tdRemoveController"};
    FunctionTable table;
    table.bind(loader_, &module_);
    CallMarshaler marshaler(table);
    EXPECT_THROW(marshaler.invoke<FunctionId::REMOVE_CONTROLLER>(1), NotSupportedError);
}

TEST_F(CallMarshalerTest, VoidEntryHasNoErrorCheck) {
    EXPECT_CALL(mock_, tdConnectTellStickController(0x1781, 0x0c31, _)).Times(1);
    marshaler_.invoke<FunctionId::CONNECT_TELLSTICK_CONTROLLER>(0x1781, 0x0c31, "A1");
}
