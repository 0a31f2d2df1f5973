#include <gtest/gtest.h>

#include "tellcore/core/asio_callback_dispatcher.h"
#include "tellcore/core/callback_dispatcher.h"

#include <common/logger.h>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tellcore::core;

namespace {

PendingEvent makeEvent(int id, std::function<void()> invoke) {
    PendingEvent event;
    event.callbackId = id;
    event.kind = EventKind::DEVICE;
    event.invoke = std::move(invoke);
    return event;
}

} // namespace

class CallbackDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        tellcore::common::initLogger("", tellcore::common::LogLevel::OFF);
    }
};

TEST_F(CallbackDispatcherTest, EventKindNames) {
    EXPECT_EQ(eventKindToString(EventKind::DEVICE), "device");
    EXPECT_EQ(eventKindToString(EventKind::DEVICE_CHANGE), "device-change");
    EXPECT_EQ(eventKindToString(EventKind::RAW_DEVICE), "raw-device");
    EXPECT_EQ(eventKindToString(EventKind::SENSOR), "sensor");
    EXPECT_EQ(eventKindToString(EventKind::CONTROLLER), "controller");
}

TEST_F(CallbackDispatcherTest, DirectRunsOnCallingThread) {
    DirectCallbackDispatcher dispatcher;
    std::thread::id ranOn;
    dispatcher.onCallback(makeEvent(1, [&] { ranOn = std::this_thread::get_id(); }));
    EXPECT_EQ(ranOn, std::this_thread::get_id());
}

TEST_F(CallbackDispatcherTest, ConsumerExceptionIsContained) {
    DirectCallbackDispatcher dispatcher;
    EXPECT_NO_THROW(dispatcher.onCallback(
        makeEvent(1, [] { throw std::runtime_error("boom"); })));
    EXPECT_NO_THROW(dispatcher.onCallback(makeEvent(2, [] { throw 42; })));
}

TEST_F(CallbackDispatcherTest, QueuedKeepsArrivalOrder) {
    QueuedCallbackDispatcher dispatcher;
    std::vector<int> delivered;
    for (int i = 1; i <= 3; ++i) {
        dispatcher.onCallback(makeEvent(i, [&delivered, i] { delivered.push_back(i); }));
    }
    EXPECT_EQ(dispatcher.pendingCount(), 3u);
    EXPECT_TRUE(delivered.empty());

    EXPECT_TRUE(dispatcher.processOne(false));
    EXPECT_EQ(delivered, std::vector<int>({1}));
    EXPECT_EQ(dispatcher.processAllPending(), 2u);
    EXPECT_EQ(delivered, std::vector<int>({1, 2, 3}));
    EXPECT_EQ(dispatcher.pendingCount(), 0u);
}

TEST_F(CallbackDispatcherTest, QueuedNonBlockingReturnsWhenEmpty) {
    QueuedCallbackDispatcher dispatcher;
    EXPECT_FALSE(dispatcher.processOne(false));
    EXPECT_EQ(dispatcher.processAllPending(), 0u);
}

TEST_F(CallbackDispatcherTest, QueuedTimeoutExpires) {
    QueuedCallbackDispatcher dispatcher;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(dispatcher.processOne(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST_F(CallbackDispatcherTest, QueuedBlockingWaitsForProducer) {
    QueuedCallbackDispatcher dispatcher;
    std::atomic<bool> delivered{false};

    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        dispatcher.onCallback(makeEvent(1, [&] { delivered = true; }));
    });

    EXPECT_TRUE(dispatcher.processOne(true));
    EXPECT_TRUE(delivered.load());
    producer.join();
}

TEST_F(CallbackDispatcherTest, QueuedExceptionDoesNotStopDrain) {
    QueuedCallbackDispatcher dispatcher;
    int delivered = 0;
    dispatcher.onCallback(makeEvent(1, [] { throw std::runtime_error("first"); }));
    dispatcher.onCallback(makeEvent(2, [&] { ++delivered; }));
    EXPECT_EQ(dispatcher.processAllPending(), 2u);
    EXPECT_EQ(delivered, 1);
}

TEST_F(CallbackDispatcherTest, EventLoopRequiresScheduler) {
    EXPECT_THROW(EventLoopCallbackDispatcher(nullptr), std::invalid_argument);
}

TEST_F(CallbackDispatcherTest, EventLoopHandsEventsToScheduler) {
    std::vector<std::function<void()>> scheduled;
    EventLoopCallbackDispatcher dispatcher(
        [&](std::function<void()> task) { scheduled.push_back(std::move(task)); });

    int delivered = 0;
    dispatcher.onCallback(makeEvent(1, [&] { ++delivered; }));
    ASSERT_EQ(scheduled.size(), 1u);
    EXPECT_EQ(delivered, 0);
    scheduled[0]();
    EXPECT_EQ(delivered, 1);
}

TEST_F(CallbackDispatcherTest, EventLoopSchedulerFailureIsLogged) {
    EventLoopCallbackDispatcher dispatcher(
        [](std::function<void()>) { throw std::runtime_error("loop closed"); });
    EXPECT_NO_THROW(dispatcher.onCallback(makeEvent(1, [] {})));
}

TEST_F(CallbackDispatcherTest, AsioPostsToIoContext) {
    boost::asio::io_context context;
    AsioCallbackDispatcher dispatcher(context);
    EXPECT_EQ(&dispatcher.context(), &context);

    std::thread::id ranOn;
    std::thread producer([&] {
        dispatcher.onCallback(makeEvent(1, [&] { ranOn = std::this_thread::get_id(); }));
    });
    producer.join();

    EXPECT_EQ(ranOn, std::thread::id());
    EXPECT_EQ(context.run(), 1u);
    EXPECT_EQ(ranOn, std::this_thread::get_id());
}
