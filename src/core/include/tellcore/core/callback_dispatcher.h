#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace tellcore {
namespace core {

/**
 * @brief The five kinds of native event
 */
enum class EventKind { DEVICE, DEVICE_CHANGE, RAW_DEVICE, SENSOR, CONTROLLER };

std::string eventKindToString(EventKind kind);

/**
 * @brief One native event waiting to be delivered to consumer code
 *
 * invoke() runs the consumer callback with the decoded arguments. It is a
 * no-op if the registration has been removed in the meantime.
 */
struct PendingEvent {
    int callbackId = 0;
    EventKind kind = EventKind::DEVICE;
    std::function<void()> invoke;
};

/**
 * @brief Strategy deciding on which thread native events reach consumer code
 *
 * onCallback() is called on the native callback thread and must not block for
 * long.
 */
class CallbackDispatcher {
public:
    virtual ~CallbackDispatcher() = default;

    virtual void onCallback(PendingEvent event) = 0;

protected:
    /**
     * @brief Run one event; exceptions thrown by the consumer are logged
     */
    static void deliver(PendingEvent& event);
};

/**
 * @brief Runs callbacks immediately on the native callback thread
 */
class DirectCallbackDispatcher : public CallbackDispatcher {
public:
    void onCallback(PendingEvent event) override;
};

/**
 * @brief Queues events; the consumer drains them on a thread of its choosing
 */
class QueuedCallbackDispatcher : public CallbackDispatcher {
public:
    void onCallback(PendingEvent event) override;

    /**
     * @brief Deliver the oldest queued event
     * @param block Wait for an event if the queue is empty
     * @return true if an event was delivered
     */
    bool processOne(bool block = true);

    /**
     * @brief Deliver the oldest queued event, waiting at most timeout
     * @return true if an event was delivered
     */
    bool processOne(std::chrono::milliseconds timeout);

    /**
     * @brief Deliver everything queued so far without waiting
     * @return Number of events delivered
     */
    std::size_t processAllPending();

    std::size_t pendingCount() const;

private:
    bool popLocked(PendingEvent& event);

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<PendingEvent> queue_;
};

/**
 * @brief Hands each event to a consumer supplied scheduler, e.g. the post
 * function of an event loop
 */
class EventLoopCallbackDispatcher : public CallbackDispatcher {
public:
    using Scheduler = std::function<void(std::function<void()>)>;

    explicit EventLoopCallbackDispatcher(Scheduler scheduler);

    void onCallback(PendingEvent event) override;

private:
    Scheduler scheduler_;
};

} // namespace core
} // namespace tellcore
