#include "tellcore/core/callback_dispatcher.h"

#include "common/logger.h"

#include <memory>
#include <stdexcept>

namespace tellcore {
namespace core {

namespace {
constexpr const char* kComponent = "CallbackDispatcher";
}

std::string eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::DEVICE:
            return "device";
        case EventKind::DEVICE_CHANGE:
            return "device-change";
        case EventKind::RAW_DEVICE:
            return "raw-device";
        case EventKind::SENSOR:
            return "sensor";
        case EventKind::CONTROLLER:
            return "controller";
    }
    return "unknown";
}

void CallbackDispatcher::deliver(PendingEvent& event) {
    if (!event.invoke) {
        return;
    }
    try {
        event.invoke();
    } catch (const std::exception& e) {
        common::logError("Exception in " + eventKindToString(event.kind) +
                             " callback " + std::to_string(event.callbackId) +
                             ": " + e.what(),
                         kComponent);
    } catch (...) {
        common::logError("Unknown exception in " + eventKindToString(event.kind) +
                             " callback " + std::to_string(event.callbackId),
                         kComponent);
    }
}

void DirectCallbackDispatcher::onCallback(PendingEvent event) {
    deliver(event);
}

void QueuedCallbackDispatcher::onCallback(PendingEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    condition_.notify_one();
}

bool QueuedCallbackDispatcher::processOne(bool block) {
    PendingEvent event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (block) {
            condition_.wait(lock, [this] { return !queue_.empty(); });
        }
        if (!popLocked(event)) {
            return false;
        }
    }
    deliver(event);
    return true;
}

bool QueuedCallbackDispatcher::processOne(std::chrono::milliseconds timeout) {
    PendingEvent event;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
        if (!popLocked(event)) {
            return false;
        }
    }
    deliver(event);
    return true;
}

std::size_t QueuedCallbackDispatcher::processAllPending() {
    std::deque<PendingEvent> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queue_);
    }
    for (auto& event : batch) {
        deliver(event);
    }
    return batch.size();
}

std::size_t QueuedCallbackDispatcher::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool QueuedCallbackDispatcher::popLocked(PendingEvent& event) {
    if (queue_.empty()) {
        return false;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

EventLoopCallbackDispatcher::EventLoopCallbackDispatcher(Scheduler scheduler)
    : scheduler_(std::move(scheduler)) {
    if (!scheduler_) {
        throw std::invalid_argument("EventLoopCallbackDispatcher needs a scheduler");
    }
}

void EventLoopCallbackDispatcher::onCallback(PendingEvent event) {
    auto shared = std::make_shared<PendingEvent>(std::move(event));
    try {
        scheduler_([shared] { deliver(*shared); });
    } catch (const std::exception& e) {
        common::logError(std::string("Failed to schedule callback: ") + e.what(),
                         kComponent);
    }
}

} // namespace core
} // namespace tellcore
