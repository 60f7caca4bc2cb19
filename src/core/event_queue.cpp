// src/core/event_queue.cpp
#include "core/event_queue.h"

namespace photobooth::core {

std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::START: return "Start";
        case EventType::NEXT: return "Next";
        case EventType::PREV: return "Prev";
        case EventType::SHUTTER: return "Shutter";
        case EventType::ENTER: return "Enter";
        case EventType::LONG_PRESS_CANCEL: return "LongPressCancel";
        case EventType::TIMER_TICK: return "TimerTick";
        case EventType::INACTIVITY_CHECK: return "InactivityCheck";
        case EventType::INACTIVITY_TIMEOUT: return "InactivityTimeout";
        case EventType::CAPTURE_COMPLETED: return "CaptureCompleted";
        case EventType::CAPTURE_FAILED: return "CaptureFailed";
        case EventType::COMPOSITION_READY: return "CompositionReady";
        case EventType::COMPOSITION_FAILED: return "CompositionFailed";
        case EventType::PRINT_COMPLETED: return "PrintCompleted";
        case EventType::PRINT_FAILED: return "PrintFailed";
        case EventType::SHUTDOWN: return "Shutdown";
        default: return "Unknown";
    }
}

void EventQueue::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(event));
    }
    condition_.notify_one();
}

std::optional<Event> EventQueue::waitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!condition_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<Event> EventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

} // namespace photobooth::core
