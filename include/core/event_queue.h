// include/core/event_queue.h
#pragma once

#include "core/events.h"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace photobooth::core {

// Ordered, thread-safe event queue. Many producers, one consumer (the controller).
class EventQueue {
public:
    void post(Event event);

    // Blocks up to timeout; std::nullopt when nothing arrived
    std::optional<Event> waitPop(std::chrono::milliseconds timeout);
    std::optional<Event> tryPop();

    size_t size() const;
    void clear();

    EventSink sink() {
        return [this](Event event) { post(std::move(event)); };
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Event> queue_;
};

} // namespace photobooth::core
