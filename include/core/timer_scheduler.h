// include/core/timer_scheduler.h
#pragma once

#include "core/event_queue.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace photobooth::core {

// Delivers an event into the controller's queue after a delay
class ITimerService {
public:
    virtual ~ITimerService() = default;
    virtual void schedule(std::chrono::milliseconds delay, Event event) = 0;
};

// One thread, deadline-ordered. Stale timers are not cancelled here; the
// controller drops them by generation.
class TimerScheduler : public ITimerService {
public:
    explicit TimerScheduler(EventQueue& queue);
    ~TimerScheduler() override;

    bool start();
    void stop();

    void schedule(std::chrono::milliseconds delay, Event event) override;

    size_t pendingCount() const;

private:
    void run();

    EventQueue& queue_;
    std::atomic<bool> running_{false};
    std::multimap<std::chrono::steady_clock::time_point, Event> pending_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::thread thread_;
};

} // namespace photobooth::core
