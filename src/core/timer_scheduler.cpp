// src/core/timer_scheduler.cpp
#include "core/timer_scheduler.h"
#include "logging/logger.h"

namespace photobooth::core {

TimerScheduler::TimerScheduler(EventQueue& queue)
    : queue_(queue) {
}

TimerScheduler::~TimerScheduler() {
    stop();
}

bool TimerScheduler::start() {
    if (running_) {
        return true;
    }
    running_ = true;
    thread_ = std::thread(&TimerScheduler::run, this);
    logging::Logger::getInstance().info("Timer scheduler started");
    return true;
}

void TimerScheduler::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        pending_.clear();
    }
    condition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logging::Logger::getInstance().info("Timer scheduler stopped");
}

void TimerScheduler::schedule(std::chrono::milliseconds delay, Event event) {
    auto deadline = std::chrono::steady_clock::now() + delay;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.emplace(deadline, std::move(event));
    }
    condition_.notify_one();
}

size_t TimerScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (pending_.empty()) {
            condition_.wait(lock, [this] { return !pending_.empty() || !running_; });
            continue;
        }

        auto next = pending_.begin();
        const auto deadline = next->first;
        if (std::chrono::steady_clock::now() < deadline) {
            condition_.wait_until(lock, deadline);
            continue;
        }

        Event event = std::move(next->second);
        pending_.erase(next);
        lock.unlock();
        queue_.post(std::move(event));
        lock.lock();
    }
}

} // namespace photobooth::core
