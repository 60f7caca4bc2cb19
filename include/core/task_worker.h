// include/core/task_worker.h
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace photobooth::core {

// Async task for blocking device and image work
struct WorkerTask {
    std::string name;              // for logging, e.g. "capture 20261019-101500-a1b2c3 #2"
    std::function<void()> execute;
};

// Background execution context: one thread, tasks run strictly in FIFO order,
// so the camera and the spooler never see two requests at once.
class TaskWorker {
public:
    TaskWorker() = default;
    ~TaskWorker();
    TaskWorker(const TaskWorker&) = delete;
    TaskWorker& operator=(const TaskWorker&) = delete;

    bool start();
    // Runs the tasks already queued, then joins
    void stop();

    void enqueue(WorkerTask task);

    // Drop queued tasks that have not started yet; returns how many were dropped
    size_t cancelPending();

    size_t pendingCount() const;
    bool isRunning() const { return running_; }

private:
    void workerThread();

    std::queue<WorkerTask> taskQueue_;
    mutable std::mutex taskQueueMutex_;
    std::condition_variable taskQueueCondition_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace photobooth::core
