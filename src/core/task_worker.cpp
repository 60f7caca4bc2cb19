// src/core/task_worker.cpp
#include "core/task_worker.h"
#include "logging/logger.h"
#include <exception>

namespace photobooth::core {

TaskWorker::~TaskWorker() {
    stop();
}

bool TaskWorker::start() {
    if (running_) {
        return true;
    }
    running_ = true;
    thread_ = std::thread(&TaskWorker::workerThread, this);
    logging::Logger::getInstance().info("Task worker thread started");
    return true;
}

void TaskWorker::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        running_ = false;
    }
    taskQueueCondition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logging::Logger::getInstance().info("Task worker thread stopped");
}

void TaskWorker::enqueue(WorkerTask task) {
    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        logging::Logger::getInstance().debug("Task queued: " + task.name + ", queue size: " +
                                             std::to_string(taskQueue_.size() + 1));
        taskQueue_.push(std::move(task));
    }
    taskQueueCondition_.notify_one();
}

size_t TaskWorker::cancelPending() {
    std::lock_guard<std::mutex> lock(taskQueueMutex_);
    size_t dropped = taskQueue_.size();
    std::queue<WorkerTask> empty;
    taskQueue_.swap(empty);
    if (dropped > 0) {
        logging::Logger::getInstance().info("Dropped " + std::to_string(dropped) + " pending task(s)");
    }
    return dropped;
}

size_t TaskWorker::pendingCount() const {
    std::lock_guard<std::mutex> lock(taskQueueMutex_);
    return taskQueue_.size();
}

void TaskWorker::workerThread() {
    logging::Logger::getInstance().debug("Task worker thread running");

    while (true) {
        WorkerTask task;
        {
            std::unique_lock<std::mutex> lock(taskQueueMutex_);
            taskQueueCondition_.wait(lock, [this] {
                return !taskQueue_.empty() || !running_;
            });
            if (taskQueue_.empty()) {
                break;
            }
            task = std::move(taskQueue_.front());
            taskQueue_.pop();
        }

        logging::Logger::getInstance().debug("Task worker picked task: " + task.name);
        try {
            if (task.execute) {
                task.execute();
            }
        } catch (const std::exception& e) {
            logging::Logger::getInstance().error("Task " + task.name + " threw: " + e.what());
        }
    }

    logging::Logger::getInstance().debug("Task worker thread exiting");
}

} // namespace photobooth::core
