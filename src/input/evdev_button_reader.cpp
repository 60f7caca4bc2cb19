// src/input/evdev_button_reader.cpp
#include "input/evdev_button_reader.h"
#include "logging/logger.h"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <unistd.h>

namespace photobooth::input {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::chrono::milliseconds kReopenDelay{1000};

} // namespace

EvdevButtonReader::EvdevButtonReader(InputEventSource& source,
                                     std::vector<std::string> devicePaths,
                                     std::map<int, Control> keyMap)
    : source_(source)
    , devicePaths_(std::move(devicePaths))
    , keyMap_(std::move(keyMap)) {
}

EvdevButtonReader::~EvdevButtonReader() {
    stop();
}

std::map<int, Control> EvdevButtonReader::keyMapFromBindings(const std::map<std::string, int>& bindings) {
    std::map<int, Control> keyMap;
    for (const auto& binding : bindings) {
        auto control = controlFromString(binding.first);
        if (!control) {
            logging::Logger::getInstance().warn("Ignoring binding for unknown control: " + binding.first);
            continue;
        }
        keyMap[binding.second] = *control;
    }
    return keyMap;
}

bool EvdevButtonReader::start() {
    if (running_) {
        return true;
    }
    if (devicePaths_.empty()) {
        logging::Logger::getInstance().warn("No input devices configured (input.devices)");
        return false;
    }

    running_ = true;
    for (const auto& path : devicePaths_) {
        threads_.emplace_back(&EvdevButtonReader::deviceThread, this, path);
    }
    logging::Logger::getInstance().info("Input reader started on " + std::to_string(devicePaths_.size()) +
                                        " device(s), " + std::to_string(keyMap_.size()) + " bindings");
    return true;
}

void EvdevButtonReader::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
    logging::Logger::getInstance().info("Input reader stopped");
}

void EvdevButtonReader::handleKey(int code, int value) {
    if (value != 0 && value != 1) {
        return;
    }
    auto it = keyMap_.find(code);
    if (it == keyMap_.end()) {
        return;
    }
    source_.onEdge(it->second, value == 1, std::chrono::steady_clock::now());
}

void EvdevButtonReader::deviceThread(std::string path) {
    while (running_) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            logging::Logger::getInstance().error("Cannot open input device " + path + ": " + std::strerror(errno));
            std::this_thread::sleep_for(kReopenDelay);
            continue;
        }
        logging::Logger::getInstance().info("Listening on " + path);

        while (running_) {
            struct pollfd pfd { fd, POLLIN, 0 };
            int pr = poll(&pfd, 1, kPollIntervalMs);
            source_.tick(std::chrono::steady_clock::now());
            if (pr < 0) {
                if (errno == EINTR) continue;
                logging::Logger::getInstance().error("poll failed on " + path + ": " + std::strerror(errno));
                break;
            }
            if (pr == 0) continue;
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                logging::Logger::getInstance().warn("Input device " + path + " went away");
                break;
            }

            struct input_event ev {};
            ssize_t n = read(fd, &ev, sizeof(ev));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                logging::Logger::getInstance().error("read failed on " + path + ": " + std::strerror(errno));
                break;
            }
            if (n != sizeof(ev)) continue;
            if (ev.type != EV_KEY) continue;
            handleKey(ev.code, ev.value);
        }

        close(fd);
        if (!running_) break;
        logging::Logger::getInstance().warn("Reopening " + path + " in " + std::to_string(kReopenDelay.count()) + " ms");
        std::this_thread::sleep_for(kReopenDelay);
    }
}

} // namespace photobooth::input
