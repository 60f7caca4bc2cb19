// include/input/evdev_button_reader.h
#pragma once

#include "input/input_event_source.h"
#include <atomic>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace photobooth::input {

// Reads EV_KEY records from Linux input devices (gpio-keys overlays for the
// booth buttons, USB keyboards for bench testing) and feeds InputEventSource.
// One thread per device; a device that disappears is reopened.
class EvdevButtonReader {
public:
    EvdevButtonReader(InputEventSource& source,
                      std::vector<std::string> devicePaths,
                      std::map<int, Control> keyMap);
    ~EvdevButtonReader();

    EvdevButtonReader(const EvdevButtonReader&) = delete;
    EvdevButtonReader& operator=(const EvdevButtonReader&) = delete;

    bool start();
    void stop();
    bool isRunning() const { return running_; }

    // {"next": KEY_RIGHT, ...} -> {KEY_RIGHT: Control::NEXT, ...}; unknown names are skipped
    static std::map<int, Control> keyMapFromBindings(const std::map<std::string, int>& bindings);

    // 1 = press, 0 = release, 2 = autorepeat (ignored)
    void handleKey(int code, int value);

private:
    void deviceThread(std::string path);

    InputEventSource& source_;
    std::vector<std::string> devicePaths_;
    std::map<int, Control> keyMap_;
    std::atomic<bool> running_{false};
    std::vector<std::thread> threads_;
};

} // namespace photobooth::input
