// src/input/input_event_source.cpp
#include "input/input_event_source.h"
#include "logging/logger.h"
#include <vector>

namespace photobooth::input {

std::string controlToString(Control control) {
    switch (control) {
        case Control::NEXT: return "next";
        case Control::PREV: return "prev";
        case Control::SHUTTER: return "shutter";
        case Control::ENTER: return "enter";
        case Control::CANCEL: return "cancel";
        case Control::START: return "start";
        default: return "unknown";
    }
}

std::optional<Control> controlFromString(const std::string& name) {
    if (name == "next") return Control::NEXT;
    if (name == "prev") return Control::PREV;
    if (name == "shutter") return Control::SHUTTER;
    if (name == "enter") return Control::ENTER;
    if (name == "cancel") return Control::CANCEL;
    if (name == "start") return Control::START;
    return std::nullopt;
}

namespace {

std::optional<core::EventType> pressEventFor(Control control) {
    switch (control) {
        case Control::NEXT: return core::EventType::NEXT;
        case Control::PREV: return core::EventType::PREV;
        case Control::SHUTTER: return core::EventType::SHUTTER;
        case Control::ENTER: return core::EventType::ENTER;
        case Control::START: return core::EventType::START;
        default: return std::nullopt;
    }
}

} // namespace

InputEventSource::InputEventSource(core::EventSink sink, InputSettings settings)
    : sink_(std::move(sink))
    , settings_(settings) {
}

bool InputEventSource::cancelsOnHold(Control control) const {
    return control == Control::CANCEL || (control == Control::ENTER && settings_.enterHoldCancels);
}

bool InputEventSource::holdElapsed(const HoldState& hold, std::chrono::steady_clock::time_point now) const {
    return hold.pressed && !hold.fired && now - hold.since >= settings_.cancelHold;
}

void InputEventSource::onEdge(Control control, bool pressed, std::chrono::steady_clock::time_point now) {
    std::vector<core::Event> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        HoldState& hold = holds_[control];

        if (pressed) {
            if (hold.pressed) {
                return;
            }
            hold.pressed = true;
            hold.fired = false;
            hold.since = now;
            if (auto type = pressEventFor(control)) {
                out.push_back(core::Event::input(*type));
            }
        } else {
            if (!hold.pressed) {
                return;
            }
            // Released after the threshold but before the next tick
            if (cancelsOnHold(control) && holdElapsed(hold, now)) {
                hold.fired = true;
                out.push_back(core::Event::input(core::EventType::LONG_PRESS_CANCEL));
            }
            hold.pressed = false;
        }
    }

    for (auto& event : out) {
        if (event.type == core::EventType::LONG_PRESS_CANCEL) {
            logging::Logger::getInstance().info("Long press on " + controlToString(control) + ": cancel");
        }
        sink_(std::move(event));
    }
}

void InputEventSource::tick(std::chrono::steady_clock::time_point now) {
    std::vector<Control> fired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : holds_) {
            if (cancelsOnHold(entry.first) && holdElapsed(entry.second, now)) {
                entry.second.fired = true;
                fired.push_back(entry.first);
            }
        }
    }

    for (Control control : fired) {
        logging::Logger::getInstance().info("Long press on " + controlToString(control) + ": cancel");
        sink_(core::Event::input(core::EventType::LONG_PRESS_CANCEL));
    }
}

bool InputEventSource::isHeld(Control control) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holds_.find(control);
    return it != holds_.end() && it->second.pressed;
}

} // namespace photobooth::input
