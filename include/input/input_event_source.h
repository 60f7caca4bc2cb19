// include/input/input_event_source.h
#pragma once

#include "core/events.h"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace photobooth::input {

// Logical operator controls, whatever the physical source
enum class Control {
    NEXT,
    PREV,
    SHUTTER,
    ENTER,
    CANCEL,
    START
};

std::string controlToString(Control control);
std::optional<Control> controlFromString(const std::string& name);

struct InputSettings {
    std::chrono::milliseconds cancelHold{3000};
    bool enterHoldCancels{true};      // Enter doubles as the cancel button when held
};

// Normalizes press/release edges into controller events. Presses of Next, Prev,
// Shutter, Enter and Start map 1:1; a continuous hold of a cancel-capable control
// yields exactly one LONG_PRESS_CANCEL per press.
// Edges and ticks may come from different threads.
class InputEventSource {
public:
    explicit InputEventSource(core::EventSink sink, InputSettings settings = InputSettings());

    void onEdge(Control control, bool pressed, std::chrono::steady_clock::time_point now);

    // Advances the hold clock; call periodically while any control may be held
    void tick(std::chrono::steady_clock::time_point now);

    bool isHeld(Control control) const;

private:
    struct HoldState {
        bool pressed = false;
        bool fired = false;
        std::chrono::steady_clock::time_point since;
    };

    bool cancelsOnHold(Control control) const;
    bool holdElapsed(const HoldState& hold, std::chrono::steady_clock::time_point now) const;

    core::EventSink sink_;
    InputSettings settings_;
    mutable std::mutex mutex_;
    std::map<Control, HoldState> holds_;
};

} // namespace photobooth::input
