// include/core/events.h
#pragma once

#include "core/session.h"
#include "devices/device_types.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace photobooth::core {

enum class EventType {
    // Operator input (normalized)
    START,
    NEXT,
    PREV,
    SHUTTER,
    ENTER,
    LONG_PRESS_CANCEL,
    // Timers
    TIMER_TICK,
    INACTIVITY_CHECK,
    INACTIVITY_TIMEOUT,
    // Background task completions
    CAPTURE_COMPLETED,
    CAPTURE_FAILED,
    COMPOSITION_READY,
    COMPOSITION_FAILED,
    PRINT_COMPLETED,
    PRINT_FAILED,
    // Process control
    SHUTDOWN
};

enum class TimerKind {
    NONE,
    COUNTDOWN,
    QUICK_REVIEW
};

enum class PrintErrorCode {
    NONE,
    NOT_CONFIGURED,
    SPOOLER_REJECTED,
    SPOOLER_TIMEOUT,
    WRITE_FAILED
};

inline std::string printErrorToString(PrintErrorCode code) {
    switch (code) {
        case PrintErrorCode::NONE: return "none";
        case PrintErrorCode::NOT_CONFIGURED: return "not_configured";
        case PrintErrorCode::SPOOLER_REJECTED: return "spooler_rejected";
        case PrintErrorCode::SPOOLER_TIMEOUT: return "spooler_timeout";
        case PrintErrorCode::WRITE_FAILED: return "write_failed";
        default: return "unknown";
    }
}

std::string eventTypeToString(EventType type);

// Flat event record consumed by the SessionController. Only the fields relevant
// to a given type are set.
struct Event {
    EventType type = EventType::SHUTDOWN;
    std::string sessionId;          // completions: session that issued the task
    TimerKind timer = TimerKind::NONE;
    uint64_t generation = 0;        // timer epoch, capture attempt or composition request
    Photo photo;
    std::shared_ptr<const composition::CompositeImage> composite;
    devices::CaptureErrorCode captureError = devices::CaptureErrorCode::NONE;
    PrintErrorCode printError = PrintErrorCode::NONE;
    std::string message;

    static Event input(EventType type) {
        Event event;
        event.type = type;
        return event;
    }

    static Event timerTick(TimerKind kind, uint64_t generation) {
        Event event;
        event.type = EventType::TIMER_TICK;
        event.timer = kind;
        event.generation = generation;
        return event;
    }

    static Event forSession(EventType type, const std::string& sessionId, uint64_t generation = 0) {
        Event event;
        event.type = type;
        event.sessionId = sessionId;
        event.generation = generation;
        return event;
    }
};

// Where background contexts deliver their results
using EventSink = std::function<void(Event)>;

} // namespace photobooth::core
