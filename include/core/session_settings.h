// include/core/session_settings.h
#pragma once

#include <chrono>

namespace photobooth::core {

// Timing and retry constants of the session state machine
struct SessionSettings {
    int countdownSeconds{10};
    std::chrono::milliseconds countdownTick{1000};
    std::chrono::milliseconds quickReview{1200};
    std::chrono::milliseconds inactivityTimeout{90000};
    std::chrono::milliseconds inactivityCheckInterval{1000};
    int maxCaptureRetries{3};
};

} // namespace photobooth::core
