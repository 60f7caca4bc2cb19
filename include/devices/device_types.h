// include/devices/device_types.h
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace photobooth::devices {

// Cancellation flag of one device request; created when the request is queued
// and never reset.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken makeCancelToken() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool isCancelled(const CancelToken& token) {
    return token && token->load();
}

enum class CaptureErrorCode {
    NONE,
    CAMERA_UNAVAILABLE,
    HARDWARE_TIMEOUT,
    CANCELLED,
    OUTPUT_MISSING
};

inline std::string captureErrorToString(CaptureErrorCode code) {
    switch (code) {
        case CaptureErrorCode::NONE: return "none";
        case CaptureErrorCode::CAMERA_UNAVAILABLE: return "camera_unavailable";
        case CaptureErrorCode::HARDWARE_TIMEOUT: return "hardware_timeout";
        case CaptureErrorCode::CANCELLED: return "cancelled";
        case CaptureErrorCode::OUTPUT_MISSING: return "output_missing";
        default: return "unknown";
    }
}

// Outcome of a single still capture
struct CaptureResult {
    bool success = false;
    std::string imagePath;
    std::chrono::system_clock::time_point capturedAt;
    CaptureErrorCode errorCode = CaptureErrorCode::NONE;
    std::string errorMessage;
};

// Answer of the print spooler to a single job
enum class SpoolStatus {
    ACCEPTED,
    REJECTED,
    TIMEOUT
};

struct SpoolResult {
    SpoolStatus status = SpoolStatus::REJECTED;
    std::string reason;
};

} // namespace photobooth::devices
