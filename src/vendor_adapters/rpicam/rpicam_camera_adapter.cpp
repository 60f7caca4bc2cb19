// src/vendor_adapters/rpicam/rpicam_camera_adapter.cpp
#include "vendor_adapters/rpicam/rpicam_camera_adapter.h"
#include "logging/logger.h"
#include <filesystem>
#include <sstream>

namespace photobooth::rpicam {

namespace {

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream ss(text);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

RpicamCameraAdapter::RpicamCameraAdapter(const std::string& deviceId, RpicamSettings settings)
    : deviceId_(deviceId)
    , settings_(std::move(settings)) {
}

RpicamCameraAdapter::~RpicamCameraAdapter() {
    preview_.stop();
}

std::vector<std::string> RpicamCameraAdapter::buildStillCommand(const std::string& outputPath) const {
    return {
        settings_.stillCommand,
        "-n",
        "-o", outputPath,
        "--width", std::to_string(settings_.width),
        "--height", std::to_string(settings_.height),
        "-t", "1",
        "-q", std::to_string(settings_.quality),
    };
}

devices::CaptureResult RpicamCameraAdapter::capturePhoto(const std::string& outputPath,
                                                         devices::CancelToken cancel) {
    devices::CaptureResult result;
    if (devices::isCancelled(cancel)) {
        result.errorCode = devices::CaptureErrorCode::CANCELLED;
        result.errorMessage = "capture cancelled";
        return result;
    }

    std::vector<std::string> argv = buildStillCommand(outputPath);
    logging::Logger::getInstance().debug("Camera " + deviceId_ + " running: " + common::ProcessRunner::describe(argv));
    common::ProcessResult proc = common::ProcessRunner::run(argv, settings_.timeout, cancel.get());

    if (!proc.started) {
        result.errorCode = devices::CaptureErrorCode::CAMERA_UNAVAILABLE;
        result.errorMessage = proc.output;
    } else if (proc.cancelled) {
        result.errorCode = devices::CaptureErrorCode::CANCELLED;
        result.errorMessage = "capture cancelled";
    } else if (proc.timedOut) {
        result.errorCode = devices::CaptureErrorCode::HARDWARE_TIMEOUT;
        result.errorMessage = "no image after " + std::to_string(settings_.timeout.count()) + " ms";
    } else if (proc.exitCode != 0) {
        result.errorCode = devices::CaptureErrorCode::CAMERA_UNAVAILABLE;
        result.errorMessage = settings_.stillCommand + " exited with " + std::to_string(proc.exitCode) +
                              (proc.output.empty() ? "" : ": " + proc.output);
    } else if (!std::filesystem::exists(outputPath)) {
        result.errorCode = devices::CaptureErrorCode::OUTPUT_MISSING;
        result.errorMessage = "no file written at " + outputPath;
    } else {
        result.success = true;
        result.imagePath = outputPath;
        result.capturedAt = std::chrono::system_clock::now();
    }
    return result;
}

bool RpicamCameraAdapter::startPreviewStream() {
    if (settings_.previewCommand.empty()) {
        return true;
    }
    if (preview_.isRunning()) {
        return true;
    }
    return preview_.start(splitWords(settings_.previewCommand));
}

void RpicamCameraAdapter::stopPreviewStream() {
    preview_.stop();
}

} // namespace photobooth::rpicam
