// src/capture/capture_orchestrator.cpp
#include "capture/capture_orchestrator.h"
#include "logging/logger.h"
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace photobooth::capture {

CaptureOrchestrator::CaptureOrchestrator(std::shared_ptr<devices::ICamera> camera,
                                         core::TaskWorker& worker,
                                         core::EventSink sink,
                                         std::string photosDir)
    : camera_(std::move(camera))
    , worker_(worker)
    , sink_(std::move(sink))
    , photosDir_(std::move(photosDir)) {
}

std::string CaptureOrchestrator::photoPathFor(const std::string& sessionId, size_t shotIndex, int attempt) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream day;
    day << std::put_time(std::localtime(&time_t), "%Y/%m/%d");

    std::string fileName = "shot_" + std::to_string(shotIndex + 1) + "_" + std::to_string(attempt + 1) + ".jpg";
    return (std::filesystem::path(photosDir_) / day.str() / sessionId / fileName).string();
}

bool CaptureOrchestrator::captureNext(const core::Session& session) {
    uint64_t requestId = 0;
    devices::CancelToken cancelToken = devices::makeCancelToken();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlightSessionId_ == session.sessionId) {
            logging::Logger::getInstance().error("Capture already in flight for session " + session.sessionId);
            return false;
        }
        inFlightSessionId_ = session.sessionId;
        inFlightCancel_ = cancelToken;
        requestId = nextRequestId_++;
    }

    size_t shotIndex = session.capturedPhotos.size();
    std::string outputPath = photoPathFor(session.sessionId, shotIndex, session.captureRetries);
    std::string sessionId = session.sessionId;

    logging::Logger::getInstance().info("Capture requested: session " + sessionId + " shot " +
                                        std::to_string(shotIndex + 1) + "/" +
                                        std::to_string(session.requiredShots()) + " attempt " +
                                        std::to_string(session.captureRetries + 1));

    core::WorkerTask task;
    task.name = "capture " + sessionId + " #" + std::to_string(shotIndex + 1);
    task.execute = [this, sessionId, requestId, outputPath, cancelToken]() {
        runCapture(sessionId, requestId, outputPath, cancelToken);
    };
    worker_.enqueue(std::move(task));
    return true;
}

void CaptureOrchestrator::runCapture(const std::string& sessionId, uint64_t requestId, const std::string& outputPath,
                                     const devices::CancelToken& cancelToken) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(outputPath).parent_path(), ec);

    devices::CaptureResult result;
    if (ec) {
        result.errorCode = devices::CaptureErrorCode::OUTPUT_MISSING;
        result.errorMessage = "cannot create photo directory: " + ec.message();
    } else {
        camera_->stopPreviewStream();
        if (devices::isCancelled(cancelToken)) {
            result.errorCode = devices::CaptureErrorCode::CANCELLED;
            result.errorMessage = "capture cancelled";
        } else {
            result = camera_->capturePhoto(outputPath, cancelToken);
        }
        if (!camera_->startPreviewStream()) {
            logging::Logger::getInstance().warn("Preview stream did not restart after capture");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlightSessionId_ == sessionId) {
            inFlightSessionId_.clear();
        }
        if (inFlightCancel_ == cancelToken) {
            inFlightCancel_.reset();
        }
    }

    core::Event event;
    event.sessionId = sessionId;
    event.generation = requestId;
    if (result.success) {
        event.type = core::EventType::CAPTURE_COMPLETED;
        event.photo.path = result.imagePath;
        event.photo.capturedAt = result.capturedAt;
        logging::Logger::getInstance().info("Capture completed: " + result.imagePath);
    } else {
        event.type = core::EventType::CAPTURE_FAILED;
        event.captureError = result.errorCode;
        event.message = result.errorMessage;
        logging::Logger::getInstance().warn("Capture failed (" + devices::captureErrorToString(result.errorCode) +
                                            "): " + result.errorMessage);
    }
    sink_(std::move(event));
}

void CaptureOrchestrator::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inFlightSessionId_.clear();
        if (inFlightCancel_) {
            inFlightCancel_->store(true);
            inFlightCancel_.reset();
        }
    }
    worker_.cancelPending();
}

bool CaptureOrchestrator::isInFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !inFlightSessionId_.empty();
}

} // namespace photobooth::capture
