// include/capture/capture_orchestrator.h
#pragma once

#include "core/events.h"
#include "core/session.h"
#include "core/task_worker.h"
#include "devices/icamera.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace photobooth::capture {

// Issues the N+2 still captures of a session one at a time on the task worker.
// Results come back through the sink as CAPTURE_COMPLETED / CAPTURE_FAILED.
class CaptureOrchestrator {
public:
    CaptureOrchestrator(std::shared_ptr<devices::ICamera> camera,
                        core::TaskWorker& worker,
                        core::EventSink sink,
                        std::string photosDir);

    // Requests shot number session.capturedPhotos.size() (retry attempt = session.captureRetries).
    // Returns false when a capture for this session is still outstanding.
    bool captureNext(const core::Session& session);

    // Best-effort: drops queued work and cancels the outstanding request, even
    // when the worker has already picked it up
    void cancel();

    bool isInFlight() const;

    // <photosDir>/<YYYY>/<MM>/<DD>/<sessionId>/shot_<shot>_<attempt>.jpg
    std::string photoPathFor(const std::string& sessionId, size_t shotIndex, int attempt) const;

private:
    void runCapture(const std::string& sessionId, uint64_t requestId, const std::string& outputPath,
                    const devices::CancelToken& cancelToken);

    std::shared_ptr<devices::ICamera> camera_;
    core::TaskWorker& worker_;
    core::EventSink sink_;
    std::string photosDir_;

    mutable std::mutex mutex_;
    std::string inFlightSessionId_;
    devices::CancelToken inFlightCancel_;
    uint64_t nextRequestId_{1};
};

} // namespace photobooth::capture
