// include/devices/icamera.h
#pragma once

#include "devices/device_types.h"
#include <string>

namespace photobooth::devices {

// ICamera interface - stable abstraction for still cameras
class ICamera {
public:
    virtual ~ICamera() = default;

    // Blocking still capture into outputPath. Called from the task worker only.
    // Setting the token from any thread aborts the capture.
    virtual CaptureResult capturePhoto(const std::string& outputPath, CancelToken cancel) = 0;

    // Live preview; the camera may not be able to capture while it runs.
    // Returns false when the stream could not be started.
    virtual bool startPreviewStream() = 0;
    virtual void stopPreviewStream() = 0;
};

} // namespace photobooth::devices
