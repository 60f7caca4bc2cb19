// include/vendor_adapters/rpicam/rpicam_camera_adapter.h
#pragma once

#include "common/process_runner.h"
#include "devices/icamera.h"
#include <chrono>
#include <string>
#include <vector>

namespace photobooth::rpicam {

struct RpicamSettings {
    std::string stillCommand{"rpicam-still"};
    int width{1920};
    int height{1080};
    int quality{95};
    std::chrono::milliseconds timeout{15000};
    std::string previewCommand;   // whitespace separated argv; empty = no preview stream
};

/// Raspberry Pi camera adapter. Stills are taken by running rpicam-still
/// (libcamera apps); the optional preview is a separate long-running process
/// that has to be stopped before a still can claim the sensor.
class RpicamCameraAdapter : public devices::ICamera {
public:
    RpicamCameraAdapter(const std::string& deviceId, RpicamSettings settings);
    ~RpicamCameraAdapter() override;

    devices::CaptureResult capturePhoto(const std::string& outputPath, devices::CancelToken cancel) override;
    bool startPreviewStream() override;
    void stopPreviewStream() override;

    std::vector<std::string> buildStillCommand(const std::string& outputPath) const;

private:
    std::string deviceId_;
    RpicamSettings settings_;
    common::BackgroundProcess preview_;
};

} // namespace photobooth::rpicam
