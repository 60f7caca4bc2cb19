// include/config/config_manager.h
#pragma once

#include "core/session_settings.h"
#include <string>
#include <vector>
#include <map>

namespace photobooth::config {

// Configuration Manager (INI-style key=value file)
class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Reset to defaults, then load configPath (created with defaults if missing).
    // Empty path: ./photobooth.ini
    void initialize(const std::string& configPath = "");

    const std::string& getConfigFilePath() const { return configFilePath_; }

    // Storage
    std::string getPhotosDir() const { return photosDir_; }
    std::string getTemplatesPath() const { return templatesPath_; }
    std::string getPrinterConfigPath() const;

    // Session timing
    core::SessionSettings getSessionSettings() const;

    // Camera
    std::string getCaptureCommand() const { return captureCommand_; }
    int getCaptureWidth() const { return captureWidth_; }
    int getCaptureHeight() const { return captureHeight_; }
    int getCaptureQuality() const { return captureQuality_; }
    int getCaptureTimeoutMs() const { return captureTimeoutMs_; }
    std::string getPreviewCommand() const { return previewCommand_; }

    // Printing
    std::string getPrintCommand() const { return printCommand_; }
    std::vector<std::string> getPrintOptions() const;
    int getPrintTimeoutMs() const { return printTimeoutMs_; }
    std::string getSpoolDir() const;

    // Composition
    bool getMirrorPhotos() const { return mirrorPhotos_; }
    int getJpegQuality() const { return jpegQuality_; }

    // Input
    std::vector<std::string> getInputDevices() const;
    int getCancelHoldMs() const { return cancelHoldMs_; }
    bool getEnterHoldCancels() const { return enterHoldCancels_; }
    /// Linux key code per logical control name ("next", "prev", "shutter", "enter", "cancel", "start")
    std::map<std::string, int> getKeyBindings() const { return keyBindings_; }

    // Logging
    std::string getLogDir() const { return logDir_; }
    std::string getLogLevel() const { return logLevel_; }

    // Bulk access (key = e.g. "session.countdown_seconds")
    std::map<std::string, std::string> getAll() const;
    void setFromMap(const std::map<std::string, std::string>& kv);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadDefaults();
    void loadFromFile(const std::string& configPath);
    void saveToFile(const std::string& configPath) const;
    void applyEnvironmentOverrides();
    void setValue(const std::string& key, const std::string& value);

    std::string configFilePath_;

    std::string photosDir_;
    std::string templatesPath_;
    std::string printerConfigPath_;

    int countdownSeconds_{10};
    int quickReviewMs_{1200};
    int inactivitySeconds_{90};
    int inactivityCheckMs_{1000};
    int maxCaptureRetries_{3};

    std::string captureCommand_;
    int captureWidth_{1920};
    int captureHeight_{1080};
    int captureQuality_{95};
    int captureTimeoutMs_{15000};
    std::string previewCommand_;

    std::string printCommand_;
    std::string printOptions_;
    int printTimeoutMs_{60000};
    std::string spoolDir_;

    bool mirrorPhotos_{true};
    int jpegQuality_{95};

    std::string inputDevices_;
    int cancelHoldMs_{3000};
    bool enterHoldCancels_{true};
    std::map<std::string, int> keyBindings_;

    std::string logDir_;
    std::string logLevel_;
};

} // namespace photobooth::config
