// src/config/config_manager.cpp
#include "config/config_manager.h"
#include "logging/logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdexcept>
#include <linux/input-event-codes.h>

namespace photobooth::config {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool parseBool(const std::string& value) {
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::string defaultPhotosDir() {
    const char* home = std::getenv("HOME");
    if (home && home[0]) {
        return (std::filesystem::path(home) / "photobooth" / "data" / "photos").string();
    }
    return (std::filesystem::current_path() / "photos").string();
}

} // namespace

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

void ConfigManager::initialize(const std::string& configPath) {
    if (configPath.empty()) {
        configFilePath_ = (std::filesystem::current_path() / "photobooth.ini").string();
    } else {
        configFilePath_ = configPath;
    }
    logging::Logger::getInstance().info("Config path: " + configFilePath_);

    loadDefaults();
    if (std::filesystem::exists(configFilePath_)) {
        try {
            loadFromFile(configFilePath_);
            logging::Logger::getInstance().info("Configuration loaded from: " + configFilePath_);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().warn("Failed to load config file, using defaults: " + std::string(e.what()));
            loadDefaults();
        }
    } else {
        logging::Logger::getInstance().info("Config file not found, using defaults");
        try {
            saveToFile(configFilePath_);
        } catch (const std::exception& e) {
            logging::Logger::getInstance().warn("Failed to save default config: " + std::string(e.what()));
        }
    }
    applyEnvironmentOverrides();
}

void ConfigManager::loadDefaults() {
    photosDir_ = defaultPhotosDir();
    templatesPath_ = "public/templates/index.json";
    printerConfigPath_.clear();

    countdownSeconds_ = 10;
    quickReviewMs_ = 1200;
    inactivitySeconds_ = 90;
    inactivityCheckMs_ = 1000;
    maxCaptureRetries_ = 3;

    captureCommand_ = "rpicam-still";
    captureWidth_ = 1920;
    captureHeight_ = 1080;
    captureQuality_ = 95;
    captureTimeoutMs_ = 15000;
    previewCommand_.clear();

    printCommand_ = "lp";
    printOptions_ = "media=A4.Borderless,fit-to-page=false";
    printTimeoutMs_ = 60000;
    spoolDir_.clear();

    mirrorPhotos_ = true;
    jpegQuality_ = 95;

    inputDevices_.clear();
    cancelHoldMs_ = 3000;
    enterHoldCancels_ = true;
    keyBindings_ = {
        {"next", KEY_RIGHT},
        {"prev", KEY_LEFT},
        {"shutter", KEY_SPACE},
        {"enter", KEY_ENTER},
        {"cancel", KEY_ESC},
        {"start", KEY_S},
    };

    logDir_ = "logs";
    logLevel_ = "info";
}

void ConfigManager::applyEnvironmentOverrides() {
    const char* photos = std::getenv("PHOTOBOOTH_PHOTOS_DIR");
    if (photos && photos[0]) {
        photosDir_ = photos;
        logging::Logger::getInstance().info("photos.dir overridden by PHOTOBOOTH_PHOTOS_DIR: " + photosDir_);
    }
    const char* templates = std::getenv("PHOTOBOOTH_TEMPLATES_PATH");
    if (templates && templates[0]) {
        templatesPath_ = templates;
        logging::Logger::getInstance().info("templates.path overridden by PHOTOBOOTH_TEMPLATES_PATH: " + templatesPath_);
    }
}

void ConfigManager::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + configPath);
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) {
            logging::Logger::getInstance().warn("Ignoring config line without '=': " + line);
            continue;
        }
        setValue(trim(line.substr(0, eqPos)), trim(line.substr(eqPos + 1)));
    }
}

void ConfigManager::setValue(const std::string& key, const std::string& value) {
    auto toInt = [&](int& target, int minValue) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size() || parsed < minValue) {
                throw std::invalid_argument("out of range");
            }
            target = parsed;
        } catch (const std::exception&) {
            logging::Logger::getInstance().warn("Invalid value for " + key + ": \"" + value + "\", keeping " +
                                                std::to_string(target));
        }
    };

    if (key == "photos.dir") photosDir_ = value;
    else if (key == "templates.path") templatesPath_ = value;
    else if (key == "printer.config_path") printerConfigPath_ = value;
    else if (key == "session.countdown_seconds") toInt(countdownSeconds_, 1);
    else if (key == "session.quick_review_ms") toInt(quickReviewMs_, 0);
    else if (key == "session.inactivity_seconds") toInt(inactivitySeconds_, 1);
    else if (key == "session.inactivity_check_ms") toInt(inactivityCheckMs_, 10);
    else if (key == "capture.max_retries") toInt(maxCaptureRetries_, 0);
    else if (key == "capture.command") captureCommand_ = value;
    else if (key == "capture.width") toInt(captureWidth_, 1);
    else if (key == "capture.height") toInt(captureHeight_, 1);
    else if (key == "capture.quality") toInt(captureQuality_, 1);
    else if (key == "capture.timeout_ms") toInt(captureTimeoutMs_, 1);
    else if (key == "camera.preview_command") previewCommand_ = value;
    else if (key == "print.command") printCommand_ = value;
    else if (key == "print.options") printOptions_ = value;
    else if (key == "print.timeout_ms") toInt(printTimeoutMs_, 1);
    else if (key == "print.spool_dir") spoolDir_ = value;
    else if (key == "composition.mirror") mirrorPhotos_ = parseBool(value);
    else if (key == "composition.jpeg_quality") toInt(jpegQuality_, 1);
    else if (key == "input.devices") inputDevices_ = value;
    else if (key == "input.cancel_hold_ms") toInt(cancelHoldMs_, 1);
    else if (key == "input.enter_hold_cancels") enterHoldCancels_ = parseBool(value);
    else if (key.rfind("input.key.", 0) == 0) {
        std::string control = key.substr(std::string("input.key.").size());
        auto it = keyBindings_.find(control);
        if (it == keyBindings_.end()) {
            logging::Logger::getInstance().warn("Unknown input control in config: " + control);
        } else {
            toInt(it->second, 0);
        }
    }
    else if (key == "log.dir") logDir_ = value;
    else if (key == "log.level") logLevel_ = value;
    else {
        logging::Logger::getInstance().warn("Unknown config key: " + key);
    }
}

std::map<std::string, std::string> ConfigManager::getAll() const {
    std::map<std::string, std::string> kv = {
        {"photos.dir", photosDir_},
        {"templates.path", templatesPath_},
        {"printer.config_path", printerConfigPath_},
        {"session.countdown_seconds", std::to_string(countdownSeconds_)},
        {"session.quick_review_ms", std::to_string(quickReviewMs_)},
        {"session.inactivity_seconds", std::to_string(inactivitySeconds_)},
        {"session.inactivity_check_ms", std::to_string(inactivityCheckMs_)},
        {"capture.max_retries", std::to_string(maxCaptureRetries_)},
        {"capture.command", captureCommand_},
        {"capture.width", std::to_string(captureWidth_)},
        {"capture.height", std::to_string(captureHeight_)},
        {"capture.quality", std::to_string(captureQuality_)},
        {"capture.timeout_ms", std::to_string(captureTimeoutMs_)},
        {"camera.preview_command", previewCommand_},
        {"print.command", printCommand_},
        {"print.options", printOptions_},
        {"print.timeout_ms", std::to_string(printTimeoutMs_)},
        {"print.spool_dir", spoolDir_},
        {"composition.mirror", mirrorPhotos_ ? "true" : "false"},
        {"composition.jpeg_quality", std::to_string(jpegQuality_)},
        {"input.devices", inputDevices_},
        {"input.cancel_hold_ms", std::to_string(cancelHoldMs_)},
        {"input.enter_hold_cancels", enterHoldCancels_ ? "true" : "false"},
        {"log.dir", logDir_},
        {"log.level", logLevel_},
    };
    for (const auto& binding : keyBindings_) {
        kv["input.key." + binding.first] = std::to_string(binding.second);
    }
    return kv;
}

void ConfigManager::setFromMap(const std::map<std::string, std::string>& kv) {
    for (const auto& entry : kv) {
        setValue(entry.first, entry.second);
    }
}

void ConfigManager::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + configPath);
    }

    file << "# Photo booth controller configuration\n";
    for (const auto& entry : getAll()) {
        file << entry.first << "=" << entry.second << "\n";
    }
}

std::string ConfigManager::getPrinterConfigPath() const {
    if (!printerConfigPath_.empty()) {
        return printerConfigPath_;
    }
    return (std::filesystem::path(photosDir_) / "printer.json").string();
}

core::SessionSettings ConfigManager::getSessionSettings() const {
    core::SessionSettings settings;
    settings.countdownSeconds = countdownSeconds_;
    settings.quickReview = std::chrono::milliseconds(quickReviewMs_);
    settings.inactivityTimeout = std::chrono::seconds(inactivitySeconds_);
    settings.inactivityCheckInterval = std::chrono::milliseconds(inactivityCheckMs_);
    settings.maxCaptureRetries = maxCaptureRetries_;
    return settings;
}

std::vector<std::string> ConfigManager::getPrintOptions() const {
    return splitList(printOptions_);
}

std::string ConfigManager::getSpoolDir() const {
    if (!spoolDir_.empty()) {
        return spoolDir_;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::string("/tmp") : tmp.string();
}

std::vector<std::string> ConfigManager::getInputDevices() const {
    return splitList(inputDevices_);
}

} // namespace photobooth::config
