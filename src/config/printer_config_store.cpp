// src/config/printer_config_store.cpp
#include "config/printer_config_store.h"
#include "logging/logger.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace photobooth::config {

PrinterConfigStore::PrinterConfigStore(std::string filePath)
    : filePath_(std::move(filePath)) {
}

PrinterConfig PrinterConfigStore::load() const {
    PrinterConfig config;
    std::ifstream file(filePath_);
    if (!file.is_open()) {
        logging::Logger::getInstance().debug("Printer config not found: " + filePath_);
        return config;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(file);
        config.queueName = json.value("printer", "");
    } catch (const nlohmann::json::exception& e) {
        logging::Logger::getInstance().warn("Ignoring unreadable printer config " + filePath_ + ": " + e.what());
        config.queueName.clear();
    }
    return config;
}

void PrinterConfigStore::save(const PrinterConfig& config) const {
    std::filesystem::path path(filePath_);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory for printer config: " + ec.message());
        }
    }

    std::ofstream file(filePath_, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write printer config: " + filePath_);
    }
    nlohmann::json json = {{"printer", config.queueName}};
    file << json.dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed writing printer config: " + filePath_);
    }
    logging::Logger::getInstance().info("Printer queue saved: \"" + config.queueName + "\" -> " + filePath_);
}

} // namespace photobooth::config
