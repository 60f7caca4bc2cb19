// include/config/printer_config_store.h
#pragma once

#include <string>

namespace photobooth::config {

struct PrinterConfig {
    std::string queueName;   // print spooler queue; empty = not configured
};

// JSON-backed printer settings: {"printer": "<queueName>"}
class PrinterConfigStore {
public:
    explicit PrinterConfigStore(std::string filePath);

    // Missing or unreadable file yields an empty queue name
    PrinterConfig load() const;

    // Throws std::runtime_error when the file cannot be written
    void save(const PrinterConfig& config) const;

    const std::string& getFilePath() const { return filePath_; }

private:
    std::string filePath_;
};

} // namespace photobooth::config
