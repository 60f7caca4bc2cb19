// src/vendor_adapters/cups/cups_printer_adapter.cpp
#include "vendor_adapters/cups/cups_printer_adapter.h"
#include "common/process_runner.h"
#include "logging/logger.h"

namespace photobooth::cups {

CupsPrinterAdapter::CupsPrinterAdapter(const std::string& deviceId, CupsSettings settings)
    : deviceId_(deviceId)
    , settings_(std::move(settings)) {
}

std::vector<std::string> CupsPrinterAdapter::buildCommand(const std::string& filePath,
                                                          const std::string& queueName) const {
    std::vector<std::string> argv = {settings_.lpCommand};
    if (!queueName.empty()) {
        argv.push_back("-d");
        argv.push_back(queueName);
    }
    for (const auto& option : settings_.options) {
        argv.push_back("-o");
        argv.push_back(option);
    }
    argv.push_back(filePath);
    return argv;
}

devices::SpoolResult CupsPrinterAdapter::printFile(const std::string& filePath, const std::string& queueName,
                                                   devices::CancelToken cancel) {
    devices::SpoolResult result;
    if (devices::isCancelled(cancel)) {
        result.status = devices::SpoolStatus::REJECTED;
        result.reason = "print cancelled";
        return result;
    }

    std::vector<std::string> argv = buildCommand(filePath, queueName);
    logging::Logger::getInstance().info("Printer " + deviceId_ + " running: " + common::ProcessRunner::describe(argv));
    common::ProcessResult proc = common::ProcessRunner::run(argv, settings_.timeout, cancel.get());

    if (!proc.started) {
        result.status = devices::SpoolStatus::REJECTED;
        result.reason = proc.output;
    } else if (proc.timedOut) {
        result.status = devices::SpoolStatus::TIMEOUT;
        result.reason = settings_.lpCommand + " did not finish within " +
                        std::to_string(settings_.timeout.count()) + " ms";
    } else if (proc.cancelled) {
        result.status = devices::SpoolStatus::REJECTED;
        result.reason = "print cancelled";
    } else if (proc.exitCode != 0) {
        result.status = devices::SpoolStatus::REJECTED;
        result.reason = proc.output.empty() ? settings_.lpCommand + " exited with " + std::to_string(proc.exitCode)
                                            : proc.output;
    } else {
        result.status = devices::SpoolStatus::ACCEPTED;
        result.reason = proc.output;
    }
    return result;
}

} // namespace photobooth::cups
