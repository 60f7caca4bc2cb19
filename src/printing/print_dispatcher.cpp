// src/printing/print_dispatcher.cpp
#include "printing/print_dispatcher.h"
#include "logging/logger.h"
#include <filesystem>
#include <fstream>

namespace photobooth::printing {

PrintDispatcher::PrintDispatcher(std::shared_ptr<devices::IPrinter> printer,
                                 core::TaskWorker& worker,
                                 core::EventSink sink,
                                 PrintSettings settings)
    : printer_(std::move(printer))
    , worker_(worker)
    , sink_(std::move(sink))
    , settings_(std::move(settings)) {
}

void PrintDispatcher::submit(std::shared_ptr<const composition::CompositeImage> composite,
                             const config::PrinterConfig& printerConfig,
                             const std::string& sessionId) {
    if (printerConfig.queueName.empty()) {
        logging::Logger::getInstance().warn("Print requested but no printer queue is configured");
        core::Event event = core::Event::forSession(core::EventType::PRINT_FAILED, sessionId);
        event.printError = core::PrintErrorCode::NOT_CONFIGURED;
        event.message = "No printer configured";
        sink_(std::move(event));
        return;
    }

    uint64_t jobNumber = ++jobCounter_;
    std::string spoolPath = (std::filesystem::path(settings_.spoolDir) /
                             ("photobooth_" + sessionId + "_" + std::to_string(jobNumber) + ".jpg")).string();
    std::string queueName = printerConfig.queueName;
    devices::CancelToken cancelToken = devices::makeCancelToken();
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        activeCancel_ = cancelToken;
    }

    logging::Logger::getInstance().info("Print job " + std::to_string(jobNumber) + " for session " + sessionId +
                                        " -> queue \"" + queueName + "\"");

    core::WorkerTask task;
    task.name = "print " + sessionId + " #" + std::to_string(jobNumber);
    task.execute = [this, composite, queueName, sessionId, spoolPath, cancelToken]() {
        runPrint(composite, queueName, sessionId, spoolPath, cancelToken);
    };
    worker_.enqueue(std::move(task));
}

void PrintDispatcher::runPrint(std::shared_ptr<const composition::CompositeImage> composite,
                               const std::string& queueName,
                               const std::string& sessionId,
                               const std::string& spoolPath,
                               const devices::CancelToken& cancelToken) {
    core::Event event = core::Event::forSession(core::EventType::PRINT_FAILED, sessionId);
    if (devices::isCancelled(cancelToken)) {
        event.printError = core::PrintErrorCode::SPOOLER_REJECTED;
        event.message = "print cancelled";
        logging::Logger::getInstance().info("Print job for session " + sessionId + " cancelled before spooling");
        sink_(std::move(event));
        return;
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = composite->encodeJpeg(settings_.jpegQuality);
    } catch (const std::exception& e) {
        event.printError = core::PrintErrorCode::WRITE_FAILED;
        event.message = e.what();
        logging::Logger::getInstance().error("Print aborted: " + event.message);
        sink_(std::move(event));
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(spoolPath).parent_path(), ec);
    std::ofstream ofs(spoolPath, std::ios::binary);
    if (!ofs || !ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
        event.printError = core::PrintErrorCode::WRITE_FAILED;
        event.message = "Failed to write spool file " + spoolPath;
        logging::Logger::getInstance().error(event.message);
        sink_(std::move(event));
        return;
    }
    ofs.close();

    devices::SpoolResult result = printer_->printFile(spoolPath, queueName, cancelToken);

    std::filesystem::remove(spoolPath, ec);
    if (ec) {
        logging::Logger::getInstance().warn("Could not remove spool file " + spoolPath + ": " + ec.message());
    }

    switch (result.status) {
        case devices::SpoolStatus::ACCEPTED:
            event.type = core::EventType::PRINT_COMPLETED;
            logging::Logger::getInstance().info("Print accepted by spooler for session " + sessionId);
            break;
        case devices::SpoolStatus::TIMEOUT:
            event.printError = core::PrintErrorCode::SPOOLER_TIMEOUT;
            event.message = result.reason.empty() ? "Print spooler did not answer" : result.reason;
            logging::Logger::getInstance().error("Print timed out: " + event.message);
            break;
        case devices::SpoolStatus::REJECTED:
        default:
            event.printError = core::PrintErrorCode::SPOOLER_REJECTED;
            event.message = result.reason;
            logging::Logger::getInstance().error("Print rejected: " + event.message);
            break;
    }
    sink_(std::move(event));
}

void PrintDispatcher::cancel() {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    if (activeCancel_) {
        activeCancel_->store(true);
        activeCancel_.reset();
    }
}

} // namespace photobooth::printing
