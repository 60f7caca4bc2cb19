// include/printing/print_dispatcher.h
#pragma once

#include "composition/composite_image.h"
#include "config/printer_config_store.h"
#include "core/events.h"
#include "core/task_worker.h"
#include "devices/iprinter.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace photobooth::printing {

struct PrintSettings {
    std::string spoolDir;     // transient location for the encoded composite
    int jpegQuality = 95;
};

// Hands a composite to the print spooler. No retries: failures go back to the
// controller as PRINT_FAILED and the user decides.
class PrintDispatcher {
public:
    PrintDispatcher(std::shared_ptr<devices::IPrinter> printer,
                    core::TaskWorker& worker,
                    core::EventSink sink,
                    PrintSettings settings);

    // Result arrives as PRINT_COMPLETED / PRINT_FAILED for sessionId.
    // An empty queue name fails with NOT_CONFIGURED without touching the spooler.
    void submit(std::shared_ptr<const composition::CompositeImage> composite,
                const config::PrinterConfig& printerConfig,
                const std::string& sessionId);

    // Best-effort abort of the queued or running job
    void cancel();

private:
    void runPrint(std::shared_ptr<const composition::CompositeImage> composite,
                  const std::string& queueName,
                  const std::string& sessionId,
                  const std::string& spoolPath,
                  const devices::CancelToken& cancelToken);

    std::shared_ptr<devices::IPrinter> printer_;
    core::TaskWorker& worker_;
    core::EventSink sink_;
    PrintSettings settings_;
    std::atomic<uint64_t> jobCounter_{0};

    std::mutex cancelMutex_;
    devices::CancelToken activeCancel_;
};

} // namespace photobooth::printing
