// src/main.cpp
// Photo Booth Controller - Main Entry Point

#include "logging/logger.h"
#include "capture/capture_orchestrator.h"
#include "composition/composition_engine.h"
#include "config/config_manager.h"
#include "config/printer_config_store.h"
#include "core/event_queue.h"
#include "core/session_controller.h"
#include "core/task_worker.h"
#include "core/timer_scheduler.h"
#include "input/evdev_button_reader.h"
#include "input/input_event_source.h"
#include "printing/print_dispatcher.h"
#include "templates/template_catalog.h"
#include "vendor_adapters/cups/cups_printer_adapter.h"
#include "vendor_adapters/rpicam/rpicam_camera_adapter.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace photobooth;

namespace {
    std::atomic<bool> g_running(true);

    struct CommandLine {
        std::string configPath;
        bool showPrinter = false;
        bool setPrinter = false;
        std::string printerQueue;
        bool help = false;
    };

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [--config <file>] [--set-printer <queue>] [--show-printer]\n"
                  << "  --config <file>        configuration file (default ./photobooth.ini)\n"
                  << "  --set-printer <queue>  store the print queue name and exit\n"
                  << "  --show-printer         print the configured queue name and exit\n";
    }

    bool parseCommandLine(int argc, char* argv[], CommandLine& out) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                out.configPath = argv[++i];
            } else if (arg == "--set-printer" && i + 1 < argc) {
                out.setPrinter = true;
                out.printerQueue = argv[++i];
            } else if (arg == "--show-printer") {
                out.showPrinter = true;
            } else if (arg == "--help" || arg == "-h") {
                out.help = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        }
        return true;
    }
}

// Signal handler for graceful shutdown
void SignalHandler(int signal) {
    (void)signal;
    g_running = false;
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }
    if (cmd.help) {
        printUsage(argv[0]);
        return 0;
    }

    logging::Logger::getInstance().info("Photo Booth Controller starting...");

    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    try {
        config::ConfigManager::getInstance().initialize(cmd.configPath);
        auto& config = config::ConfigManager::getInstance();

        logging::Logger::getInstance().setMinLevel(logging::parseLogLevel(config.getLogLevel()));
        logging::Logger::getInstance().initialize(config.getLogDir(), "photobooth.log");

        config::PrinterConfigStore printerStore(config.getPrinterConfigPath());
        if (cmd.setPrinter) {
            printerStore.save(config::PrinterConfig{cmd.printerQueue});
            std::cout << "Printer set to \"" << cmd.printerQueue << "\" in " << printerStore.getFilePath() << std::endl;
            return 0;
        }
        if (cmd.showPrinter) {
            config::PrinterConfig current = printerStore.load();
            std::cout << (current.queueName.empty() ? "(not configured)" : current.queueName) << std::endl;
            return 0;
        }

        templates::TemplateCatalog catalog = templates::TemplateCatalog::loadFromFile(config.getTemplatesPath());

        core::EventQueue queue;
        core::TimerScheduler timers(queue);
        core::TaskWorker worker;

        // Camera (rpicam-still)
        rpicam::RpicamSettings cameraSettings;
        cameraSettings.stillCommand = config.getCaptureCommand();
        cameraSettings.width = config.getCaptureWidth();
        cameraSettings.height = config.getCaptureHeight();
        cameraSettings.quality = config.getCaptureQuality();
        cameraSettings.timeout = std::chrono::milliseconds(config.getCaptureTimeoutMs());
        cameraSettings.previewCommand = config.getPreviewCommand();
        auto camera = std::make_shared<rpicam::RpicamCameraAdapter>("rpicam_camera_001", cameraSettings);

        // Printer (CUPS lp)
        cups::CupsSettings printerSettings;
        printerSettings.lpCommand = config.getPrintCommand();
        printerSettings.options = config.getPrintOptions();
        printerSettings.timeout = std::chrono::milliseconds(config.getPrintTimeoutMs());
        auto printer = std::make_shared<cups::CupsPrinterAdapter>("cups_printer_001", printerSettings);

        capture::CaptureOrchestrator captureOrchestrator(camera, worker, queue.sink(), config.getPhotosDir());

        composition::CompositionSettings compositionSettings;
        compositionSettings.mirror = config.getMirrorPhotos();
        composition::CompositionEngine compositionEngine(compositionSettings);

        printing::PrintSettings printSettings;
        printSettings.spoolDir = config.getSpoolDir();
        printSettings.jpegQuality = config.getJpegQuality();
        printing::PrintDispatcher printDispatcher(printer, worker, queue.sink(), printSettings);

        core::SessionController controller(catalog, captureOrchestrator, compositionEngine, printDispatcher,
                                           printerStore, worker, timers, queue, config.getSessionSettings());
        controller.setStateListener([](const nlohmann::json& snapshot) {
            logging::Logger::getInstance().info(
                "HUD " + snapshot.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        });

        // Operator input
        input::InputSettings inputSettings;
        inputSettings.cancelHold = std::chrono::milliseconds(config.getCancelHoldMs());
        inputSettings.enterHoldCancels = config.getEnterHoldCancels();
        input::InputEventSource inputSource(queue.sink(), inputSettings);
        input::EvdevButtonReader buttonReader(inputSource, config.getInputDevices(),
                                              input::EvdevButtonReader::keyMapFromBindings(config.getKeyBindings()));

        if (!worker.start() || !timers.start()) {
            logging::Logger::getInstance().error("Failed to start background threads");
            return 1;
        }
        if (!camera->startPreviewStream()) {
            logging::Logger::getInstance().warn("Preview stream not started");
        }
        buttonReader.start();
        controller.start();

        logging::Logger::getInstance().info("Photo Booth Controller started successfully");
        std::cout << "Photo Booth Controller is running..." << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl;

        controller.run(g_running);

        buttonReader.stop();
        captureOrchestrator.cancel();
        printDispatcher.cancel();
        timers.stop();
        worker.stop();
        camera->stopPreviewStream();
        logging::Logger::getInstance().info("Photo Booth Controller stopped");

    } catch (const std::exception& e) {
        logging::Logger::getInstance().error("Exception in main: " + std::string(e.what()));
        std::cerr << "Error: " << e.what() << std::endl;
        logging::Logger::getInstance().shutdown();
        return 1;
    }

    logging::Logger::getInstance().shutdown();
    return 0;
}
