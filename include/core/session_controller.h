// include/core/session_controller.h
#pragma once

#include "capture/capture_orchestrator.h"
#include "composition/composition_engine.h"
#include "config/printer_config_store.h"
#include "core/event_queue.h"
#include "core/events.h"
#include "core/session.h"
#include "core/session_settings.h"
#include "core/task_worker.h"
#include "core/timer_scheduler.h"
#include "printing/print_dispatcher.h"
#include "templates/template_catalog.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace photobooth::core {

using Clock = std::function<std::chrono::steady_clock::time_point()>;
using StateListener = std::function<void(const nlohmann::json& snapshot)>;

// Session Controller (root of the booth)
// Owns the state machine and the single Session. Only this class mutates session
// state; every other component reports back through the EventQueue.
class SessionController {
public:
    SessionController(const templates::TemplateCatalog& catalog,
                      capture::CaptureOrchestrator& capture,
                      const composition::CompositionEngine& compositionEngine,
                      printing::PrintDispatcher& printDispatcher,
                      const config::PrinterConfigStore& printerConfigStore,
                      TaskWorker& worker,
                      ITimerService& timers,
                      EventQueue& queue,
                      SessionSettings settings,
                      Clock clock = [] { return std::chrono::steady_clock::now(); });

    // Arms the periodic inactivity check
    void start();

    // Processes queued events until SHUTDOWN arrives or keepRunning turns false
    void run(const std::atomic<bool>& keepRunning);

    // Waits up to timeout for one event and handles it; false when none arrived
    bool pumpOne(std::chrono::milliseconds timeout);

    void handleEvent(const Event& event);

    SessionState getState() const { return state_; }
    const Session* getSession() const { return session_ ? &*session_ : nullptr; }
    size_t getTemplateIndex() const { return templateIndex_; }
    int getCountdownRemaining() const { return countdownRemaining_; }
    bool isShutdownRequested() const { return shutdownRequested_; }

    nlohmann::json getStateSnapshot() const;

    void setStateListener(StateListener listener) { stateListener_ = std::move(listener); }

private:
    // One handler per state; events a state does not expect are ignored
    void onAttract(const Event& event);
    void onTemplate(const Event& event);
    void onCountdown(const Event& event);
    void onCapturing(const Event& event);
    void onQuickReview(const Event& event);
    void onSelection(const Event& event);
    void onReview(const Event& event);
    void onPrinting(const Event& event);

    void transitionTo(SessionState next);
    void beginSession();
    void enterCountdown();
    void enterCapturing();
    void enterSelection();
    void enterReview();
    void requestComposition();
    void submitPrint();
    void abandonSession(const std::string& reason);
    void handleInactivityCheck();

    bool isStale(const Event& event) const;
    bool belongsToSession(const Event& event) const;
    void scheduleTimer(std::chrono::milliseconds delay, TimerKind kind);
    void publishState();

    const templates::TemplateCatalog& catalog_;
    capture::CaptureOrchestrator& capture_;
    const composition::CompositionEngine& compositionEngine_;
    printing::PrintDispatcher& printDispatcher_;
    const config::PrinterConfigStore& printerConfigStore_;
    TaskWorker& worker_;
    ITimerService& timers_;
    EventQueue& queue_;
    SessionSettings settings_;
    Clock clock_;

    SessionState state_{SessionState::ATTRACT};
    std::optional<Session> session_;
    size_t templateIndex_{0};
    int countdownRemaining_{0};
    bool retrying_{false};
    bool compositionPending_{false};
    std::string lastAbandonReason_;

    uint64_t timerGeneration_{0};
    uint64_t compositionGeneration_{0};
    bool shutdownRequested_{false};

    StateListener stateListener_;
};

} // namespace photobooth::core
