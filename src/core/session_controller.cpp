// src/core/session_controller.cpp
#include "core/session_controller.h"
#include "common/session_id_generator.h"
#include "logging/logger.h"
#include "selection/selection_engine.h"
#include <vector>

namespace photobooth::core {

namespace {

// Device output can be cut mid-character; the snapshot must stay serializable
std::string toDisplayText(const std::string& raw) {
    std::string quoted = nlohmann::json(raw).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(quoted).get<std::string>();
}

} // namespace

SessionController::SessionController(const templates::TemplateCatalog& catalog,
                                     capture::CaptureOrchestrator& capture,
                                     const composition::CompositionEngine& compositionEngine,
                                     printing::PrintDispatcher& printDispatcher,
                                     const config::PrinterConfigStore& printerConfigStore,
                                     TaskWorker& worker,
                                     ITimerService& timers,
                                     EventQueue& queue,
                                     SessionSettings settings,
                                     Clock clock)
    : catalog_(catalog)
    , capture_(capture)
    , compositionEngine_(compositionEngine)
    , printDispatcher_(printDispatcher)
    , printerConfigStore_(printerConfigStore)
    , worker_(worker)
    , timers_(timers)
    , queue_(queue)
    , settings_(settings)
    , clock_(std::move(clock)) {
}

void SessionController::start() {
    logging::Logger::getInstance().info("Session controller started with " + std::to_string(catalog_.size()) +
                                        " template(s), countdown " + std::to_string(settings_.countdownSeconds) +
                                        "s, inactivity timeout " +
                                        std::to_string(settings_.inactivityTimeout.count()) + "ms");
    timers_.schedule(settings_.inactivityCheckInterval, Event::input(EventType::INACTIVITY_CHECK));
    publishState();
}

void SessionController::run(const std::atomic<bool>& keepRunning) {
    while (keepRunning && !shutdownRequested_) {
        pumpOne(std::chrono::milliseconds(100));
    }
    logging::Logger::getInstance().info("Session controller loop finished");
}

bool SessionController::pumpOne(std::chrono::milliseconds timeout) {
    std::optional<Event> event = queue_.waitPop(timeout);
    if (!event) {
        return false;
    }
    handleEvent(*event);
    return true;
}

void SessionController::handleEvent(const Event& event) {
    if (event.type == EventType::SHUTDOWN) {
        logging::Logger::getInstance().info("Shutdown requested");
        shutdownRequested_ = true;
        return;
    }
    if (event.type == EventType::INACTIVITY_CHECK) {
        handleInactivityCheck();
        return;
    }
    if (isStale(event)) {
        logging::Logger::getInstance().debug("Discarding stale " + eventTypeToString(event.type) +
                                             (event.sessionId.empty() ? "" : " of session " + event.sessionId) +
                                             " in " + sessionStateToString(state_));
        return;
    }

    if (session_) {
        session_->lastActivityAt = clock_();
    }

    if (event.type == EventType::LONG_PRESS_CANCEL || event.type == EventType::INACTIVITY_TIMEOUT) {
        if (state_ != SessionState::ATTRACT) {
            abandonSession(event.type == EventType::LONG_PRESS_CANCEL ? "cancelled" : "inactivity timeout");
            publishState();
        }
        return;
    }

    switch (state_) {
        case SessionState::ATTRACT: onAttract(event); break;
        case SessionState::TEMPLATE: onTemplate(event); break;
        case SessionState::COUNTDOWN: onCountdown(event); break;
        case SessionState::CAPTURING: onCapturing(event); break;
        case SessionState::QUICK_REVIEW: onQuickReview(event); break;
        case SessionState::SELECTION: onSelection(event); break;
        case SessionState::REVIEW: onReview(event); break;
        case SessionState::PRINTING: onPrinting(event); break;
    }
    publishState();
}

bool SessionController::belongsToSession(const Event& event) const {
    return session_ && !event.sessionId.empty() && event.sessionId == session_->sessionId;
}

bool SessionController::isStale(const Event& event) const {
    switch (event.type) {
        case EventType::TIMER_TICK:
            return event.generation != timerGeneration_;
        case EventType::CAPTURE_COMPLETED:
        case EventType::CAPTURE_FAILED:
        case EventType::PRINT_COMPLETED:
        case EventType::PRINT_FAILED:
            return !belongsToSession(event);
        case EventType::COMPOSITION_READY:
        case EventType::COMPOSITION_FAILED:
            return !belongsToSession(event) || event.generation != compositionGeneration_;
        default:
            return false;
    }
}

void SessionController::onAttract(const Event& event) {
    switch (event.type) {
        case EventType::START:
        case EventType::SHUTTER:
        case EventType::ENTER:
            beginSession();
            transitionTo(SessionState::TEMPLATE);
            break;
        default:
            break;
    }
}

void SessionController::onTemplate(const Event& event) {
    const size_t count = catalog_.size();
    switch (event.type) {
        case EventType::NEXT:
            templateIndex_ = (templateIndex_ + 1) % count;
            session_->tmpl = &catalog_.at(templateIndex_);
            logging::Logger::getInstance().debug("Template: " + session_->tmpl->id);
            break;
        case EventType::PREV:
            templateIndex_ = (templateIndex_ + count - 1) % count;
            session_->tmpl = &catalog_.at(templateIndex_);
            logging::Logger::getInstance().debug("Template: " + session_->tmpl->id);
            break;
        case EventType::SHUTTER:
        case EventType::ENTER:
            logging::Logger::getInstance().info("Session " + session_->sessionId + " uses template " +
                                                session_->tmpl->id + ", " +
                                                std::to_string(session_->requiredShots()) + " shots");
            enterCountdown();
            break;
        default:
            break;
    }
}

void SessionController::onCountdown(const Event& event) {
    if (event.type == EventType::SHUTTER) {
        enterCapturing();
        return;
    }
    if (event.type == EventType::TIMER_TICK && event.timer == TimerKind::COUNTDOWN) {
        --countdownRemaining_;
        if (countdownRemaining_ <= 0) {
            enterCapturing();
        } else {
            scheduleTimer(settings_.countdownTick, TimerKind::COUNTDOWN);
        }
    }
}

void SessionController::onCapturing(const Event& event) {
    if (event.type == EventType::CAPTURE_COMPLETED) {
        session_->capturedPhotos.push_back(event.photo);
        session_->captureRetries = 0;
        session_->lastError.clear();
        retrying_ = false;
        transitionTo(SessionState::QUICK_REVIEW);
        ++timerGeneration_;
        scheduleTimer(settings_.quickReview, TimerKind::QUICK_REVIEW);
        return;
    }

    if (event.type == EventType::CAPTURE_FAILED) {
        ++session_->captureRetries;
        session_->lastError = devices::captureErrorToString(event.captureError) +
                              (event.message.empty() ? "" : ": " + event.message);
        if (session_->captureRetries > settings_.maxCaptureRetries) {
            abandonSession("capture failed " + std::to_string(session_->captureRetries) + " times (" +
                           session_->lastError + ")");
            return;
        }
        logging::Logger::getInstance().warn("Retrying shot " + std::to_string(session_->capturedPhotos.size() + 1) +
                                            ", attempt " + std::to_string(session_->captureRetries + 1) + " of " +
                                            std::to_string(settings_.maxCaptureRetries + 1));
        retrying_ = true;
        if (!capture_.captureNext(*session_)) {
            abandonSession("camera busy");
        }
    }
}

void SessionController::onQuickReview(const Event& event) {
    if (event.type != EventType::TIMER_TICK || event.timer != TimerKind::QUICK_REVIEW) {
        return;
    }
    if (session_->capturedPhotos.size() < session_->requiredShots()) {
        enterCountdown();
    } else {
        enterSelection();
    }
}

void SessionController::onSelection(const Event& event) {
    selection::SelectionEngine engine(session_->selectedIndices, session_->selectionCursor,
                                      session_->capturedPhotos.size(), session_->slotCount());
    switch (event.type) {
        case EventType::NEXT:
            engine.moveCursor(selection::CursorDirection::FORWARD);
            break;
        case EventType::PREV:
            engine.moveCursor(selection::CursorDirection::BACKWARD);
            break;
        case EventType::SHUTTER: {
            selection::ToggleResult result = engine.toggle();
            if (result == selection::ToggleResult::REJECTED_AT_CAPACITY) {
                logging::Logger::getInstance().debug("Selection full (" + std::to_string(session_->slotCount()) +
                                                     "), photo " + std::to_string(engine.cursor()) + " not added");
            }
            break;
        }
        case EventType::ENTER:
            if (engine.isComplete()) {
                enterReview();
            } else {
                logging::Logger::getInstance().debug("Select " + std::to_string(session_->slotCount()) +
                                                     " photo(s) first, have " +
                                                     std::to_string(session_->selectedIndices.size()));
            }
            break;
        default:
            break;
    }
}

void SessionController::onReview(const Event& event) {
    switch (event.type) {
        case EventType::NEXT:
        case EventType::PREV:
            session_->activeFilter = composition::cycleFilter(session_->activeFilter,
                                                              event.type == EventType::NEXT ? 1 : -1);
            logging::Logger::getInstance().debug("Filter: " + composition::filterToString(session_->activeFilter));
            requestComposition();
            break;
        case EventType::COMPOSITION_READY:
            session_->composite = event.composite;
            compositionPending_ = false;
            logging::Logger::getInstance().info("Composite ready (" +
                                                composition::filterToString(event.composite->filter) + ")");
            break;
        case EventType::COMPOSITION_FAILED:
            logging::Logger::getInstance().error("Composition failed: " + event.message);
            abandonSession("composition failed: " + event.message);
            break;
        case EventType::SHUTTER:
        case EventType::ENTER:
            if (compositionPending_ || !session_->composite ||
                session_->composite->filter != session_->activeFilter) {
                logging::Logger::getInstance().debug("Print ignored, composite not ready");
                break;
            }
            submitPrint();
            break;
        default:
            break;
    }
}

void SessionController::onPrinting(const Event& event) {
    if (event.type == EventType::PRINT_COMPLETED) {
        logging::Logger::getInstance().info("Session " + session_->sessionId + " printed");
        session_.reset();
        retrying_ = false;
        transitionTo(SessionState::ATTRACT);
        return;
    }
    if (event.type == EventType::PRINT_FAILED) {
        session_->lastError = printErrorToString(event.printError) +
                              (event.message.empty() ? "" : ": " + event.message);
        logging::Logger::getInstance().warn("Print failed for session " + session_->sessionId + ": " +
                                            session_->lastError);
        transitionTo(SessionState::REVIEW);
    }
}

void SessionController::transitionTo(SessionState next) {
    if (next == state_) {
        return;
    }
    logging::Logger::getInstance().info("State: " + sessionStateToString(state_) + " -> " +
                                        sessionStateToString(next));
    state_ = next;
}

void SessionController::beginSession() {
    Session session;
    session.sessionId = common::SessionIdGenerator::generate();
    session.tmpl = &catalog_.at(templateIndex_);
    session.activeFilter = composition::FilterType::NONE;
    session.startedAt = clock_();
    session.lastActivityAt = session.startedAt;
    session_ = std::move(session);

    retrying_ = false;
    compositionPending_ = false;
    lastAbandonReason_.clear();
    logging::Logger::getInstance().info("Session " + session_->sessionId + " started");
}

void SessionController::enterCountdown() {
    transitionTo(SessionState::COUNTDOWN);
    ++timerGeneration_;
    countdownRemaining_ = settings_.countdownSeconds;
    scheduleTimer(settings_.countdownTick, TimerKind::COUNTDOWN);
}

void SessionController::enterCapturing() {
    transitionTo(SessionState::CAPTURING);
    ++timerGeneration_;
    countdownRemaining_ = 0;
    if (!capture_.captureNext(*session_)) {
        abandonSession("camera busy");
    }
}

void SessionController::enterSelection() {
    session_->selectionCursor = 0;
    session_->selectedIndices.clear();
    transitionTo(SessionState::SELECTION);
}

void SessionController::enterReview() {
    session_->composite.reset();
    session_->lastError.clear();
    transitionTo(SessionState::REVIEW);
    requestComposition();
}

void SessionController::requestComposition() {
    const uint64_t generation = ++compositionGeneration_;
    compositionPending_ = true;

    std::vector<std::string> paths;
    for (size_t index : session_->selectedIndices) {
        paths.push_back(session_->capturedPhotos.at(index).path);
    }
    const templates::Template* tmpl = session_->tmpl;
    const composition::FilterType filter = session_->activeFilter;
    const std::string sessionId = session_->sessionId;
    const composition::CompositionEngine& engine = compositionEngine_;
    EventQueue& queue = queue_;

    WorkerTask task;
    task.name = "compose " + sessionId + " (" + composition::filterToString(filter) + ")";
    task.execute = [&engine, &queue, tmpl, paths, filter, sessionId, generation]() {
        try {
            auto image = std::make_shared<const composition::CompositeImage>(engine.compose(*tmpl, paths, filter));
            Event ready = Event::forSession(EventType::COMPOSITION_READY, sessionId, generation);
            ready.composite = std::move(image);
            queue.post(std::move(ready));
        } catch (const std::exception& e) {
            Event failed = Event::forSession(EventType::COMPOSITION_FAILED, sessionId, generation);
            failed.message = e.what();
            queue.post(std::move(failed));
        }
    };
    logging::Logger::getInstance().debug("Dispatching " + task.name);
    worker_.enqueue(std::move(task));
}

void SessionController::submitPrint() {
    config::PrinterConfig printerConfig = printerConfigStore_.load();
    session_->lastError.clear();
    transitionTo(SessionState::PRINTING);
    printDispatcher_.submit(session_->composite, printerConfig, session_->sessionId);
}

void SessionController::abandonSession(const std::string& reason) {
    logging::Logger::getInstance().warn("Session " + (session_ ? session_->sessionId : std::string("-")) +
                                        " abandoned: " + reason);
    capture_.cancel();
    printDispatcher_.cancel();
    ++timerGeneration_;
    ++compositionGeneration_;
    compositionPending_ = false;
    retrying_ = false;
    countdownRemaining_ = 0;
    session_.reset();
    lastAbandonReason_ = reason;
    transitionTo(SessionState::ATTRACT);
}

void SessionController::handleInactivityCheck() {
    if (session_ && state_ != SessionState::ATTRACT &&
        clock_() - session_->lastActivityAt >= settings_.inactivityTimeout) {
        handleEvent(Event::input(EventType::INACTIVITY_TIMEOUT));
    }
    timers_.schedule(settings_.inactivityCheckInterval, Event::input(EventType::INACTIVITY_CHECK));
}

void SessionController::scheduleTimer(std::chrono::milliseconds delay, TimerKind kind) {
    timers_.schedule(delay, Event::timerTick(kind, timerGeneration_));
}

nlohmann::json SessionController::getStateSnapshot() const {
    nlohmann::json snapshot;
    snapshot["state"] = sessionStateToString(state_);
    snapshot["templateIndex"] = templateIndex_;

    const templates::Template& current = session_ && session_->tmpl ? *session_->tmpl : catalog_.at(templateIndex_);
    snapshot["templateId"] = current.id;
    snapshot["templateName"] = current.name;
    snapshot["slotCount"] = current.slotCount;
    snapshot["countdown"] = countdownRemaining_;
    snapshot["retrying"] = retrying_;

    if (session_) {
        const size_t captured = session_->capturedPhotos.size();
        const size_t required = session_->requiredShots();
        snapshot["sessionId"] = session_->sessionId;
        snapshot["captured"] = captured;
        snapshot["required"] = required;
        snapshot["remaining"] = captured < required ? required - captured : 0;
        snapshot["cursor"] = session_->selectionCursor;
        snapshot["selected"] = session_->selectedIndices;
        snapshot["filter"] = composition::filterToString(session_->activeFilter);
        snapshot["compositeReady"] = !compositionPending_ && session_->composite &&
                                     session_->composite->filter == session_->activeFilter;
        snapshot["lastError"] = toDisplayText(session_->lastError);
    } else {
        snapshot["sessionId"] = nullptr;
        snapshot["captured"] = 0;
        snapshot["required"] = 0;
        snapshot["remaining"] = 0;
        snapshot["cursor"] = 0;
        snapshot["selected"] = nlohmann::json::array();
        snapshot["filter"] = composition::filterToString(composition::FilterType::NONE);
        snapshot["compositeReady"] = false;
        snapshot["lastError"] = toDisplayText(lastAbandonReason_);
    }
    return snapshot;
}

void SessionController::publishState() {
    if (stateListener_) {
        stateListener_(getStateSnapshot());
    }
}

} // namespace photobooth::core
