// tests/session_controller_test.cpp
#include "core/session_controller.h"
#include "test_fakes.h"
#include <gtest/gtest.h>
#include <memory>

using namespace photobooth;
using core::Event;
using core::EventType;
using core::SessionState;
using core::TimerKind;
using test_support::FakeCamera;
using test_support::FakePrinter;
using test_support::FakeTimerService;
using test_support::TempDir;

namespace {

const char* kCatalogJson = R"([
    {"id": "single_full", "name": "Single Full", "slots": 1,
     "rects": [{"leftPct": 10, "topPct": 15, "widthPct": 80, "heightPct": 70}]},
    {"id": "duo", "name": "Duo", "slots": 2,
     "rects": [{"leftPct": 5, "topPct": 5, "widthPct": 90, "heightPct": 42},
               {"leftPct": 5, "topPct": 52, "widthPct": 90, "heightPct": 42}]}
])";

core::SessionSettings testSettings() {
    core::SessionSettings settings;
    settings.countdownSeconds = 3;
    settings.maxCaptureRetries = 3;
    return settings;
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(worker.start());
        createController(testSettings());
    }

    void TearDown() override {
        worker.stop();
    }

    void createController(core::SessionSettings settings) {
        controller = std::make_unique<core::SessionController>(
            catalog, capture, engine, dispatcher, printerStore, worker, timers, queue, settings,
            [this] { return now; });
        controller->setStateListener([this](const nlohmann::json& snapshot) { lastSnapshot = snapshot; });
        controller->start();
    }

    void send(EventType type) {
        controller->handleEvent(Event::input(type));
    }

    // Delivers the most recently scheduled tick of this kind
    void fire(TimerKind kind) {
        const auto* scheduled = timers.lastTick(kind);
        ASSERT_NE(scheduled, nullptr);
        Event tick = scheduled->event;
        controller->handleEvent(tick);
    }

    void expireCountdown() {
        ASSERT_EQ(controller->getState(), SessionState::COUNTDOWN);
        for (int i = 0; i < 3; ++i) {
            fire(TimerKind::COUNTDOWN);
        }
        ASSERT_EQ(controller->getState(), SessionState::CAPTURING);
    }

    void pumpUntilState(SessionState target) {
        for (int i = 0; i < 20 && controller->getState() != target; ++i) {
            controller->pumpOne(std::chrono::milliseconds(2000));
        }
        ASSERT_EQ(controller->getState(), target);
    }

    void pumpUntilCompositeReady() {
        for (int i = 0; i < 20 && !controller->getStateSnapshot()["compositeReady"].get<bool>(); ++i) {
            controller->pumpOne(std::chrono::milliseconds(5000));
        }
        ASSERT_TRUE(controller->getStateSnapshot()["compositeReady"].get<bool>());
    }

    // One shot: countdown, capture, quick review
    void takeShot() {
        expireCountdown();
        pumpUntilState(SessionState::QUICK_REVIEW);
        fire(TimerKind::QUICK_REVIEW);
    }

    void driveToSelection() {
        send(EventType::START);
        send(EventType::ENTER);
        const size_t shots = controller->getSession()->requiredShots();
        for (size_t i = 0; i < shots; ++i) {
            takeShot();
        }
        ASSERT_EQ(controller->getState(), SessionState::SELECTION);
    }

    void driveToReview() {
        driveToSelection();
        const size_t slots = controller->getSession()->slotCount();
        for (size_t i = 0; i < slots; ++i) {
            send(EventType::SHUTTER);
            send(EventType::NEXT);
        }
        send(EventType::ENTER);
        ASSERT_EQ(controller->getState(), SessionState::REVIEW);
        pumpUntilCompositeReady();
    }

    TempDir dir;
    core::EventQueue queue;
    FakeTimerService timers;
    core::TaskWorker worker;
    std::shared_ptr<FakeCamera> camera = std::make_shared<FakeCamera>();
    std::shared_ptr<FakePrinter> printer = std::make_shared<FakePrinter>();
    capture::CaptureOrchestrator capture{camera, worker, queue.sink(), dir.file("photos")};
    composition::CompositionEngine engine;
    printing::PrintDispatcher dispatcher{printer, worker, queue.sink(), printing::PrintSettings{dir.file("spool"), 90}};
    config::PrinterConfigStore printerStore{dir.file("printer.json")};
    templates::TemplateCatalog catalog = templates::TemplateCatalog::fromJson(nlohmann::json::parse(kCatalogJson));
    std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    std::unique_ptr<core::SessionController> controller;
    nlohmann::json lastSnapshot;
};

TEST_F(SessionControllerTest, StartsInAttractWithoutSession) {
    EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
    EXPECT_EQ(controller->getSession(), nullptr);
    EXPECT_EQ(timers.countOf(EventType::INACTIVITY_CHECK), 1u);
    EXPECT_EQ(lastSnapshot["state"], "attract");
}

TEST_F(SessionControllerTest, AnyOfStartShutterEnterOpensTemplateChoice) {
    for (EventType type : {EventType::START, EventType::SHUTTER, EventType::ENTER}) {
        send(type);
        EXPECT_EQ(controller->getState(), SessionState::TEMPLATE);
        ASSERT_NE(controller->getSession(), nullptr);
        EXPECT_EQ(controller->getSession()->activeFilter, composition::FilterType::NONE);
        send(EventType::LONG_PRESS_CANCEL);
        EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
    }
}

TEST_F(SessionControllerTest, InputIgnoredInAttractExceptStart) {
    send(EventType::NEXT);
    send(EventType::PREV);
    send(EventType::LONG_PRESS_CANCEL);
    EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
    EXPECT_EQ(controller->getSession(), nullptr);
}

TEST_F(SessionControllerTest, TemplateCursorWrapsBothWays) {
    send(EventType::START);
    EXPECT_EQ(controller->getTemplateIndex(), 0u);

    send(EventType::PREV);
    EXPECT_EQ(controller->getTemplateIndex(), 1u);
    EXPECT_EQ(controller->getSession()->tmpl->id, "duo");

    send(EventType::NEXT);
    EXPECT_EQ(controller->getTemplateIndex(), 0u);
    send(EventType::NEXT);
    send(EventType::NEXT);
    send(EventType::NEXT);
    EXPECT_EQ(controller->getTemplateIndex(), 1u);
    EXPECT_EQ(lastSnapshot["templateId"], "duo");
}

TEST_F(SessionControllerTest, TemplateChoiceSurvivesIntoNextSession) {
    send(EventType::START);
    send(EventType::NEXT);
    send(EventType::LONG_PRESS_CANCEL);

    send(EventType::START);
    EXPECT_EQ(controller->getSession()->tmpl->id, "duo");
    EXPECT_EQ(controller->getSession()->requiredShots(), 4u);
}

TEST_F(SessionControllerTest, CountdownTicksDownEverySecond) {
    send(EventType::START);
    send(EventType::ENTER);
    ASSERT_EQ(controller->getState(), SessionState::COUNTDOWN);
    EXPECT_EQ(controller->getCountdownRemaining(), 3);
    ASSERT_NE(timers.lastTick(TimerKind::COUNTDOWN), nullptr);
    EXPECT_EQ(timers.lastTick(TimerKind::COUNTDOWN)->delay, std::chrono::milliseconds(1000));

    fire(TimerKind::COUNTDOWN);
    EXPECT_EQ(controller->getCountdownRemaining(), 2);
    EXPECT_EQ(lastSnapshot["countdown"], 2);
    fire(TimerKind::COUNTDOWN);
    fire(TimerKind::COUNTDOWN);
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);
}

TEST_F(SessionControllerTest, ShutterSkipsCountdown) {
    send(EventType::START);
    send(EventType::ENTER);
    Event pendingTick = timers.lastTick(TimerKind::COUNTDOWN)->event;

    send(EventType::SHUTTER);
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);

    // The superseded tick must not touch the new state
    controller->handleEvent(pendingTick);
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);
    pumpUntilState(SessionState::QUICK_REVIEW);
}

TEST_F(SessionControllerTest, QuickReviewUsesConfiguredDuration) {
    send(EventType::START);
    send(EventType::ENTER);
    expireCountdown();
    pumpUntilState(SessionState::QUICK_REVIEW);

    ASSERT_NE(timers.lastTick(TimerKind::QUICK_REVIEW), nullptr);
    EXPECT_EQ(timers.lastTick(TimerKind::QUICK_REVIEW)->delay, std::chrono::milliseconds(1200));
    EXPECT_EQ(controller->getSession()->capturedPhotos.size(), 1u);

    fire(TimerKind::QUICK_REVIEW);
    EXPECT_EQ(controller->getState(), SessionState::COUNTDOWN);
    EXPECT_EQ(controller->getCountdownRemaining(), 3);
}

TEST_F(SessionControllerTest, SingleSlotSessionEndToEnd) {
    printerStore.save(config::PrinterConfig{"photo_queue"});

    send(EventType::START);
    ASSERT_EQ(controller->getSession()->tmpl->id, "single_full");
    send(EventType::ENTER);

    for (int shot = 0; shot < 3; ++shot) {
        takeShot();
    }
    ASSERT_EQ(controller->getState(), SessionState::SELECTION);
    const core::Session* session = controller->getSession();
    ASSERT_EQ(session->capturedPhotos.size(), 3u);
    EXPECT_EQ(session->selectionCursor, 0u);
    EXPECT_TRUE(session->selectedIndices.empty());

    send(EventType::NEXT);
    send(EventType::SHUTTER);
    EXPECT_EQ(session->selectedIndices, std::vector<size_t>({1}));

    send(EventType::ENTER);
    ASSERT_EQ(controller->getState(), SessionState::REVIEW);
    pumpUntilCompositeReady();
    ASSERT_NE(session->composite, nullptr);
    EXPECT_EQ(session->composite->filter, composition::FilterType::NONE);
    ASSERT_EQ(session->composite->sourcePaths.size(), 1u);
    EXPECT_EQ(session->composite->sourcePaths[0], session->capturedPhotos[1].path);

    send(EventType::NEXT);
    EXPECT_EQ(session->activeFilter, composition::FilterType::BLACK_AND_WHITE);
    EXPECT_FALSE(lastSnapshot["compositeReady"].get<bool>());
    pumpUntilCompositeReady();
    EXPECT_EQ(session->composite->filter, composition::FilterType::BLACK_AND_WHITE);

    send(EventType::SHUTTER);
    ASSERT_EQ(controller->getState(), SessionState::PRINTING);
    pumpUntilState(SessionState::ATTRACT);
    EXPECT_EQ(controller->getSession(), nullptr);

    auto jobs = printer->jobs();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].queueName, "photo_queue");
    EXPECT_TRUE(jobs[0].fileExisted);
    EXPECT_FALSE(std::filesystem::exists(jobs[0].path));
}

TEST_F(SessionControllerTest, CaptureRetriesDoNotCountTowardsShots) {
    camera->scriptFailure(devices::CaptureErrorCode::HARDWARE_TIMEOUT);
    camera->scriptFailure(devices::CaptureErrorCode::CAMERA_UNAVAILABLE);

    send(EventType::START);
    send(EventType::ENTER);
    expireCountdown();

    controller->pumpOne(std::chrono::milliseconds(2000));
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);
    EXPECT_EQ(controller->getSession()->captureRetries, 1);
    EXPECT_TRUE(lastSnapshot["retrying"].get<bool>());
    EXPECT_EQ(controller->getSession()->capturedPhotos.size(), 0u);

    controller->pumpOne(std::chrono::milliseconds(2000));
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);
    EXPECT_EQ(controller->getSession()->captureRetries, 2);

    pumpUntilState(SessionState::QUICK_REVIEW);
    EXPECT_EQ(controller->getSession()->captureRetries, 0);
    EXPECT_FALSE(lastSnapshot["retrying"].get<bool>());
    fire(TimerKind::QUICK_REVIEW);

    takeShot();
    takeShot();
    ASSERT_EQ(controller->getState(), SessionState::SELECTION);
    EXPECT_EQ(controller->getSession()->capturedPhotos.size(), 3u);
    EXPECT_EQ(camera->requestedPaths().size(), 5u);
}

TEST_F(SessionControllerTest, TooManyCaptureFailuresAbandonSession) {
    core::SessionSettings settings = testSettings();
    settings.maxCaptureRetries = 1;
    createController(settings);
    camera->scriptFailure(devices::CaptureErrorCode::CAMERA_UNAVAILABLE);
    camera->scriptFailure(devices::CaptureErrorCode::CAMERA_UNAVAILABLE);

    send(EventType::START);
    send(EventType::ENTER);
    expireCountdown();
    pumpUntilState(SessionState::ATTRACT);

    EXPECT_EQ(controller->getSession(), nullptr);
    EXPECT_NE(lastSnapshot["lastError"].get<std::string>().find("capture failed"), std::string::npos);
    EXPECT_EQ(camera->requestedPaths().size(), 2u);
}

TEST_F(SessionControllerTest, SelectionCursorWrapsAndEnterNeedsFullSelection) {
    driveToSelection();
    const core::Session* session = controller->getSession();

    send(EventType::PREV);
    EXPECT_EQ(session->selectionCursor, 2u);
    send(EventType::NEXT);
    EXPECT_EQ(session->selectionCursor, 0u);

    send(EventType::ENTER);
    EXPECT_EQ(controller->getState(), SessionState::SELECTION);

    send(EventType::SHUTTER);
    send(EventType::SHUTTER);
    EXPECT_TRUE(session->selectedIndices.empty());
    send(EventType::ENTER);
    EXPECT_EQ(controller->getState(), SessionState::SELECTION);
}

TEST_F(SessionControllerTest, SelectionAtCapacityRejectsAndKeepsOrder) {
    send(EventType::START);
    send(EventType::NEXT);     // duo: 2 slots, 4 shots
    send(EventType::ENTER);
    for (int shot = 0; shot < 4; ++shot) {
        takeShot();
    }
    ASSERT_EQ(controller->getState(), SessionState::SELECTION);
    const core::Session* session = controller->getSession();

    send(EventType::PREV);     // cursor 3
    send(EventType::SHUTTER);
    send(EventType::PREV);
    send(EventType::PREV);     // cursor 1
    send(EventType::SHUTTER);
    EXPECT_EQ(session->selectedIndices, std::vector<size_t>({3, 1}));

    send(EventType::PREV);     // cursor 0
    send(EventType::SHUTTER);
    EXPECT_EQ(session->selectedIndices, std::vector<size_t>({3, 1}));

    send(EventType::ENTER);
    ASSERT_EQ(controller->getState(), SessionState::REVIEW);
    pumpUntilCompositeReady();
    ASSERT_EQ(session->composite->sourcePaths.size(), 2u);
    EXPECT_EQ(session->composite->sourcePaths[0], session->capturedPhotos[3].path);
    EXPECT_EQ(session->composite->sourcePaths[1], session->capturedPhotos[1].path);
}

TEST_F(SessionControllerTest, ReviewFilterCyclesBothWays) {
    driveToReview();
    const core::Session* session = controller->getSession();

    send(EventType::PREV);
    EXPECT_EQ(session->activeFilter, composition::FilterType::SEPIA);
    send(EventType::PREV);
    EXPECT_EQ(session->activeFilter, composition::FilterType::BLACK_AND_WHITE);
    send(EventType::NEXT);
    send(EventType::NEXT);
    EXPECT_EQ(session->activeFilter, composition::FilterType::NONE);
    pumpUntilCompositeReady();
    EXPECT_EQ(session->composite->filter, composition::FilterType::NONE);
}

TEST_F(SessionControllerTest, PrintIgnoredUntilCompositeMatchesFilter) {
    printerStore.save(config::PrinterConfig{"photo_queue"});
    driveToReview();

    send(EventType::NEXT);
    send(EventType::SHUTTER);
    EXPECT_EQ(controller->getState(), SessionState::REVIEW);

    pumpUntilCompositeReady();
    send(EventType::ENTER);
    EXPECT_EQ(controller->getState(), SessionState::PRINTING);
    pumpUntilState(SessionState::ATTRACT);
}

TEST_F(SessionControllerTest, PrintTimeoutReturnsToReviewWithCompositeIntact) {
    printerStore.save(config::PrinterConfig{"photo_queue"});
    printer->setResult(devices::SpoolStatus::TIMEOUT, "lp did not finish");
    driveToReview();

    send(EventType::PREV);
    pumpUntilCompositeReady();
    const core::Session* session = controller->getSession();
    auto composite = session->composite;
    ASSERT_NE(composite, nullptr);

    send(EventType::SHUTTER);
    ASSERT_EQ(controller->getState(), SessionState::PRINTING);
    pumpUntilState(SessionState::REVIEW);

    EXPECT_EQ(session->composite, composite);
    EXPECT_EQ(session->activeFilter, composition::FilterType::SEPIA);
    EXPECT_NE(session->lastError.find("spooler_timeout"), std::string::npos);
    EXPECT_TRUE(lastSnapshot["compositeReady"].get<bool>());

    printer->setResult(devices::SpoolStatus::ACCEPTED);
    send(EventType::SHUTTER);
    ASSERT_EQ(controller->getState(), SessionState::PRINTING);
    pumpUntilState(SessionState::ATTRACT);
    EXPECT_EQ(printer->jobs().size(), 2u);
}

TEST_F(SessionControllerTest, UnconfiguredPrinterFailsWithoutSpooler) {
    driveToReview();

    send(EventType::SHUTTER);
    pumpUntilState(SessionState::REVIEW);
    EXPECT_NE(controller->getSession()->lastError.find("not_configured"), std::string::npos);
    EXPECT_TRUE(printer->jobs().empty());
}

TEST_F(SessionControllerTest, SpoolerMessageCutMidCharacterStillPublishes) {
    printerStore.save(config::PrinterConfig{"photo_queue"});
    // "lp: " followed by the first two bytes of a three-byte character
    printer->setResult(devices::SpoolStatus::REJECTED, std::string("lp: \xE0\xB8"));
    driveToReview();

    send(EventType::SHUTTER);
    pumpUntilState(SessionState::REVIEW);

    std::string dumped;
    EXPECT_NO_THROW(dumped = lastSnapshot.dump());
    EXPECT_NO_THROW(dumped = controller->getStateSnapshot().dump());
    EXPECT_NE(lastSnapshot["lastError"].get<std::string>().find("spooler_rejected: lp: "), std::string::npos);
    // The raw text stays available to the session for logging
    EXPECT_EQ(controller->getSession()->lastError, std::string("spooler_rejected: lp: \xE0\xB8"));
}

TEST_F(SessionControllerTest, CaptureMessageWithInvalidBytesStillPublishes) {
    camera->scriptFailure(devices::CaptureErrorCode::CAMERA_UNAVAILABLE, std::string("rpicam-still: \xFF\xC3"));
    send(EventType::START);
    send(EventType::ENTER);
    expireCountdown();
    controller->pumpOne(std::chrono::milliseconds(5000));

    ASSERT_EQ(controller->getState(), SessionState::CAPTURING);
    EXPECT_TRUE(lastSnapshot["retrying"].get<bool>());
    std::string dumped;
    EXPECT_NO_THROW(dumped = lastSnapshot.dump());
    EXPECT_NE(dumped.find("camera_unavailable"), std::string::npos);
}

TEST_F(SessionControllerTest, CompositionFailureAbandonsSession) {
    driveToSelection();
    for (const auto& photo : controller->getSession()->capturedPhotos) {
        std::filesystem::remove(photo.path);
    }

    send(EventType::SHUTTER);
    send(EventType::ENTER);
    ASSERT_EQ(controller->getState(), SessionState::REVIEW);
    pumpUntilState(SessionState::ATTRACT);

    EXPECT_EQ(controller->getSession(), nullptr);
    EXPECT_EQ(lastSnapshot["state"], "attract");
    EXPECT_EQ(lastSnapshot["lastError"].get<std::string>().rfind("composition failed", 0), 0u);
    EXPECT_TRUE(printer->jobs().empty());
}

TEST_F(SessionControllerTest, LongPressCancelFromEveryActiveState) {
    const std::vector<SessionState> targets = {
        SessionState::TEMPLATE, SessionState::COUNTDOWN, SessionState::CAPTURING, SessionState::QUICK_REVIEW,
        SessionState::SELECTION, SessionState::REVIEW, SessionState::PRINTING,
    };
    printerStore.save(config::PrinterConfig{"photo_queue"});

    for (SessionState target : targets) {
        SCOPED_TRACE(core::sessionStateToString(target));
        send(EventType::START);
        if (target != SessionState::TEMPLATE) {
            send(EventType::ENTER);
        }
        if (target == SessionState::CAPTURING || target == SessionState::QUICK_REVIEW) {
            expireCountdown();
        }
        if (target == SessionState::QUICK_REVIEW) {
            pumpUntilState(SessionState::QUICK_REVIEW);
        }
        if (target == SessionState::SELECTION || target == SessionState::REVIEW || target == SessionState::PRINTING) {
            for (int shot = 0; shot < 3; ++shot) {
                takeShot();
            }
        }
        if (target == SessionState::REVIEW || target == SessionState::PRINTING) {
            send(EventType::SHUTTER);
            send(EventType::ENTER);
            pumpUntilCompositeReady();
        }
        if (target == SessionState::PRINTING) {
            send(EventType::SHUTTER);
        }
        ASSERT_EQ(controller->getState(), target);
        const std::string sessionId = controller->getSession()->sessionId;

        send(EventType::LONG_PRESS_CANCEL);
        EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
        EXPECT_EQ(controller->getSession(), nullptr);

        // Late completions of the abandoned session are discarded
        while (controller->pumpOne(std::chrono::milliseconds(300))) {
        }
        EXPECT_EQ(controller->getState(), SessionState::ATTRACT);

        Event late = Event::forSession(EventType::CAPTURE_COMPLETED, sessionId);
        controller->handleEvent(late);
        EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
    }
}

TEST_F(SessionControllerTest, StaleCountdownTickAfterCancelIsDiscarded) {
    send(EventType::START);
    send(EventType::ENTER);
    Event oldTick = timers.lastTick(TimerKind::COUNTDOWN)->event;
    send(EventType::LONG_PRESS_CANCEL);

    send(EventType::START);
    send(EventType::ENTER);
    EXPECT_EQ(controller->getCountdownRemaining(), 3);
    controller->handleEvent(oldTick);
    EXPECT_EQ(controller->getCountdownRemaining(), 3);
    EXPECT_EQ(controller->getState(), SessionState::COUNTDOWN);
}

TEST_F(SessionControllerTest, InactivityTimeoutReturnsToAttract) {
    send(EventType::START);
    send(EventType::NEXT);

    now += std::chrono::seconds(60);
    controller->handleEvent(Event::input(EventType::INACTIVITY_CHECK));
    EXPECT_EQ(controller->getState(), SessionState::TEMPLATE);

    now += std::chrono::seconds(31);
    controller->handleEvent(Event::input(EventType::INACTIVITY_CHECK));
    EXPECT_EQ(controller->getState(), SessionState::ATTRACT);
    EXPECT_EQ(controller->getSession(), nullptr);
    EXPECT_EQ(lastSnapshot["lastError"], "inactivity timeout");

    // Initial check plus one reschedule per check
    EXPECT_EQ(timers.countOf(EventType::INACTIVITY_CHECK), 3u);
}

TEST_F(SessionControllerTest, InputResetsInactivityClock) {
    send(EventType::START);
    now += std::chrono::seconds(80);
    send(EventType::NEXT);
    now += std::chrono::seconds(80);
    controller->handleEvent(Event::input(EventType::INACTIVITY_CHECK));
    EXPECT_EQ(controller->getState(), SessionState::TEMPLATE);
}

TEST_F(SessionControllerTest, CompletionForAnotherSessionIsIgnored) {
    send(EventType::START);
    send(EventType::ENTER);
    send(EventType::SHUTTER);
    ASSERT_EQ(controller->getState(), SessionState::CAPTURING);

    Event foreign = Event::forSession(EventType::CAPTURE_COMPLETED, "someone-else");
    foreign.photo.path = "/nonexistent.jpg";
    controller->handleEvent(foreign);
    EXPECT_EQ(controller->getState(), SessionState::CAPTURING);
    EXPECT_TRUE(controller->getSession()->capturedPhotos.empty());
    pumpUntilState(SessionState::QUICK_REVIEW);
}

TEST_F(SessionControllerTest, SnapshotDescribesSession) {
    send(EventType::START);
    EXPECT_EQ(lastSnapshot["state"], "template");
    EXPECT_EQ(lastSnapshot["templateId"], "single_full");
    EXPECT_EQ(lastSnapshot["templateName"], "Single Full");
    EXPECT_EQ(lastSnapshot["required"], 3);
    EXPECT_EQ(lastSnapshot["remaining"], 3);
    EXPECT_EQ(lastSnapshot["filter"], "none");
    EXPECT_EQ(lastSnapshot["sessionId"], controller->getSession()->sessionId);
}

TEST_F(SessionControllerTest, ShutdownStopsRunLoop) {
    std::atomic<bool> keepRunning(true);
    queue.post(Event::input(EventType::START));
    queue.post(Event::input(EventType::SHUTDOWN));
    controller->run(keepRunning);
    EXPECT_TRUE(controller->isShutdownRequested());
    EXPECT_EQ(controller->getState(), SessionState::TEMPLATE);
}
