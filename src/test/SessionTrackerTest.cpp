#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "application/EventBus.hpp"
#include "application/SessionTracker.hpp"
#include "fakes/TestDoubles.hpp"

using namespace writher;
using namespace writher::application;
using domain::SessionKind;
using domain::SessionState;
using domain::StatusType;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

struct RecordingHandler : CaptureHandler {
    void beginCapture(SessionKind kind, std::uint64_t) override {
        ++begins;
        lastBeginKind = kind;
        if (failBegin) {
            throw domain::WritherError(domain::FailureKind::DeviceUnavailable, "no input device");
        }
    }

    void endCapture(SessionKind kind, std::uint64_t, milliseconds duration, CompletionCallback complete) override {
        ends.push_back({kind, duration});
        completions.push_back(std::move(complete));
    }

    struct End {
        SessionKind kind;
        milliseconds duration;
    };

    bool failBegin = false;
    int begins = 0;
    SessionKind lastBeginKind = SessionKind::Dictation;
    std::vector<End> ends;
    std::vector<CompletionCallback> completions;
};

struct Fixture {
    explicit Fixture(bool holdToRecord = true) {
        clock = std::make_shared<test::ManualClock>();
        bus = std::make_unique<EventBus>(clock);
        SessionTimings timings;
        timings.maxCapture = seconds(60);
        timings.processingTimeout = seconds(60);
        timings.holdToRecord = holdToRecord;
        tracker = std::make_unique<SessionTracker>(*bus, clock, handler, timings, log.listener());
    }

    void finish(size_t index, std::function<void()> finalize = nullptr) {
        ProcessingOutcome outcome;
        outcome.summary = "test";
        outcome.finalize = std::move(finalize);
        handler.completions.at(index)(std::move(outcome));
        bus->drain();
    }

    std::shared_ptr<test::ManualClock> clock;
    std::unique_ptr<EventBus> bus;
    RecordingHandler handler;
    test::StatusLog log;
    std::unique_ptr<SessionTracker> tracker;
};

void testAutoRepeatYieldsOneSession() {
    Fixture f;
    for (int i = 0; i < 5; ++i) {
        f.tracker->onKeyDown(SessionKind::Dictation);
    }
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Capturing);
    f.clock->advance(milliseconds(1200));
    f.tracker->onKeyUp(SessionKind::Dictation);
    f.tracker->onKeyUp(SessionKind::Dictation);

    assert(f.handler.begins == 1 && "Repeated key-down must not open a second session.");
    assert(f.handler.ends.size() == 1);
    assert(f.handler.ends[0].duration == milliseconds(1200));
    assert(f.tracker->completedCaptures() == 1);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Processing);

    f.finish(0);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Idle);
    assert(f.log.count(StatusType::Listening) == 1);
    assert(f.log.count(StatusType::Idle) == 1);
    std::cout << "[PASS] Auto-repeat yields exactly one capture session." << std::endl;
}

void testKeyUpWithoutKeyDownIsIgnored() {
    Fixture f;
    f.tracker->onKeyUp(SessionKind::Assistant);
    assert(f.handler.begins == 0);
    assert(f.handler.ends.empty());
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Idle);
    assert(f.log.events.empty());
    std::cout << "[PASS] Unmatched key-up ignored." << std::endl;
}

void testCaptureIsBoundedByMaxDuration() {
    Fixture f;
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.clock->advance(milliseconds(59999));
    f.bus->drain();
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Capturing);

    f.clock->advance(milliseconds(1));
    f.bus->drain();
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Processing && "T_max forces the stop.");
    assert(f.handler.ends.size() == 1);
    assert(f.handler.ends[0].duration == seconds(60));

    // The late key-up belongs to the capped session and must not start anything.
    f.tracker->onKeyUp(SessionKind::Dictation);
    assert(f.handler.begins == 1);
    assert(f.handler.ends.size() == 1);

    f.finish(0);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Idle);
    std::cout << "[PASS] Capture bounded by T_max." << std::endl;
}

void testDeviceUnavailableStaysIdle() {
    Fixture f;
    f.handler.failBegin = true;
    f.tracker->onKeyDown(SessionKind::Dictation);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Idle);
    const auto* failure = f.log.last(StatusType::Failure);
    assert(failure && failure->failure == domain::FailureKind::DeviceUnavailable);
    assert(f.bus->pendingTimers() == 0);

    // Nothing to stop on release; next press tries again.
    f.tracker->onKeyUp(SessionKind::Dictation);
    assert(f.handler.ends.empty());
    f.handler.failBegin = false;
    f.tracker->onKeyDown(SessionKind::Dictation);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Capturing);
    std::cout << "[PASS] DeviceUnavailable leaves the track Idle." << std::endl;
}

void testMicrophoneIsExclusive() {
    Fixture f;
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.tracker->onKeyDown(SessionKind::Assistant);
    assert(f.handler.begins == 1);
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Idle);
    const auto* busy = f.log.last(StatusType::Failure);
    assert(busy && busy->failure == domain::FailureKind::Busy && busy->kind == SessionKind::Assistant);

    // Once dictation is Processing the microphone is free again.
    f.tracker->onKeyUp(SessionKind::Assistant);
    f.tracker->onKeyUp(SessionKind::Dictation);
    f.tracker->onKeyDown(SessionKind::Assistant);
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Capturing);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Processing);
    std::cout << "[PASS] Second track rejected with Busy while the first captures." << std::endl;
}

void testProcessingTimeoutDiscardsLateResult() {
    Fixture f;
    f.tracker->onKeyDown(SessionKind::Assistant);
    f.clock->advance(milliseconds(800));
    f.tracker->onKeyUp(SessionKind::Assistant);

    f.clock->advance(seconds(60));
    f.bus->drain();
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Idle);
    const auto* timeout = f.log.last(StatusType::Failure);
    assert(timeout && timeout->failure == domain::FailureKind::BackendTimeout);

    bool applied = false;
    f.finish(0, [&applied]() { applied = true; });
    assert(!applied && "A result arriving after the timeout must not be applied.");
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Idle);
    std::cout << "[PASS] Processing timeout returns to Idle and drops the late result." << std::endl;
}

void testKeyDownWhileProcessingIsIgnored() {
    Fixture f;
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.tracker->onKeyUp(SessionKind::Dictation);
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.tracker->onKeyUp(SessionKind::Dictation);
    assert(f.handler.begins == 1);
    assert(f.handler.ends.size() == 1);

    f.finish(0);
    f.tracker->onKeyDown(SessionKind::Dictation);
    assert(f.handler.begins == 2 && "Sessions on one track are sequential.");
    std::cout << "[PASS] Key-down while Processing ignored." << std::endl;
}

void testToggleMode() {
    Fixture f(false);
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.tracker->onKeyUp(SessionKind::Dictation);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Capturing);

    f.clock->advance(seconds(3));
    f.tracker->onKeyDown(SessionKind::Dictation);
    f.tracker->onKeyDown(SessionKind::Dictation); // auto-repeat
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Processing);
    assert(f.handler.ends.size() == 1 && f.handler.ends[0].duration == seconds(3));
    f.tracker->onKeyUp(SessionKind::Dictation);
    f.finish(0);
    assert(f.tracker->state(SessionKind::Dictation) == SessionState::Idle);
    std::cout << "[PASS] Toggle mode: press starts, press stops." << std::endl;
}

void testFinalizeFailureEndsSession() {
    Fixture f;
    f.tracker->onKeyDown(SessionKind::Assistant);
    f.tracker->onKeyUp(SessionKind::Assistant);
    f.finish(0, []() {
        throw domain::WritherError(domain::FailureKind::PersistenceError, "disk full");
    });
    assert(f.tracker->state(SessionKind::Assistant) == SessionState::Idle);
    const auto* failure = f.log.last(StatusType::Failure);
    assert(failure && failure->failure == domain::FailureKind::PersistenceError);
    assert(f.bus->pendingTimers() == 0);
    std::cout << "[PASS] Failure while applying the result still ends in Idle." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SessionTracker Test..." << std::endl;

    testAutoRepeatYieldsOneSession();
    testKeyUpWithoutKeyDownIsIgnored();
    testCaptureIsBoundedByMaxDuration();
    testDeviceUnavailableStaysIdle();
    testMicrophoneIsExclusive();
    testProcessingTimeoutDiscardsLateResult();
    testKeyDownWhileProcessingIsIgnored();
    testToggleMode();
    testFinalizeFailureEndsSession();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
