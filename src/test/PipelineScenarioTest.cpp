#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "application/ActionExecutor.hpp"
#include "application/ActionResolver.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/DispatchRouter.hpp"
#include "application/EventBus.hpp"
#include "application/MessageCatalog.hpp"
#include "application/ReminderScheduler.hpp"
#include "application/SessionTracker.hpp"
#include "application/VoicePipeline.hpp"
#include "domain/InstantFormat.hpp"
#include "fakes/TestDoubles.hpp"
#include "infrastructure/SqliteStore.hpp"

using namespace writher;
using namespace writher::application;
using domain::FailureKind;
using domain::SessionKind;
using domain::SessionState;
using domain::StatusType;
using domain::ToolCall;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

/** @brief Production wiring with fakes at the hardware and network edges. */
struct Scenario {
    explicit Scenario(const std::string& name)
        : db(name)
        , clock(std::make_shared<test::ManualClock>())
        , bus(clock)
        , store(db.path(), clock)
        , backend(std::make_shared<test::FakeBackend>())
        , resolver(backend, messages)
        , executor(store, messages)
        , injector(std::make_shared<test::FakeInjector>())
        , journal(std::make_shared<test::FakeJournal>())
        , router(injector, journal, resolver, executor, clock, messages, log.listener())
        , audio(std::make_shared<test::FakeAudioSource>())
        , transcriber(std::make_shared<test::FakeTranscriber>())
        , pipeline(audio, transcriber, router, tasks, messages, log.listener())
        , tracker(bus, clock, pipeline, SessionTimings{}, log.listener()) {}

    ~Scenario() {
        transcriber->release();
        tasks.waitForIdle(seconds(5));
    }

    /** @brief Holds the key for `heldMs` of audio. */
    void speak(SessionKind kind, int heldMs) {
        audio->nextDurationMs = heldMs;
        tracker.onKeyDown(kind);
        clock->advance(milliseconds(heldMs));
        tracker.onKeyUp(kind);
    }

    /** @brief Pumps the loop until the track is back at rest. */
    bool settle(SessionKind kind) {
        for (int i = 0; i < 200; ++i) {
            bus.waitAndDrain(milliseconds(25));
            if (tracker.state(kind) == SessionState::Idle && tasks.GetActiveTasks().empty()) {
                bus.drain();
                return true;
            }
        }
        return false;
    }

    test::TempDatabase db;
    std::shared_ptr<test::ManualClock> clock;
    EventBus bus;
    test::StatusLog log;
    MessageCatalog messages;
    infrastructure::SqliteStore store;
    std::shared_ptr<test::FakeBackend> backend;
    ActionResolver resolver;
    ActionExecutor executor;
    std::shared_ptr<test::FakeInjector> injector;
    std::shared_ptr<test::FakeJournal> journal;
    DispatchRouter router;
    std::shared_ptr<test::FakeAudioSource> audio;
    std::shared_ptr<test::FakeTranscriber> transcriber;
    AsyncTaskManager tasks;
    VoicePipeline pipeline;
    SessionTracker tracker;
};

// Scenario A: dictation pasted into the focused window.
void testDictationIsPasted() {
    Scenario s("scenario_a");
    s.transcriber->transcripts.push_back("hello world");
    s.speak(SessionKind::Dictation, 1500);
    assert(s.tracker.state(SessionKind::Dictation) == SessionState::Processing);
    assert(!s.audio->isOpen() && "Microphone released when processing starts.");
    assert(s.settle(SessionKind::Dictation));

    auto pasted = s.injector->snapshot();
    assert(pasted.size() == 1 && pasted[0] == "hello world");
    assert(s.log.count(StatusType::Injected) == 1);
    assert(s.log.count(StatusType::Failure) == 0);
    assert(s.backend->calls == 0 && "Dictation never reaches the assistant.");
    std::cout << "[PASS] Scenario A: dictation pasted." << std::endl;
}

// Scenario B: assistant creates a reminder one hour ahead, which fires on time.
void testAssistantReminderFires() {
    Scenario s("scenario_b");
    s.transcriber->transcripts.push_back("remind me to call Bob in one hour");
    const auto fireAt = s.clock->now() + std::chrono::hours(1);
    s.backend->respond({ToolCall{"create_reminder", {{"text", "call Bob"}, {"fire_at", domain::FormatIsoUtc(fireAt)}}}});

    s.speak(SessionKind::Assistant, 2000);
    assert(s.settle(SessionKind::Assistant));

    auto reminders = s.store.listReminders();
    assert(reminders.size() == 1);
    assert(reminders[0].text == "call Bob" && reminders[0].fireAt == fireAt && !reminders[0].notified);
    const auto* reply = s.log.last(StatusType::AssistantReply);
    assert(reply && reply->message == s.messages.get("reminder_set", {{"when", domain::FormatLocal(fireAt)}}));

    auto notifier = std::make_shared<test::FakeNotifier>();
    ReminderScheduler scheduler(s.store, notifier, s.clock, s.messages);
    assert(scheduler.sweep().reminders == 0);
    s.clock->advance(std::chrono::minutes(60));
    assert(scheduler.sweep().reminders == 1);
    assert(scheduler.sweep().reminders == 0);
    assert(notifier->snapshot().size() == 1);
    std::cout << "[PASS] Scenario B: assistant reminder stored and fired once." << std::endl;
}

// Scenario D: the paste fails and the text lands in the recovery file.
void testFailedPasteIsJournaled() {
    Scenario s("scenario_d");
    s.injector->fail = true;
    s.transcriber->transcripts.push_back("do not lose this sentence");
    s.speak(SessionKind::Dictation, 1200);
    assert(s.settle(SessionKind::Dictation));

    assert(s.journal->entries.size() == 1 && s.journal->entries[0] == "do not lose this sentence");
    const auto* failure = s.log.last(StatusType::Failure);
    assert(failure && failure->failure == FailureKind::InjectionFailed);
    assert(failure->message == s.messages.get("injection_saved"));
    std::cout << "[PASS] Scenario D: failed paste saved to the recovery file." << std::endl;
}

void testBusyMicrophone() {
    Scenario s("busy");
    s.transcriber->transcripts.push_back("still dictating");
    s.audio->nextDurationMs = 1000;
    s.tracker.onKeyDown(SessionKind::Dictation);
    s.tracker.onKeyDown(SessionKind::Assistant);
    const auto* busy = s.log.last(StatusType::Failure);
    assert(busy && busy->failure == FailureKind::Busy);
    assert(s.audio->opens == 1);

    s.clock->advance(milliseconds(1000));
    s.tracker.onKeyUp(SessionKind::Assistant);
    s.tracker.onKeyUp(SessionKind::Dictation);
    assert(s.settle(SessionKind::Dictation));
    assert(s.injector->snapshot().size() == 1 && "The first session is not disturbed.");
    assert(s.tracker.state(SessionKind::Assistant) == SessionState::Idle);
    std::cout << "[PASS] Second kind rejected while the microphone is busy." << std::endl;
}

void testShortAndSilentCaptures() {
    Scenario s("short_silent");
    s.speak(SessionKind::Dictation, 200);
    assert(s.settle(SessionKind::Dictation));
    assert(s.log.count(StatusType::TooShort) == 1);
    assert(s.transcriber->calls == 0 && "Short captures are not transcribed.");

    s.transcriber->transcripts.push_back("   ");
    s.speak(SessionKind::Assistant, 1500);
    assert(s.settle(SessionKind::Assistant));
    const auto* nothing = s.log.last(StatusType::NothingHeard);
    assert(nothing && nothing->failure == FailureKind::NoSpeechDetected);
    assert(s.backend->calls == 0);
    std::cout << "[PASS] Short and silent captures end without side effects." << std::endl;
}

void testTranscriptionFailure() {
    Scenario s("transcription_failure");
    s.transcriber->fail = true;
    s.speak(SessionKind::Dictation, 1500);
    assert(s.settle(SessionKind::Dictation));
    const auto* failure = s.log.last(StatusType::Failure);
    assert(failure && failure->failure == FailureKind::TranscriptionFailed);
    assert(s.injector->snapshot().empty());
    std::cout << "[PASS] Transcription failure reported, track back to Idle." << std::endl;
}

void testBatchIsAllOrNothing() {
    Scenario s("all_or_nothing");
    s.transcriber->transcripts.push_back("note buy milk and add eggs to the groceries list");
    s.backend->respond({
        ToolCall{"save_note", {{"text", "buy milk"}}},
        ToolCall{"add_item", {{"list", "groceries"}, {"text", "eggs"}}},
    });
    s.speak(SessionKind::Assistant, 1500);
    assert(s.settle(SessionKind::Assistant));

    const auto* failure = s.log.last(StatusType::Failure);
    assert(failure && failure->failure == FailureKind::UnrecognizedAction);
    assert(s.store.listNotes().empty() && "The note must be rolled back with the failing item.");
    std::cout << "[PASS] A failing action rolls back the whole batch." << std::endl;
}

void testQueryOpensView() {
    Scenario s("query_view");
    s.transcriber->transcripts.push_back("show me my agenda");
    s.backend->respond({ToolCall{"query_agenda", nlohmann::json::object()}});
    s.speak(SessionKind::Assistant, 1500);
    assert(s.settle(SessionKind::Assistant));
    const auto* view = s.log.last(StatusType::ShowView);
    assert(view && view->view && *view->view == domain::ViewKind::Agenda);
    std::cout << "[PASS] Query action asks for the agenda view." << std::endl;
}

void testLongNumericListName() {
    Scenario s("long_numeric_list");
    // Too large for a list id: must be looked up as a name.
    const std::string name = "99999999999999999999";
    s.store.createList(name);

    domain::ActionBatch batch{domain::AddItem{name, "bread"}};
    const AssistantReply reply = s.executor.apply(batch);
    assert(reply.message.find(name) != std::string::npos);
    auto list = s.store.findListByName(name);
    assert(list && list->items.size() == 1 && list->items[0].text == "bread");

    domain::ActionBatch missing{domain::AddItem{"123456789012345678901234", "milk"}};
    try {
        s.executor.apply(missing);
        assert(false && "Expected UnrecognizedAction.");
    } catch (const domain::WritherError& e) {
        assert(e.kind() == FailureKind::UnrecognizedAction);
    }
    std::cout << "[PASS] Out-of-range numeric list reference falls back to the name." << std::endl;
}

void testLateResultIsDiscarded() {
    Scenario s("late_result");
    s.transcriber->hold = true;
    s.transcriber->transcripts.push_back("remind me to stretch in ten minutes");
    s.backend->respond({ToolCall{"create_reminder",
                                 {{"text", "stretch"}, {"fire_at", domain::FormatIsoUtc(s.clock->now() + std::chrono::minutes(10))}}}});
    s.speak(SessionKind::Assistant, 1500);

    s.clock->advance(seconds(60));
    s.bus.drain();
    assert(s.tracker.state(SessionKind::Assistant) == SessionState::Idle);
    const auto* timeout = s.log.last(StatusType::Failure);
    assert(timeout && timeout->failure == FailureKind::BackendTimeout);

    s.transcriber->release();
    assert(s.tasks.waitForIdle(seconds(5)));
    s.bus.drain();
    assert(s.backend->calls == 1);
    assert(s.store.listReminders(true).empty() && "Actions of an expired session are never applied.");
    assert(s.log.count(StatusType::AssistantReply) == 0);
    std::cout << "[PASS] Result arriving after the timeout is discarded." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Pipeline Scenario Test..." << std::endl;

    testDictationIsPasted();
    testAssistantReminderFires();
    testFailedPasteIsJournaled();
    testBusyMicrophone();
    testShortAndSilentCaptures();
    testTranscriptionFailure();
    testBatchIsAllOrNothing();
    testQueryOpensView();
    testLongNumericListName();
    testLateResultIsDiscarded();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
