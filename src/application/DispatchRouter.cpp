/**
 * @file DispatchRouter.cpp
 * @brief Implementation of DispatchRouter.
 */

#include "application/DispatchRouter.hpp"

#include <iostream>
#include "domain/Failure.hpp"

namespace writher::application {

using domain::FailureKind;
using domain::SessionKind;
using domain::StatusEvent;
using domain::StatusType;
using domain::WritherError;

namespace {

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

DispatchRouter::DispatchRouter(std::shared_ptr<domain::TextInjector> injector,
                               std::shared_ptr<domain::RecoveryJournal> journal,
                               ActionResolver& resolver,
                               ActionExecutor& executor,
                               std::shared_ptr<domain::Clock> clock,
                               const MessageCatalog& messages,
                               domain::StatusListener listener)
    : m_injector(std::move(injector))
    , m_journal(std::move(journal))
    , m_resolver(resolver)
    , m_executor(executor)
    , m_clock(std::move(clock))
    , m_messages(messages)
    , m_listener(std::move(listener)) {}

DispatchRouter::Route DispatchRouter::Select(SessionKind kind, const std::string& transcript) {
    if (IsBlank(transcript)) {
        return Route::NothingHeard;
    }
    return kind == SessionKind::Dictation ? Route::Inject : Route::Resolve;
}

ProcessingOutcome DispatchRouter::dispatch(SessionKind kind, const std::string& transcript) {
    switch (Select(kind, transcript)) {
        case Route::Inject:
            return inject(transcript);
        case Route::Resolve:
            return resolve(transcript);
        case Route::NothingHeard:
            break;
    }

    ProcessingOutcome outcome;
    outcome.summary = "nothing heard";
    outcome.failure = FailureKind::NoSpeechDetected;
    const std::string message = m_messages.get("nothing_heard");
    outcome.finalize = [this, kind, message]() {
        emit(StatusEvent{StatusType::NothingHeard, kind, message, FailureKind::NoSpeechDetected, std::nullopt});
    };
    return outcome;
}

ProcessingOutcome DispatchRouter::failed(SessionKind kind, FailureKind failure, const std::string& message) const {
    ProcessingOutcome outcome;
    outcome.summary = FailureKindToString(failure);
    outcome.failure = failure;
    outcome.finalize = [this, kind, failure, message]() {
        emit(StatusEvent{StatusType::Failure, kind, message, failure, std::nullopt});
    };
    return outcome;
}

ProcessingOutcome DispatchRouter::inject(const std::string& text) {
    try {
        m_injector->paste(text);
    } catch (const WritherError& e) {
        std::cerr << "[DispatchRouter] Paste failed: " << e.what() << std::endl;
        if (m_journal && m_journal->append(text)) {
            std::cout << "[DispatchRouter] Text saved to the recovery file." << std::endl;
            return failed(SessionKind::Dictation, FailureKind::InjectionFailed, m_messages.get("injection_saved"));
        }
        std::cerr << "[DispatchRouter] Recovery file not writable, dictated text lost." << std::endl;
        return failed(SessionKind::Dictation, FailureKind::InjectionFailed, e.what());
    }

    ProcessingOutcome outcome;
    outcome.summary = "injected " + std::to_string(text.size()) + " bytes";
    outcome.finalize = [this, text]() {
        emit(StatusEvent{StatusType::Injected, SessionKind::Dictation, text, std::nullopt, std::nullopt});
    };
    return outcome;
}

ProcessingOutcome DispatchRouter::resolve(const std::string& text) {
    domain::ActionBatch batch;
    try {
        batch = m_resolver.resolve(text, m_clock->now());
    } catch (const WritherError& e) {
        std::cerr << "[DispatchRouter] Assistant failed (" << FailureKindToString(e.kind()) << "): "
                  << e.what() << std::endl;
        return failed(SessionKind::Assistant, e.kind(), e.what());
    }

    ProcessingOutcome outcome;
    outcome.summary = std::to_string(batch.size()) + " action(s)";
    outcome.finalize = [this, batch]() {
        const AssistantReply reply = m_executor.apply(batch);
        emit(StatusEvent{StatusType::AssistantReply, SessionKind::Assistant, reply.message, std::nullopt, std::nullopt});
        if (reply.view) {
            emit(StatusEvent{StatusType::ShowView, SessionKind::Assistant, reply.message, std::nullopt, reply.view});
        }
    };
    return outcome;
}

void DispatchRouter::emit(const StatusEvent& event) const {
    if (m_listener) {
        m_listener(event);
    }
}

} // namespace writher::application
