/**
 * @file SessionTracker.cpp
 * @brief Implementation of the hotkey session state machine.
 */

#include "application/SessionTracker.hpp"

#include <iostream>

namespace writher::application {

using domain::FailureKind;
using domain::SessionKind;
using domain::SessionState;
using domain::StatusType;

SessionTracker::SessionTracker(EventBus& bus,
                               std::shared_ptr<domain::Clock> clock,
                               CaptureHandler& handler,
                               SessionTimings timings,
                               domain::StatusListener listener)
    : m_bus(bus)
    , m_clock(std::move(clock))
    , m_handler(handler)
    , m_timings(timings)
    , m_listener(std::move(listener)) {}

domain::Track& SessionTracker::trackFor(SessionKind kind) {
    return kind == SessionKind::Dictation ? m_dictation : m_assistant;
}

domain::Track& SessionTracker::otherTrack(SessionKind kind) {
    return kind == SessionKind::Dictation ? m_assistant : m_dictation;
}

const domain::Track& SessionTracker::track(SessionKind kind) const {
    return kind == SessionKind::Dictation ? m_dictation : m_assistant;
}

SessionState SessionTracker::state(SessionKind kind) const {
    return track(kind).state;
}

void SessionTracker::onKeyDown(SessionKind kind) {
    auto& t = trackFor(kind);
    if (t.keyHeld) {
        return; // auto-repeat
    }
    t.keyHeld = true;

    if (m_timings.holdToRecord) {
        if (t.state != SessionState::Idle) {
            std::cout << "[SessionTracker] " << SessionKindToString(kind)
                      << " key ignored while " << SessionStateToString(t.state) << std::endl;
            return;
        }
        startCapture(t);
        return;
    }

    switch (t.state) {
        case SessionState::Idle:
            startCapture(t);
            break;
        case SessionState::Capturing:
            stopCapture(t, false);
            break;
        case SessionState::Processing:
            std::cout << "[SessionTracker] " << SessionKindToString(kind)
                      << " key ignored while Processing" << std::endl;
            break;
    }
}

void SessionTracker::onKeyUp(SessionKind kind) {
    auto& t = trackFor(kind);
    if (!t.keyHeld) {
        return; // no matching key-down
    }
    t.keyHeld = false;

    if (m_timings.holdToRecord && t.state == SessionState::Capturing) {
        stopCapture(t, false);
    }
}

void SessionTracker::startCapture(domain::Track& t) {
    const auto& other = otherTrack(t.kind);
    if (other.state == SessionState::Capturing) {
        std::cout << "[SessionTracker] Microphone busy with " << SessionKindToString(other.kind)
                  << ", rejecting " << SessionKindToString(t.kind) << std::endl;
        emit(StatusType::Failure, t, "Microphone busy", FailureKind::Busy);
        return;
    }

    const std::uint64_t sessionId = ++m_nextSessionId;
    try {
        m_handler.beginCapture(t.kind, sessionId);
    } catch (const domain::WritherError& e) {
        std::cerr << "[SessionTracker] Cannot start " << SessionKindToString(t.kind)
                  << " capture: " << e.what() << std::endl;
        emit(StatusType::Failure, t, e.what(), e.kind());
        return;
    }

    t.sessionId = sessionId;
    t.state = SessionState::Capturing;
    t.startedAt = m_clock->monotonic();
    const SessionKind kind = t.kind;
    t.captureTimer = m_bus.postAfter(m_timings.maxCapture, [this, kind, sessionId]() {
        onCaptureTimeout(kind, sessionId);
    });

    std::cout << "[SessionTracker] Recording started (" << SessionKindToString(kind)
              << ", session " << sessionId << ")." << std::endl;
    emit(StatusType::Listening, t);
}

void SessionTracker::stopCapture(domain::Track& t, bool timedOut) {
    m_bus.cancel(t.captureTimer);
    t.captureTimer = 0;

    auto held = std::chrono::duration_cast<std::chrono::milliseconds>(m_clock->monotonic() - t.startedAt);
    if (timedOut) {
        held = m_timings.maxCapture;
    }

    t.state = SessionState::Processing;
    ++m_completedCaptures;

    const SessionKind kind = t.kind;
    const std::uint64_t sessionId = t.sessionId;
    t.processingTimer = m_bus.postAfter(m_timings.processingTimeout, [this, kind, sessionId]() {
        onProcessingTimeout(kind, sessionId);
    });

    std::cout << "[SessionTracker] Recording stopped (" << SessionKindToString(kind) << ", "
              << held.count() << " ms" << (timedOut ? ", capped" : "") << ")." << std::endl;
    emit(StatusType::Processing, t);

    auto complete = [this, kind, sessionId](ProcessingOutcome outcome) {
        auto shared = std::make_shared<ProcessingOutcome>(std::move(outcome));
        m_bus.post([this, kind, sessionId, shared]() {
            onProcessingFinished(kind, sessionId, std::move(*shared));
        });
    };

    try {
        m_handler.endCapture(kind, sessionId, held, complete);
    } catch (const domain::WritherError& e) {
        std::cerr << "[SessionTracker] Processing could not start: " << e.what() << std::endl;
        emit(StatusType::Failure, t, e.what(), e.kind());
        returnToIdle(t);
    }
}

void SessionTracker::onCaptureTimeout(SessionKind kind, std::uint64_t sessionId) {
    auto& t = trackFor(kind);
    if (t.sessionId != sessionId || t.state != SessionState::Capturing) {
        return;
    }
    t.captureTimer = 0;
    std::cout << "[SessionTracker] " << SessionKindToString(kind)
              << " capture reached the maximum length, stopping." << std::endl;
    stopCapture(t, true);
}

void SessionTracker::onProcessingTimeout(SessionKind kind, std::uint64_t sessionId) {
    auto& t = trackFor(kind);
    if (t.sessionId != sessionId || t.state != SessionState::Processing) {
        return;
    }
    t.processingTimer = 0;
    std::cerr << "[SessionTracker] " << SessionKindToString(kind) << " session " << sessionId
              << " timed out while processing." << std::endl;
    emit(StatusType::Failure, t, "Processing timed out", FailureKind::BackendTimeout);
    returnToIdle(t);
}

void SessionTracker::onProcessingFinished(SessionKind kind, std::uint64_t sessionId, ProcessingOutcome outcome) {
    auto& t = trackFor(kind);
    if (t.sessionId != sessionId || t.state != SessionState::Processing) {
        std::cout << "[SessionTracker] Discarding late result of " << SessionKindToString(kind)
                  << " session " << sessionId << " (" << outcome.summary << ")." << std::endl;
        return;
    }

    m_bus.cancel(t.processingTimer);
    t.processingTimer = 0;

    if (outcome.finalize) {
        try {
            outcome.finalize();
        } catch (const domain::WritherError& e) {
            std::cerr << "[SessionTracker] " << SessionKindToString(kind) << " session " << sessionId
                      << " failed: " << FailureKindToString(e.kind()) << ": " << e.what() << std::endl;
            emit(StatusType::Failure, t, e.what(), e.kind());
        } catch (const std::exception& e) {
            std::cerr << "[SessionTracker] " << SessionKindToString(kind) << " session " << sessionId
                      << " failed unexpectedly: " << e.what() << std::endl;
            emit(StatusType::Failure, t, e.what(), FailureKind::PersistenceError);
        }
    }
    returnToIdle(t);
}

void SessionTracker::returnToIdle(domain::Track& t) {
    m_bus.cancel(t.captureTimer);
    m_bus.cancel(t.processingTimer);
    t.captureTimer = 0;
    t.processingTimer = 0;
    t.state = SessionState::Idle;
    emit(StatusType::Idle, t);
}

void SessionTracker::emit(StatusType type, const domain::Track& t, const std::string& message,
                          std::optional<FailureKind> failure) {
    if (!m_listener) return;
    domain::StatusEvent event;
    event.type = type;
    event.kind = t.kind;
    event.message = message;
    event.failure = failure;
    m_listener(event);
}

} // namespace writher::application
