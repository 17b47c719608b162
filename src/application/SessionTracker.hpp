/**
 * @file SessionTracker.hpp
 * @brief State machine turning hotkey events into capture sessions.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include "application/EventBus.hpp"
#include "application/ProcessingOutcome.hpp"
#include "domain/Clock.hpp"
#include "domain/Session.hpp"
#include "domain/StatusEvent.hpp"

namespace writher::application {

/**
 * @class CaptureHandler
 * @brief Work performed when a track enters Capturing or leaves it.
 *
 * Both calls happen on the coordination loop.
 */
class CaptureHandler {
public:
    virtual ~CaptureHandler() = default;

    /**
     * @brief Opens the microphone for a new session.
     * @throws WritherError(DeviceUnavailable) when it cannot be opened.
     */
    virtual void beginCapture(domain::SessionKind kind, std::uint64_t sessionId) = 0;

    /**
     * @brief Closes the microphone and starts processing the captured audio.
     * @param captureDuration Wall time the key was held (or the cap, on timeout).
     * @param complete Must be invoked exactly once, from any thread.
     */
    virtual void endCapture(domain::SessionKind kind,
                            std::uint64_t sessionId,
                            std::chrono::milliseconds captureDuration,
                            CompletionCallback complete) = 0;
};

/**
 * @struct SessionTimings
 * @brief Caps and modes of the session state machine.
 */
struct SessionTimings {
    std::chrono::milliseconds maxCapture{std::chrono::seconds(60)};        ///< T_max.
    std::chrono::milliseconds processingTimeout{std::chrono::seconds(60)};
    bool holdToRecord = true; ///< False: press to start, press again to stop.
};

/**
 * @class SessionTracker
 * @brief Two independent Idle -> Capturing -> Processing -> Idle tracks.
 *
 * Every method must be called on the coordination loop. Background work
 * reaches the tracker only through the EventBus.
 */
class SessionTracker {
public:
    SessionTracker(EventBus& bus,
                   std::shared_ptr<domain::Clock> clock,
                   CaptureHandler& handler,
                   SessionTimings timings,
                   domain::StatusListener listener = nullptr);

    void onKeyDown(domain::SessionKind kind);
    void onKeyUp(domain::SessionKind kind);

    domain::SessionState state(domain::SessionKind kind) const;
    const domain::Track& track(domain::SessionKind kind) const;

    /** @brief Number of sessions that reached Processing since start. */
    std::uint64_t completedCaptures() const { return m_completedCaptures; }

    void setTimings(SessionTimings timings) { m_timings = timings; }

private:
    domain::Track& trackFor(domain::SessionKind kind);
    domain::Track& otherTrack(domain::SessionKind kind);

    void startCapture(domain::Track& track);
    void stopCapture(domain::Track& track, bool timedOut);
    void onCaptureTimeout(domain::SessionKind kind, std::uint64_t sessionId);
    void onProcessingTimeout(domain::SessionKind kind, std::uint64_t sessionId);
    void onProcessingFinished(domain::SessionKind kind, std::uint64_t sessionId, ProcessingOutcome outcome);
    void returnToIdle(domain::Track& track);
    void emit(domain::StatusType type, const domain::Track& track, const std::string& message = {},
              std::optional<domain::FailureKind> failure = std::nullopt);

    EventBus& m_bus;
    std::shared_ptr<domain::Clock> m_clock;
    CaptureHandler& m_handler;
    SessionTimings m_timings;
    domain::StatusListener m_listener;

    domain::Track m_dictation{domain::SessionKind::Dictation};
    domain::Track m_assistant{domain::SessionKind::Assistant};
    std::uint64_t m_nextSessionId = 0;
    std::uint64_t m_completedCaptures = 0;
};

} // namespace writher::application
