/**
 * @file VoicePipeline.hpp
 * @brief Microphone -> transcription -> dispatch, driven by the session tracker.
 */

#pragma once

#include <chrono>
#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/DispatchRouter.hpp"
#include "application/MessageCatalog.hpp"
#include "application/SessionTracker.hpp"
#include "domain/AudioSource.hpp"
#include "domain/StatusEvent.hpp"
#include "domain/TranscriptionService.hpp"

namespace writher::application {

/**
 * @class VoicePipeline
 * @brief CaptureHandler that owns the microphone and the per-session background work.
 *
 * The microphone is opened and closed on the coordination loop. Everything
 * after close() runs on an AsyncTaskManager task and reports back through the
 * completion callback exactly once.
 */
class VoicePipeline : public CaptureHandler {
public:
    VoicePipeline(std::shared_ptr<domain::AudioSource> audio,
                  std::shared_ptr<domain::TranscriptionService> transcriber,
                  DispatchRouter& router,
                  AsyncTaskManager& tasks,
                  const MessageCatalog& messages,
                  domain::StatusListener listener,
                  std::chrono::milliseconds minCapture = std::chrono::milliseconds(500));

    void beginCapture(domain::SessionKind kind, std::uint64_t sessionId) override;
    void endCapture(domain::SessionKind kind,
                    std::uint64_t sessionId,
                    std::chrono::milliseconds captureDuration,
                    CompletionCallback complete) override;

    void setMinCapture(std::chrono::milliseconds minCapture) { m_minCapture = minCapture; }

private:
    std::shared_ptr<domain::AudioSource> m_audio;
    std::shared_ptr<domain::TranscriptionService> m_transcriber;
    DispatchRouter& m_router;
    AsyncTaskManager& m_tasks;
    const MessageCatalog& m_messages;
    domain::StatusListener m_listener;
    std::chrono::milliseconds m_minCapture;
};

} // namespace writher::application
