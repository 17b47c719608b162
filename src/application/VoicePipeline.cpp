/**
 * @file VoicePipeline.cpp
 * @brief Implementation of VoicePipeline.
 */

#include "application/VoicePipeline.hpp"

#include <iostream>
#include "domain/Failure.hpp"

namespace writher::application {

using domain::FailureKind;
using domain::SessionKind;
using domain::StatusType;
using domain::WritherError;

VoicePipeline::VoicePipeline(std::shared_ptr<domain::AudioSource> audio,
                             std::shared_ptr<domain::TranscriptionService> transcriber,
                             DispatchRouter& router,
                             AsyncTaskManager& tasks,
                             const MessageCatalog& messages,
                             domain::StatusListener listener,
                             std::chrono::milliseconds minCapture)
    : m_audio(std::move(audio))
    , m_transcriber(std::move(transcriber))
    , m_router(router)
    , m_tasks(tasks)
    , m_messages(messages)
    , m_listener(std::move(listener))
    , m_minCapture(minCapture) {}

void VoicePipeline::beginCapture(SessionKind kind, std::uint64_t sessionId) {
    if (m_audio->isOpen()) {
        throw WritherError(FailureKind::Busy, "Microphone already in use");
    }
    m_audio->open();
    std::cout << "[VoicePipeline] Microphone open for " << SessionKindToString(kind)
              << " session " << sessionId << std::endl;
}

void VoicePipeline::endCapture(SessionKind kind,
                               std::uint64_t sessionId,
                               std::chrono::milliseconds captureDuration,
                               CompletionCallback complete) {
    domain::AudioBuffer buffer = m_audio->close();
    std::cout << "[VoicePipeline] Session " << sessionId << ": " << buffer.durationMs() << " ms of audio ("
              << captureDuration.count() << " ms held)" << std::endl;

    if (buffer.empty() || buffer.durationMs() < m_minCapture.count()) {
        ProcessingOutcome outcome;
        outcome.summary = "too short";
        const std::string message = m_messages.get("too_short");
        auto listener = m_listener;
        outcome.finalize = [listener, kind, message]() {
            if (listener) {
                listener(domain::StatusEvent{StatusType::TooShort, kind, message, std::nullopt, std::nullopt});
            }
        };
        complete(std::move(outcome));
        return;
    }

    const TaskType type = kind == SessionKind::Dictation ? TaskType::Transcription : TaskType::ActionResolution;
    const std::string description = std::string(SessionKindToString(kind)) + " session " + std::to_string(sessionId);

    m_tasks.SubmitTask(type, description,
        [this, kind, buffer = std::move(buffer), complete](std::shared_ptr<TaskStatus>) {
            std::string transcript;
            try {
                transcript = m_transcriber->transcribe(buffer);
            } catch (const WritherError& e) {
                std::cerr << "[VoicePipeline] Transcription failed: " << e.what() << std::endl;
                complete(m_router.failed(kind, e.kind(), e.what()));
                return;
            } catch (const std::exception& e) {
                std::cerr << "[VoicePipeline] Transcription failed: " << e.what() << std::endl;
                complete(m_router.failed(kind, FailureKind::TranscriptionFailed, e.what()));
                return;
            }

            std::cout << "[VoicePipeline] Transcript: \"" << transcript << "\"" << std::endl;
            try {
                complete(m_router.dispatch(kind, transcript));
            } catch (const std::exception& e) {
                std::cerr << "[VoicePipeline] Dispatch failed: " << e.what() << std::endl;
                complete(m_router.failed(kind, FailureKind::BackendUnavailable, e.what()));
            }
        });
}

} // namespace writher::application
