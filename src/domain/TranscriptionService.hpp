/**
 * @file TranscriptionService.hpp
 * @brief Interface for audio-to-text transcription.
 */

#pragma once

#include <string>
#include "domain/AudioSource.hpp"

namespace writher::domain {

/**
 * @class TranscriptionService
 * @brief Converts a captured audio buffer into text.
 *
 * Implementations are called from background tasks, never from the
 * coordination loop.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes the buffer.
     * @return Trimmed UTF-8 text. Empty when no speech was detected.
     * @throws WritherError(TranscriptionFailed) when the engine cannot run.
     */
    virtual std::string transcribe(const AudioBuffer& audio) = 0;
};

} // namespace writher::domain
