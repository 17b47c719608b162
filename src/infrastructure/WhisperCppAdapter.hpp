#pragma once

#include "domain/TranscriptionService.hpp"
#include <string>
#include <mutex>

// whisper.h stays out of the header; only the context pointer is needed here.
struct whisper_context;

namespace writher::infrastructure {

/**
 * @class WhisperCppAdapter
 * @brief Local speech-to-text with whisper.cpp.
 *
 * The model is loaded on first use. Inference is serialized on one context.
 */
class WhisperCppAdapter : public domain::TranscriptionService {
public:
    WhisperCppAdapter(const std::string& modelPath, const std::string& language);
    ~WhisperCppAdapter() override;

    WhisperCppAdapter(const WhisperCppAdapter&) = delete;
    WhisperCppAdapter& operator=(const WhisperCppAdapter&) = delete;

    std::string transcribe(const domain::AudioBuffer& audio) override;

    /** @brief Loads the model now instead of on the first transcription. */
    bool preload(std::string& errorMsg);

    /** @brief Drops whisper's non-speech markers ("[BLANK_AUDIO]", "(music)") and trims. */
    static std::string CleanSegment(const std::string& text);

private:
    bool loadModel(std::string& errorMsg);

    std::string m_modelPath;
    std::string m_language;
    whisper_context* m_ctx = nullptr;
    std::mutex m_mutex;
    bool m_modelLoaded = false;
};

} // namespace writher::infrastructure
