/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the WhisperCppAdapter class.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/Failure.hpp"
#include "whisper.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

namespace writher::infrastructure {

using domain::FailureKind;
using domain::WritherError;

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelPath, const std::string& language)
    : m_modelPath(modelPath)
    , m_language(language)
{
}

WhisperCppAdapter::~WhisperCppAdapter() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppAdapter::preload(std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return loadModel(errorMsg);
}

bool WhisperCppAdapter::loadModel(std::string& errorMsg) {
    if (m_modelLoaded) return true;

    if (!std::filesystem::exists(m_modelPath)) {
        errorMsg = "Model file not found at: " + m_modelPath + ". Download a ggml model (e.g. ggml-base.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        errorMsg = "Failed to initialize whisper context from file.";
        return false;
    }

    std::cout << "[WhisperCppAdapter] Model loaded: " << m_modelPath << std::endl;
    m_modelLoaded = true;
    return true;
}

std::string WhisperCppAdapter::CleanSegment(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    int depth = 0;
    for (char ch : text) {
        if (ch == '[' || ch == '(') {
            ++depth;
            continue;
        }
        if ((ch == ']' || ch == ')') && depth > 0) {
            --depth;
            continue;
        }
        if (depth == 0) {
            out.push_back(ch);
        }
    }

    const auto first = out.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = out.find_last_not_of(" \t\r\n");
    return out.substr(first, last - first + 1);
}

std::string WhisperCppAdapter::transcribe(const domain::AudioBuffer& audio) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string error;
    if (!loadModel(error)) {
        throw WritherError(FailureKind::TranscriptionFailed, error);
    }

    std::vector<float> pcmf32;
    if (!AudioUtils::ConvertToWhisperFormat(audio.samples, audio.sampleRate, audio.channels, pcmf32, error)) {
        throw WritherError(FailureKind::TranscriptionFailed, error);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);
    wparams.beam_search.beam_size = 5;
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.suppress_blank = true;
    wparams.single_segment = false;
    wparams.language = m_language.c_str();
    wparams.n_threads = static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        throw WritherError(FailureKind::TranscriptionFailed, "Whisper inference failed.");
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        const std::string segment = CleanSegment(whisper_full_get_segment_text(m_ctx, i));
        if (segment.empty()) continue;
        if (!result.empty()) result += " ";
        result += segment;
    }
    return result;
}

} // namespace writher::infrastructure
