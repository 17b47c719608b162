#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace writher::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    static constexpr int kWhisperSampleRate = 16000;

    /**
     * @brief Converts interleaved float32 samples to 16kHz float32 mono (Whisper format).
     * @param input Interleaved samples.
     * @param sampleRate Rate of `input`.
     * @param channels Channel count of `input`.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertToWhisperFormat(const std::vector<float>& input, int sampleRate, int channels,
                                       std::vector<float>& pcmf32, std::string& error);

    /** @brief Root mean square of `count` samples, 0 for an empty block. */
    static float ComputeRms(const float* samples, std::size_t count);
};

} // namespace writher::infrastructure
