#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <cmath>

namespace writher::infrastructure {

bool AudioUtils::ConvertToWhisperFormat(const std::vector<float>& input, int sampleRate, int channels,
                                        std::vector<float>& pcmf32, std::string& error) {
    if (sampleRate == kWhisperSampleRate && channels == 1) {
        pcmf32 = input;
        return true;
    }

    SDL_AudioCVT cvt;
    const int built = SDL_BuildAudioCVT(&cvt, AUDIO_F32SYS, static_cast<Uint8>(channels), sampleRate,
                                        AUDIO_F32SYS, 1, kWhisperSampleRate);
    if (built < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        return false;
    }
    if (built == 0) {
        pcmf32 = input;
        return true;
    }

    const int byteLength = static_cast<int>(input.size() * sizeof(float));
    cvt.len = byteLength;
    cvt.buf = static_cast<Uint8*>(SDL_malloc(static_cast<size_t>(cvt.len) * cvt.len_mult));
    if (!cvt.buf) {
        error = "Out of memory while converting audio";
        return false;
    }
    SDL_memcpy(cvt.buf, input.data(), byteLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        return false;
    }

    const size_t sampleCount = static_cast<size_t>(cvt.len_cvt) / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, cvt.len_cvt);

    SDL_free(cvt.buf);
    return true;
}

float AudioUtils::ComputeRms(const float* samples, std::size_t count) {
    if (!samples || count == 0) return 0.0f;
    double sum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

} // namespace writher::infrastructure
