/**
 * @file SdlAudioCapture.hpp
 * @brief Microphone capture with SDL2.
 */

#pragma once

#include <mutex>
#include <vector>
#include <SDL.h>
#include "domain/AudioSource.hpp"

namespace writher::infrastructure {

/**
 * @class SdlAudioCapture
 * @brief Records the default input device into one float buffer.
 *
 * open() and close() are called from the coordination loop; samples arrive on
 * SDL's audio thread.
 */
class SdlAudioCapture : public domain::AudioSource {
public:
    explicit SdlAudioCapture(int sampleRate = 16000);
    ~SdlAudioCapture() override;

    SdlAudioCapture(const SdlAudioCapture&) = delete;
    SdlAudioCapture& operator=(const SdlAudioCapture&) = delete;

    void open() override;
    domain::AudioBuffer close() override;
    bool isOpen() const override { return m_device != 0; }
    void setLevelCallback(LevelCallback callback) override;

    /** @brief True when SDL reports at least one capture device. */
    bool hasInputDevice() const;

private:
    static void AudioCallback(void* userdata, Uint8* stream, int len);
    void onSamples(const float* samples, size_t count);

    int m_sampleRate;
    bool m_sdlReady = false;
    SDL_AudioDeviceID m_device = 0;
    SDL_AudioSpec m_obtained{};

    std::mutex m_mutex;
    std::vector<float> m_samples;
    LevelCallback m_levelCallback;
};

} // namespace writher::infrastructure
