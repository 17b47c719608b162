/**
 * @file SdlAudioCapture.cpp
 * @brief Implementation of SdlAudioCapture.
 */

#include "infrastructure/SdlAudioCapture.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/Failure.hpp"
#include <iostream>

namespace writher::infrastructure {

using domain::FailureKind;
using domain::WritherError;

SdlAudioCapture::SdlAudioCapture(int sampleRate) : m_sampleRate(sampleRate) {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        std::cerr << "[SdlAudioCapture] SDL audio init failed: " << SDL_GetError() << std::endl;
        return;
    }
    m_sdlReady = true;
}

SdlAudioCapture::~SdlAudioCapture() {
    if (m_device != 0) {
        SDL_CloseAudioDevice(m_device);
        m_device = 0;
    }
    if (m_sdlReady) {
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
}

bool SdlAudioCapture::hasInputDevice() const {
    return m_sdlReady && SDL_GetNumAudioDevices(SDL_TRUE) > 0;
}

void SdlAudioCapture::setLevelCallback(LevelCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_levelCallback = std::move(callback);
}

void SdlAudioCapture::open() {
    if (m_device != 0) {
        throw WritherError(FailureKind::Busy, "Microphone already open");
    }
    if (!m_sdlReady) {
        throw WritherError(FailureKind::DeviceUnavailable, "SDL audio subsystem not available");
    }
    if (SDL_GetNumAudioDevices(SDL_TRUE) <= 0) {
        throw WritherError(FailureKind::DeviceUnavailable, "No capture device found");
    }

    SDL_AudioSpec desired;
    SDL_zero(desired);
    desired.freq = m_sampleRate;
    desired.format = AUDIO_F32SYS;
    desired.channels = 1;
    desired.samples = 1024;
    desired.callback = &SdlAudioCapture::AudioCallback;
    desired.userdata = this;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_samples.clear();
        m_samples.reserve(static_cast<size_t>(m_sampleRate) * 10);
    }

    m_device = SDL_OpenAudioDevice(nullptr, SDL_TRUE, &desired, &m_obtained,
                                   SDL_AUDIO_ALLOW_FREQUENCY_CHANGE | SDL_AUDIO_ALLOW_CHANNELS_CHANGE);
    if (m_device == 0) {
        throw WritherError(FailureKind::DeviceUnavailable,
                           std::string("Failed to open microphone: ") + SDL_GetError());
    }

    SDL_PauseAudioDevice(m_device, 0);
    std::cout << "[SdlAudioCapture] Capturing at " << m_obtained.freq << " Hz, "
              << static_cast<int>(m_obtained.channels) << " channel(s)" << std::endl;
}

domain::AudioBuffer SdlAudioCapture::close() {
    domain::AudioBuffer buffer;
    if (m_device == 0) {
        return buffer;
    }

    SDL_PauseAudioDevice(m_device, 1);
    SDL_CloseAudioDevice(m_device);
    m_device = 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    buffer.samples = std::move(m_samples);
    m_samples.clear();
    buffer.sampleRate = m_obtained.freq;
    buffer.channels = m_obtained.channels;
    return buffer;
}

void SdlAudioCapture::AudioCallback(void* userdata, Uint8* stream, int len) {
    auto* self = static_cast<SdlAudioCapture*>(userdata);
    self->onSamples(reinterpret_cast<const float*>(stream), static_cast<size_t>(len) / sizeof(float));
}

void SdlAudioCapture::onSamples(const float* samples, size_t count) {
    LevelCallback level;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_samples.insert(m_samples.end(), samples, samples + count);
        level = m_levelCallback;
    }
    if (level) {
        level(AudioUtils::ComputeRms(samples, count));
    }
}

} // namespace writher::infrastructure
