/**
 * @file AudioSource.hpp
 * @brief Interface for the microphone owned by one capture session.
 */

#pragma once

#include <functional>
#include <vector>

namespace writher::domain {

/**
 * @struct AudioBuffer
 * @brief One contiguous block of interleaved float samples.
 */
struct AudioBuffer {
    std::vector<float> samples;
    int sampleRate = 16000;
    int channels = 1;

    bool empty() const { return samples.empty(); }

    /** @brief Duration in milliseconds. */
    long long durationMs() const {
        if (sampleRate <= 0 || channels <= 0) return 0;
        return static_cast<long long>(samples.size() / static_cast<size_t>(channels)) * 1000 / sampleRate;
    }
};

/**
 * @class AudioSource
 * @brief Exclusive input device for the duration of one session.
 */
class AudioSource {
public:
    virtual ~AudioSource() = default;

    /** @brief Input level callback (RMS in [0,1]) used by the overlay. */
    using LevelCallback = std::function<void(float rms)>;

    /**
     * @brief Opens the default input device and starts recording.
     * @throws WritherError(DeviceUnavailable) when no input device can be opened.
     */
    virtual void open() = 0;

    /** @brief Stops recording, closes the device and returns everything captured. */
    virtual AudioBuffer close() = 0;

    /** @brief True while the device is open. */
    virtual bool isOpen() const = 0;

    virtual void setLevelCallback(LevelCallback callback) { (void)callback; }
};

} // namespace writher::domain
