/**
 * @file EvdevHotkeySource.hpp
 * @brief Global hold/release hotkeys read from Linux input devices.
 */

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "domain/Session.hpp"

namespace writher::infrastructure {

/**
 * @class EvdevHotkeySource
 * @brief Watches every keyboard under /dev/input for the two session keys.
 *
 * Works the same under X11 and Wayland; the user needs read access to the
 * event devices (usually the "input" group). Auto-repeat events are dropped
 * here, press and release are forwarded from the reader thread.
 */
class EvdevHotkeySource {
public:
    /** @brief (kind, pressed). Called on the reader thread. */
    using KeyCallback = std::function<void(domain::SessionKind, bool)>;

    EvdevHotkeySource(int dictationKeyCode, int assistantKeyCode, KeyCallback callback);
    ~EvdevHotkeySource();

    EvdevHotkeySource(const EvdevHotkeySource&) = delete;
    EvdevHotkeySource& operator=(const EvdevHotkeySource&) = delete;

    /** @return False when no readable keyboard device exposes the keys. */
    bool start();
    void stop();

    /** @brief Linux key code for a config key name ("right_alt", "f9", ...). */
    static std::optional<int> KeyCodeFromName(const std::string& name);

private:
    void readerLoop();
    void handleKey(int code, int value);

    int m_dictationKey;
    int m_assistantKey;
    KeyCallback m_callback;
    std::vector<int> m_fds;
    std::thread m_reader;
    std::atomic<bool> m_running{false};
};

} // namespace writher::infrastructure
