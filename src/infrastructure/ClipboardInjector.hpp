/**
 * @file ClipboardInjector.hpp
 * @brief Pastes text through the clipboard and a synthesized Ctrl+V.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include "domain/TextInjector.hpp"

namespace writher::infrastructure {

/**
 * @class ClipboardInjector
 * @brief Clipboard save -> set -> paste -> restore, for Wayland (wl-clipboard, wtype)
 *        and X11 (xclip, xdotool).
 */
class ClipboardInjector : public domain::TextInjector {
public:
    enum class Backend { None, Wayland, X11 };

    ClipboardInjector();

    void paste(const std::string& text) override;

    Backend backend() const { return m_backend; }

    /** @brief Picks the backend from WAYLAND_DISPLAY / DISPLAY. */
    static Backend DetectBackend();

private:
    bool readClipboard(std::string& out) const;
    bool writeClipboard(const std::string& text) const;
    bool sendPasteKeystroke() const;

    Backend m_backend;
    std::mutex m_mutex;
    std::chrono::milliseconds m_settleDelay{50};
    std::chrono::milliseconds m_restoreDelay{100};
};

} // namespace writher::infrastructure
