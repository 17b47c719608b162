#include "infrastructure/ClipboardInjector.hpp"
#include "infrastructure/CommandRunner.hpp"
#include "domain/Failure.hpp"
#include <cstdlib>
#include <iostream>
#include <thread>

namespace writher::infrastructure {

using domain::FailureKind;
using domain::WritherError;

ClipboardInjector::ClipboardInjector() : m_backend(DetectBackend()) {
    switch (m_backend) {
        case Backend::Wayland:
            std::cout << "[ClipboardInjector] Using wl-clipboard + wtype" << std::endl;
            break;
        case Backend::X11:
            std::cout << "[ClipboardInjector] Using xclip + xdotool" << std::endl;
            break;
        case Backend::None:
            std::cerr << "[ClipboardInjector] No graphical session found, pasting disabled" << std::endl;
            break;
    }
}

ClipboardInjector::Backend ClipboardInjector::DetectBackend() {
    const char* wayland = std::getenv("WAYLAND_DISPLAY");
    if (wayland && *wayland) return Backend::Wayland;
    const char* display = std::getenv("DISPLAY");
    if (display && *display) return Backend::X11;
    return Backend::None;
}

bool ClipboardInjector::readClipboard(std::string& out) const {
    const std::string cmd = m_backend == Backend::Wayland ? "wl-paste --no-newline"
                                                          : "xclip -selection clipboard -o";
    CommandResult result = CommandRunner::Capture(cmd);
    if (!result.ok()) return false;
    out = std::move(result.output);
    return true;
}

bool ClipboardInjector::writeClipboard(const std::string& text) const {
    const std::string cmd = m_backend == Backend::Wayland ? "wl-copy" : "xclip -selection clipboard -i";
    return CommandRunner::Feed(cmd, text).ok();
}

bool ClipboardInjector::sendPasteKeystroke() const {
    if (m_backend == Backend::Wayland) {
        return CommandRunner::Capture("wtype -M ctrl v -m ctrl").ok();
    }
    // xdotool fails when no window has focus
    if (!CommandRunner::Capture("xdotool getactivewindow").ok()) {
        return false;
    }
    return CommandRunner::Capture("xdotool key --clearmodifiers ctrl+v").ok();
}

void ClipboardInjector::paste(const std::string& text) {
    if (text.empty()) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_backend == Backend::None) {
        throw WritherError(FailureKind::InjectionFailed, "No graphical session to paste into");
    }

    std::string original;
    const bool saved = readClipboard(original);

    if (!writeClipboard(text)) {
        throw WritherError(FailureKind::InjectionFailed, "Failed to set clipboard text");
    }
    std::this_thread::sleep_for(m_settleDelay);

    const bool pasted = sendPasteKeystroke();
    std::this_thread::sleep_for(m_restoreDelay);

    if (saved && !writeClipboard(original)) {
        std::cerr << "[ClipboardInjector] Could not restore the previous clipboard content" << std::endl;
    }

    if (!pasted) {
        throw WritherError(FailureKind::InjectionFailed, "Failed to synthesize the paste keystroke");
    }
    std::cout << "[ClipboardInjector] Pasted " << text.size() << " bytes" << std::endl;
}

} // namespace writher::infrastructure
