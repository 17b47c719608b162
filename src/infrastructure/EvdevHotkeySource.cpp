/**
 * @file EvdevHotkeySource.cpp
 * @brief Implementation of EvdevHotkeySource.
 */

#include "infrastructure/EvdevHotkeySource.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace writher::infrastructure {

namespace {

constexpr int kPollTimeoutMs = 200;

bool TestBit(const unsigned long* bits, int bit) {
    constexpr int kBitsPerLong = static_cast<int>(sizeof(unsigned long) * 8);
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

bool DeviceHasKeys(int fd, int keyA, int keyB) {
    constexpr size_t kLongs = (KEY_MAX + sizeof(unsigned long) * 8) / (sizeof(unsigned long) * 8);
    unsigned long keyBits[kLongs];
    std::memset(keyBits, 0, sizeof(keyBits));
    if (ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) < 0) {
        return false;
    }
    return TestBit(keyBits, keyA) || TestBit(keyBits, keyB);
}

} // namespace

EvdevHotkeySource::EvdevHotkeySource(int dictationKeyCode, int assistantKeyCode, KeyCallback callback)
    : m_dictationKey(dictationKeyCode)
    , m_assistantKey(assistantKeyCode)
    , m_callback(std::move(callback)) {}

EvdevHotkeySource::~EvdevHotkeySource() {
    stop();
}

std::optional<int> EvdevHotkeySource::KeyCodeFromName(const std::string& name) {
    static const std::map<std::string, int> kKeys = {
        {"alt_gr", KEY_RIGHTALT}, {"right_alt", KEY_RIGHTALT}, {"left_alt", KEY_LEFTALT},
        {"right_ctrl", KEY_RIGHTCTRL}, {"ctrl_r", KEY_RIGHTCTRL}, {"left_ctrl", KEY_LEFTCTRL},
        {"right_shift", KEY_RIGHTSHIFT}, {"left_shift", KEY_LEFTSHIFT},
        {"right_meta", KEY_RIGHTMETA}, {"left_meta", KEY_LEFTMETA},
        {"caps_lock", KEY_CAPSLOCK}, {"scroll_lock", KEY_SCROLLLOCK}, {"pause", KEY_PAUSE},
        {"insert", KEY_INSERT}, {"menu", KEY_COMPOSE},
        {"f1", KEY_F1}, {"f2", KEY_F2}, {"f3", KEY_F3}, {"f4", KEY_F4}, {"f5", KEY_F5}, {"f6", KEY_F6},
        {"f7", KEY_F7}, {"f8", KEY_F8}, {"f9", KEY_F9}, {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    };

    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kKeys.find(key);
    if (it == kKeys.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool EvdevHotkeySource::start() {
    if (m_running) return true;

    namespace fs = std::filesystem;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/dev/input", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) != 0) continue;

        const int fd = ::open(entry.path().c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) continue;
        if (DeviceHasKeys(fd, m_dictationKey, m_assistantKey)) {
            m_fds.push_back(fd);
        } else {
            ::close(fd);
        }
    }
    if (ec) {
        std::cerr << "[EvdevHotkeySource] Cannot list /dev/input: " << ec.message() << std::endl;
    }

    if (m_fds.empty()) {
        std::cerr << "[EvdevHotkeySource] No readable keyboard found (is the user in the 'input' group?)" << std::endl;
        return false;
    }

    m_running = true;
    m_reader = std::thread(&EvdevHotkeySource::readerLoop, this);
    std::cout << "[EvdevHotkeySource] Listening on " << m_fds.size() << " device(s)" << std::endl;
    return true;
}

void EvdevHotkeySource::stop() {
    m_running = false;
    if (m_reader.joinable()) {
        m_reader.join();
    }
    for (int fd : m_fds) {
        ::close(fd);
    }
    m_fds.clear();
}

void EvdevHotkeySource::readerLoop() {
    std::vector<pollfd> pfds;
    for (int fd : m_fds) {
        pfds.push_back(pollfd{fd, POLLIN, 0});
    }

    while (m_running) {
        const int ready = ::poll(pfds.data(), pfds.size(), kPollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[EvdevHotkeySource] poll failed: " << std::strerror(errno) << std::endl;
            return;
        }
        if (ready == 0) continue;

        for (auto& pfd : pfds) {
            if (pfd.revents & (POLLERR | POLLHUP)) {
                std::cerr << "[EvdevHotkeySource] Device disappeared, ignoring it" << std::endl;
                pfd.fd = -pfd.fd - 1; // poll skips negative descriptors
                continue;
            }
            if (!(pfd.revents & POLLIN)) continue;

            input_event ev{};
            while (::read(pfd.fd, &ev, sizeof(ev)) == static_cast<ssize_t>(sizeof(ev))) {
                if (ev.type == EV_KEY) {
                    handleKey(ev.code, ev.value);
                }
            }
        }
    }
}

void EvdevHotkeySource::handleKey(int code, int value) {
    if (value == 2) return; // auto-repeat

    std::optional<domain::SessionKind> kind;
    if (code == m_dictationKey) {
        kind = domain::SessionKind::Dictation;
    } else if (code == m_assistantKey) {
        kind = domain::SessionKind::Assistant;
    }
    if (kind && m_callback) {
        m_callback(*kind, value == 1);
    }
}

} // namespace writher::infrastructure
