/**
 * @file TestDoubles.hpp
 * @brief Hand-written fakes shared by the test executables.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "domain/AudioSource.hpp"
#include "domain/Clock.hpp"
#include "domain/Failure.hpp"
#include "domain/FunctionCallingService.hpp"
#include "domain/NotificationSink.hpp"
#include "domain/RecoveryJournal.hpp"
#include "domain/StatusEvent.hpp"
#include "domain/TextInjector.hpp"
#include "domain/TranscriptionService.hpp"

namespace writher::test {

/** @brief Clock that only moves when told to. Wall and monotonic time advance together. */
class ManualClock : public domain::Clock {
public:
    explicit ManualClock(domain::Instant start = std::chrono::system_clock::from_time_t(1798761600)) // 2027-01-01Z
        : m_now(start) {}

    domain::Instant now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }
    domain::MonotonicPoint monotonic() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_mono;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += delta;
        m_mono += delta;
    }

    /** @brief Jumps the wall clock only (NTP step, suspend). */
    void setWall(domain::Instant instant) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = instant;
    }

private:
    mutable std::mutex m_mutex;
    domain::Instant m_now;
    domain::MonotonicPoint m_mono{};
};

class FakeAudioSource : public domain::AudioSource {
public:
    void open() override {
        ++opens;
        if (failOpen) {
            throw domain::WritherError(domain::FailureKind::DeviceUnavailable, "no input device");
        }
        m_open = true;
    }
    domain::AudioBuffer close() override {
        ++closes;
        m_open = false;
        domain::AudioBuffer buffer;
        buffer.samples.assign(static_cast<size_t>(nextDurationMs) * 16, 0.1f);
        return buffer;
    }
    bool isOpen() const override { return m_open; }

    bool failOpen = false;
    int nextDurationMs = 1500;
    int opens = 0;
    int closes = 0;

private:
    bool m_open = false;
};

/** @brief Returns queued transcripts; can block until released to simulate a slow engine. */
class FakeTranscriber : public domain::TranscriptionService {
public:
    std::string transcribe(const domain::AudioBuffer&) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++calls;
        m_cv.wait(lock, [this] { return !hold; });
        if (fail) {
            throw domain::WritherError(domain::FailureKind::TranscriptionFailed, "engine crashed");
        }
        if (transcripts.empty()) return {};
        std::string text = transcripts.front();
        transcripts.pop_front();
        return text;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            hold = false;
        }
        m_cv.notify_all();
    }

    std::deque<std::string> transcripts;
    bool hold = false;
    bool fail = false;
    int calls = 0;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

/** @brief Scripted backend: each call pops the next response or error. */
class FakeBackend : public domain::FunctionCallingService {
public:
    using Response = std::function<std::vector<domain::ToolCall>()>;

    std::vector<domain::ToolCall> callFunctions(const std::string& systemPrompt,
                                                const std::string& userText,
                                                const nlohmann::json& tools) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++calls;
        lastPrompt = systemPrompt;
        lastUserText = userText;
        lastTools = tools;
        if (responses.empty()) return {};
        Response next = responses.front();
        responses.pop_front();
        return next();
    }

    bool ping() override { return reachable; }

    void respond(std::vector<domain::ToolCall> calls) {
        responses.push_back([calls]() { return calls; });
    }
    void failTransient() {
        responses.push_back([]() -> std::vector<domain::ToolCall> {
            throw domain::WritherError(domain::FailureKind::BackendUnavailable, "connection refused", true);
        });
    }

    std::deque<Response> responses;
    bool reachable = true;
    int calls = 0;
    std::string lastPrompt;
    std::string lastUserText;
    nlohmann::json lastTools;

private:
    std::mutex m_mutex;
};

class FakeInjector : public domain::TextInjector {
public:
    void paste(const std::string& text) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (fail) {
            throw domain::WritherError(domain::FailureKind::InjectionFailed, "no focused window");
        }
        pasted.push_back(text);
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return pasted;
    }

    bool fail = false;
    std::vector<std::string> pasted;

private:
    std::mutex m_mutex;
};

class FakeJournal : public domain::RecoveryJournal {
public:
    bool append(const std::string& text) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        entries.push_back(text);
        return true;
    }
    std::vector<std::string> entries;

private:
    std::mutex m_mutex;
};

/** @brief Records notifications; can reject the first N. */
class FakeNotifier : public domain::NotificationSink {
public:
    bool fire(const std::string& title, const std::string& body) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++attempts;
        if (rejectNext > 0) {
            --rejectNext;
            return false;
        }
        shown.push_back(title + "|" + body);
        return true;
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return shown;
    }

    int rejectNext = 0;
    int attempts = 0;
    std::vector<std::string> shown;

private:
    std::mutex m_mutex;
};

/** @brief Collects status events emitted on the loop. */
struct StatusLog {
    std::vector<domain::StatusEvent> events;

    domain::StatusListener listener() {
        return [this](const domain::StatusEvent& e) { events.push_back(e); };
    }

    int count(domain::StatusType type) const {
        int n = 0;
        for (const auto& e : events) {
            if (e.type == type) ++n;
        }
        return n;
    }

    const domain::StatusEvent* last(domain::StatusType type) const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->type == type) return &*it;
        }
        return nullptr;
    }
};

/** @brief Fresh temporary database path, removed on destruction. */
class TempDatabase {
public:
    explicit TempDatabase(const std::string& name)
        : m_dir(std::filesystem::temp_directory_path() / ("writher_test_" + name)) {
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }
    ~TempDatabase() {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::string path() const { return (m_dir / "writher.db").string(); }
    std::filesystem::path dir() const { return m_dir; }

private:
    std::filesystem::path m_dir;
};

} // namespace writher::test
