/**
 * @file AppState.hpp
 * @brief State shared between the coordination loop and the ImGui panels.
 */

#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Agenda.hpp"
#include "domain/Clock.hpp"
#include "domain/Note.hpp"
#include "domain/Session.hpp"
#include "domain/StatusEvent.hpp"
#include "domain/Store.hpp"

namespace writher::ui {

/**
 * @struct TrackIndicator
 * @brief What the overlay shows for one hotkey track.
 */
struct TrackIndicator {
    domain::SessionKind kind;
    std::string state = "idle";
    std::string lastMessage;
};

/**
 * @struct StoreSnapshot
 * @brief Copy of the store rows shown by the notes window.
 */
struct StoreSnapshot {
    std::vector<domain::Note> notes;
    std::vector<domain::NoteList> lists;
    std::vector<domain::Appointment> appointments;
    std::vector<domain::Reminder> reminders;
};

/**
 * @struct SettingsForm
 * @brief Editable copy of the settings the user can change at runtime.
 */
struct SettingsForm {
    bool holdToRecord = true;
    int maxRecordSeconds = 120;
    bool dirty = false;
};

/**
 * @struct AppState
 * @brief Everything DrawUI needs. Only the microphone level is written off the loop.
 */
struct AppState {
    domain::Store* store = nullptr;
    std::shared_ptr<domain::Clock> clock;

    TrackIndicator dictation{domain::SessionKind::Dictation};
    TrackIndicator assistant{domain::SessionKind::Assistant};
    std::atomic<float> micLevel{0.0f};

    bool raiseWindow = false; ///< Set by a view request, consumed by the frame loop.
    int activeTab = 0;
    int requestedTab = -1;
    StoreSnapshot snapshot;
    SettingsForm settings;

    /** @brief Applies saved settings to the running services. */
    std::function<void(const SettingsForm&)> onSettingsSaved;
    bool exitRequested = false;

    /** @brief Updates the overlay and the log from a status event. Loop thread only. */
    void ApplyStatus(const domain::StatusEvent& event);

    /** @brief Selects the tab matching a view request and asks for the window to be raised. */
    void RequestView(domain::ViewKind view);

    /** @brief Reloads the snapshot from the store. */
    void Refresh();

    /** @brief Persists the settings form into the store and notifies onSettingsSaved. */
    bool SaveSettings();

    void AppendLog(const std::string& line);
    std::vector<std::string> GetLogSnapshot();

private:
    std::mutex m_logMutex;
    std::deque<std::string> m_log;
};

/** @brief Tab index of a view in the notes window. */
int TabForView(domain::ViewKind view);

} // namespace writher::ui
