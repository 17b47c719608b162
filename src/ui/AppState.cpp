/**
 * @file AppState.cpp
 * @brief Implementation of the AppState status and snapshot handling.
 */
#include "ui/AppState.hpp"

#include <iostream>

#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"

namespace writher::ui {

namespace {

constexpr std::size_t kMaxLogLines = 200;

} // namespace

int TabForView(domain::ViewKind view) {
    switch (view) {
        case domain::ViewKind::Notes: return 0;
        case domain::ViewKind::Agenda: return 1;
        case domain::ViewKind::Reminders: return 2;
    }
    return 0;
}

void AppState::ApplyStatus(const domain::StatusEvent& event) {
    std::string line = domain::FormatLocal(clock ? clock->now() : domain::Instant{}) + " ";
    line += event.kind ? domain::SessionKindToString(*event.kind) : "app";
    line += ": ";
    line += domain::StatusTypeToString(event.type);
    if (event.failure) {
        line += " (";
        line += domain::FailureKindToString(*event.failure);
        line += ")";
    }
    if (!event.message.empty()) {
        line += " " + event.message;
    }
    AppendLog(line);

    if (!event.kind) {
        return;
    }
    TrackIndicator& track = (*event.kind == domain::SessionKind::Dictation) ? dictation : assistant;
    switch (event.type) {
        case domain::StatusType::Listening:
        case domain::StatusType::Processing:
            track.state = domain::StatusTypeToString(event.type);
            break;
        case domain::StatusType::Idle:
            track.state = "idle";
            micLevel = 0.0f;
            break;
        case domain::StatusType::ShowView:
            if (event.view) {
                RequestView(*event.view);
            }
            break;
        default:
            if (!event.message.empty()) {
                track.lastMessage = event.message;
            }
            break;
    }
}

void AppState::RequestView(domain::ViewKind view) {
    raiseWindow = true;
    requestedTab = TabForView(view);
    Refresh();
}

void AppState::Refresh() {
    if (!store) {
        return;
    }
    try {
        snapshot.notes = store->listNotes();
        snapshot.lists = store->listLists();
        snapshot.appointments = store->listAppointments(clock ? std::optional<domain::Instant>(clock->now())
                                                              : std::nullopt);
        snapshot.reminders = store->listReminders();
    } catch (const domain::WritherError& e) {
        std::cerr << "[AppState] Refresh failed: " << e.what() << std::endl;
        AppendLog(std::string("Refresh failed: ") + e.what());
    }
}

bool AppState::SaveSettings() {
    if (!store) {
        return false;
    }
    try {
        store->runAtomically([this]() {
            store->saveSetting("hold_to_record", settings.holdToRecord ? "1" : "0");
            store->saveSetting("max_record_seconds", std::to_string(settings.maxRecordSeconds));
        });
    } catch (const domain::WritherError& e) {
        std::cerr << "[AppState] Saving settings failed: " << e.what() << std::endl;
        AppendLog(std::string("Saving settings failed: ") + e.what());
        return false;
    }
    settings.dirty = false;
    if (onSettingsSaved) {
        onSettingsSaved(settings);
    }
    AppendLog("Settings saved.");
    return true;
}

void AppState::AppendLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_logMutex);
    m_log.push_back(line);
    while (m_log.size() > kMaxLogLines) {
        m_log.pop_front();
    }
}

std::vector<std::string> AppState::GetLogSnapshot() {
    std::lock_guard<std::mutex> lock(m_logMutex);
    return std::vector<std::string>(m_log.begin(), m_log.end());
}

} // namespace writher::ui
