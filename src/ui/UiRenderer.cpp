/**
 * @file UiRenderer.cpp
 * @brief Status overlay and the notes, agenda, reminders and settings tabs.
 */

#include "ui/UiRenderer.hpp"

#include <functional>
#include <iostream>
#include <string>

#include "imgui.h"
#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"

namespace writher::ui {

namespace {

const ImVec4 kIdleColor(0.45f, 0.45f, 0.45f, 1.0f);
const ImVec4 kListeningColor(0.90f, 0.25f, 0.25f, 1.0f);
const ImVec4 kProcessingColor(0.95f, 0.70f, 0.20f, 1.0f);

/** @brief Runs a store mutation from a button and refreshes the snapshot. */
void StoreAction(AppState& app, const char* what, const std::function<void()>& action) {
    try {
        action();
    } catch (const domain::WritherError& e) {
        std::cerr << "[UI] " << what << " failed: " << e.what() << std::endl;
        app.AppendLog(std::string(what) + " failed: " + e.what());
    }
    app.Refresh();
}

void DrawTrack(const char* label, const TrackIndicator& track) {
    ImVec4 color = kIdleColor;
    if (track.state == "listening") {
        color = kListeningColor;
    } else if (track.state == "processing") {
        color = kProcessingColor;
    }
    ImGui::TextColored(color, "%-10s %s", label, track.state.c_str());
    if (!track.lastMessage.empty()) {
        ImGui::SameLine();
        ImGui::TextDisabled("%s", track.lastMessage.c_str());
    }
}

void DrawStatusHeader(AppState& app) {
    DrawTrack("Dictation", app.dictation);
    DrawTrack("Assistant", app.assistant);

    const bool capturing = app.dictation.state == "listening" || app.assistant.state == "listening";
    float level = capturing ? app.micLevel.load() : 0.0f;
    // RMS of speech rarely exceeds 0.3; stretch it so the bar moves.
    level = level * 3.0f;
    if (level > 1.0f) level = 1.0f;
    ImGui::ProgressBar(level, ImVec2(-1.0f, 0.0f), capturing ? "mic" : "");
}

void DrawNotesTab(AppState& app) {
    auto& notes = app.snapshot.notes;
    if (notes.empty()) {
        ImGui::TextDisabled("No notes yet.");
    } else if (ImGui::BeginTable("notes", 4, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerH | ImGuiTableFlags_Resizable)) {
        ImGui::TableSetupColumn("Created", ImGuiTableColumnFlags_WidthFixed, 130.0f);
        ImGui::TableSetupColumn("Category", ImGuiTableColumnFlags_WidthFixed, 90.0f);
        ImGui::TableSetupColumn("Note");
        ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 60.0f);
        ImGui::TableHeadersRow();
        for (const auto& note : notes) {
            ImGui::PushID(static_cast<int>(note.id));
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(domain::FormatLocal(note.createdAt).c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::TextUnformatted(note.category.c_str());
            ImGui::TableSetColumnIndex(2);
            if (!note.title.empty()) {
                ImGui::TextWrapped("%s: %s", note.title.c_str(), note.text.c_str());
            } else {
                ImGui::TextWrapped("%s", note.text.c_str());
            }
            ImGui::TableSetColumnIndex(3);
            if (ImGui::SmallButton("Delete")) {
                const auto id = note.id;
                StoreAction(app, "Delete note", [&app, id]() { app.store->deleteNote(id); });
                ImGui::PopID();
                break;
            }
            ImGui::PopID();
        }
        ImGui::EndTable();
    }

    ImGui::Spacing();
    ImGui::Separator();
    ImGui::TextUnformatted("Lists");
    if (app.snapshot.lists.empty()) {
        ImGui::TextDisabled("No lists yet.");
        return;
    }
    for (const auto& list : app.snapshot.lists) {
        ImGui::PushID(static_cast<int>(list.id));
        const std::string header = list.name + " (" + std::to_string(list.items.size()) + ")";
        if (ImGui::CollapsingHeader(header.c_str(), ImGuiTreeNodeFlags_DefaultOpen)) {
            bool changed = false;
            for (const auto& item : list.items) {
                ImGui::PushID(static_cast<int>(item.id));
                bool done = item.done;
                if (ImGui::Checkbox(item.text.c_str(), &done)) {
                    const auto id = item.id;
                    StoreAction(app, "Update item", [&app, id, done]() { app.store->setItemDone(id, done); });
                    changed = true;
                }
                ImGui::PopID();
                if (changed) break;
            }
            if (!changed && ImGui::SmallButton("Delete list")) {
                const auto id = list.id;
                StoreAction(app, "Delete list", [&app, id]() { app.store->deleteList(id); });
                changed = true;
            }
            if (changed) {
                ImGui::PopID();
                break;
            }
        }
        ImGui::PopID();
    }
}

void DrawAgendaTab(AppState& app) {
    auto& appointments = app.snapshot.appointments;
    if (appointments.empty()) {
        ImGui::TextDisabled("No upcoming appointments.");
        return;
    }
    if (ImGui::BeginTable("agenda", 4, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerH | ImGuiTableFlags_Resizable)) {
        ImGui::TableSetupColumn("When", ImGuiTableColumnFlags_WidthFixed, 170.0f);
        ImGui::TableSetupColumn("Appointment");
        ImGui::TableSetupColumn("Reminder", ImGuiTableColumnFlags_WidthFixed, 90.0f);
        ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 60.0f);
        ImGui::TableHeadersRow();
        for (const auto& appointment : appointments) {
            ImGui::PushID(static_cast<int>(appointment.id));
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(domain::FormatLocalWithWeekday(appointment.startAt).c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::TextWrapped("%s", appointment.title.c_str());
            if (!appointment.description.empty()) {
                ImGui::TextDisabled("%s", appointment.description.c_str());
            }
            ImGui::TableSetColumnIndex(2);
            if (appointment.notified) {
                ImGui::TextDisabled("sent");
            } else {
                ImGui::Text("%d min", appointment.remindLeadMinutes);
            }
            ImGui::TableSetColumnIndex(3);
            if (ImGui::SmallButton("Delete")) {
                const auto id = appointment.id;
                StoreAction(app, "Delete appointment", [&app, id]() { app.store->deleteAppointment(id); });
                ImGui::PopID();
                break;
            }
            ImGui::PopID();
        }
        ImGui::EndTable();
    }
}

void DrawRemindersTab(AppState& app) {
    auto& reminders = app.snapshot.reminders;
    if (reminders.empty()) {
        ImGui::TextDisabled("No pending reminders.");
        return;
    }
    if (ImGui::BeginTable("reminders", 3, ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerH | ImGuiTableFlags_Resizable)) {
        ImGui::TableSetupColumn("Fires at", ImGuiTableColumnFlags_WidthFixed, 130.0f);
        ImGui::TableSetupColumn("Reminder");
        ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 60.0f);
        ImGui::TableHeadersRow();
        for (const auto& reminder : reminders) {
            ImGui::PushID(static_cast<int>(reminder.id));
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(domain::FormatLocal(reminder.fireAt).c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::TextWrapped("%s", reminder.text.c_str());
            ImGui::TableSetColumnIndex(2);
            if (ImGui::SmallButton("Delete")) {
                const auto id = reminder.id;
                StoreAction(app, "Delete reminder", [&app, id]() { app.store->deleteReminder(id); });
                ImGui::PopID();
                break;
            }
            ImGui::PopID();
        }
        ImGui::EndTable();
    }
}

void DrawSettingsTab(AppState& app) {
    auto& settings = app.settings;
    if (ImGui::Checkbox("Hold to record", &settings.holdToRecord)) {
        settings.dirty = true;
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", settings.holdToRecord ? "(release the key to stop)" : "(press again to stop)");

    if (ImGui::SliderInt("Max recording (s)", &settings.maxRecordSeconds, 5, 600)) {
        settings.dirty = true;
    }

    ImGui::Spacing();
    ImGui::BeginDisabled(!settings.dirty);
    if (ImGui::Button("Save", ImVec2(120, 0))) {
        app.SaveSettings();
    }
    ImGui::EndDisabled();
}

void DrawLogTab(AppState& app) {
    ImGui::BeginChild("LogRegion", ImVec2(0, 0), true);
    for (const auto& line : app.GetLogSnapshot()) {
        ImGui::TextWrapped("%s", line.c_str());
    }
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
        ImGui::SetScrollHereY(1.0f);
    }
    ImGui::EndChild();
}

} // namespace

void DrawUI(AppState& app) {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::Begin("Main", NULL, ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_MenuBar);

    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("Refresh")) {
                app.Refresh();
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Quit")) {
                app.exitRequested = true;
            }
            ImGui::EndMenu();
        }
        ImGui::EndMenuBar();
    }

    DrawStatusHeader(app);
    ImGui::Separator();

    if (ImGui::BeginTabBar("MainTabs")) {
        const char* labels[] = {"Notes", "Agenda", "Reminders", "Settings", "Log"};
        for (int i = 0; i < 5; ++i) {
            ImGuiTabItemFlags flags = (app.requestedTab == i) ? ImGuiTabItemFlags_SetSelected : 0;
            if (!ImGui::BeginTabItem(labels[i], NULL, flags)) {
                continue;
            }
            if (app.requestedTab == i) app.requestedTab = -1;
            if (app.activeTab != i) {
                app.activeTab = i;
                app.Refresh();
            }
            switch (i) {
                case 0: DrawNotesTab(app); break;
                case 1: DrawAgendaTab(app); break;
                case 2: DrawRemindersTab(app); break;
                case 3: DrawSettingsTab(app); break;
                default: DrawLogTab(app); break;
            }
            ImGui::EndTabItem();
        }
        ImGui::EndTabBar();
    }

    ImGui::End();
}

} // namespace writher::ui
