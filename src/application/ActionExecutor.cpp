/**
 * @file ActionExecutor.cpp
 * @brief Implementation of ActionExecutor.
 */

#include "application/ActionExecutor.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <system_error>
#include <iostream>
#include <vector>
#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"

namespace writher::application {

using domain::FailureKind;
using domain::WritherError;

namespace {

/** @brief Parses a list id. Anything that is not a whole in-range number is a name. */
std::optional<std::int64_t> ParseListId(const std::string& value) {
    std::int64_t id = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, id);
    if (value.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return id;
}

} // namespace

ActionExecutor::ActionExecutor(domain::Store& store, const MessageCatalog& messages, int defaultLeadMinutes)
    : m_store(store), m_messages(messages), m_defaultLeadMinutes(defaultLeadMinutes) {}

AssistantReply ActionExecutor::apply(const domain::ActionBatch& batch) {
    std::vector<std::string> confirmations;
    m_pendingView.reset();

    m_store.runAtomically([&]() {
        confirmations.clear();
        for (const auto& action : batch) {
            confirmations.push_back(std::visit([this](const auto& a) { return execute(a); }, action));
        }
    });

    AssistantReply reply;
    for (size_t i = 0; i < confirmations.size(); ++i) {
        if (i > 0) reply.message += "; ";
        reply.message += confirmations[i];
    }
    reply.view = m_pendingView;
    std::cout << "[ActionExecutor] Applied " << batch.size() << " action(s): " << reply.message << std::endl;
    return reply;
}

std::string ActionExecutor::execute(const domain::SaveNote& action) {
    domain::Note note;
    note.title = action.title;
    note.text = action.text;
    note.category = action.category.empty() ? "general" : action.category;
    const auto id = m_store.saveNote(note);
    return m_messages.get("note_saved", {{"id", std::to_string(id)}});
}

std::string ActionExecutor::execute(const domain::CreateList& action) {
    std::int64_t listId = 0;
    try {
        listId = m_store.createList(action.name);
    } catch (const WritherError& e) {
        if (e.kind() != FailureKind::PersistenceError) throw;
        throw WritherError(FailureKind::PersistenceError, m_messages.get("list_exists", {{"name", action.name}}));
    }
    for (const auto& item : action.items) {
        m_store.addListItem(listId, item);
    }
    return m_messages.get("list_saved", {{"name", action.name}, {"count", std::to_string(action.items.size())}});
}

domain::NoteList ActionExecutor::resolveList(const std::string& ref) {
    std::optional<domain::NoteList> list;
    if (auto id = ParseListId(ref)) {
        list = m_store.findList(*id);
    }
    if (!list) {
        list = m_store.findListByName(ref);
    }
    if (!list) {
        throw WritherError(FailureKind::UnrecognizedAction, m_messages.get("list_not_found", {{"name", ref}}));
    }
    return *list;
}

std::string ActionExecutor::execute(const domain::AddItem& action) {
    const auto list = resolveList(action.listRef);
    m_store.addListItem(list.id, action.text);
    return m_messages.get("added_to_list", {{"name", list.name}});
}

std::string ActionExecutor::execute(const domain::CreateAppointment& action) {
    domain::Appointment appointment;
    appointment.title = action.title;
    appointment.description = action.description;
    appointment.startAt = action.startAt;
    appointment.remindLeadMinutes = action.remindLeadMinutes.value_or(m_defaultLeadMinutes);
    m_store.createAppointment(appointment);
    return m_messages.get("appointment_created",
                          {{"title", action.title}, {"when", domain::FormatLocal(action.startAt)}});
}

std::string ActionExecutor::execute(const domain::CreateReminder& action) {
    domain::Reminder reminder;
    reminder.text = action.text;
    reminder.fireAt = action.fireAt;
    m_store.createReminder(reminder);
    return m_messages.get("reminder_set", {{"when", domain::FormatLocal(action.fireAt)}});
}

std::string ActionExecutor::execute(const domain::QueryNotes&) {
    m_pendingView = domain::ViewKind::Notes;
    return m_messages.get("show_notes");
}

std::string ActionExecutor::execute(const domain::QueryAgenda&) {
    m_pendingView = domain::ViewKind::Agenda;
    return m_messages.get("show_appointments");
}

std::string ActionExecutor::execute(const domain::QueryReminders&) {
    m_pendingView = domain::ViewKind::Reminders;
    return m_messages.get("show_reminders");
}

} // namespace writher::application
