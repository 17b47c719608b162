/**
 * @file ActionExecutor.hpp
 * @brief Applies a validated action batch to the store in one transaction.
 */

#pragma once

#include <optional>
#include <string>
#include "application/MessageCatalog.hpp"
#include "domain/Action.hpp"
#include "domain/StatusEvent.hpp"
#include "domain/Store.hpp"

namespace writher::application {

/**
 * @struct AssistantReply
 * @brief Confirmation of an applied batch, plus the view a query asked for.
 */
struct AssistantReply {
    std::string message;
    std::optional<domain::ViewKind> view;
};

/**
 * @class ActionExecutor
 * @brief Executes every action of a batch or none of them.
 *
 * Runs on the coordination loop. A failing action rolls back everything the
 * batch wrote before it and the error propagates unchanged.
 */
class ActionExecutor {
public:
    ActionExecutor(domain::Store& store, const MessageCatalog& messages, int defaultLeadMinutes = 15);

    /** @throws WritherError (UnrecognizedAction, PersistenceError). */
    AssistantReply apply(const domain::ActionBatch& batch);

private:
    std::string execute(const domain::SaveNote& action);
    std::string execute(const domain::CreateList& action);
    std::string execute(const domain::AddItem& action);
    std::string execute(const domain::CreateAppointment& action);
    std::string execute(const domain::CreateReminder& action);
    std::string execute(const domain::QueryNotes& action);
    std::string execute(const domain::QueryAgenda& action);
    std::string execute(const domain::QueryReminders& action);

    domain::NoteList resolveList(const std::string& ref);

    domain::Store& m_store;
    const MessageCatalog& m_messages;
    int m_defaultLeadMinutes;
    std::optional<domain::ViewKind> m_pendingView;
};

} // namespace writher::application
