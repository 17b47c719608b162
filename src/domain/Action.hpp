/**
 * @file Action.hpp
 * @brief Closed set of typed actions the assistant can apply to the store.
 */

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "domain/Clock.hpp"

namespace writher::domain {

struct SaveNote {
    static constexpr const char* Name = "save_note";
    std::string text;
    std::string title;
    std::string category = "general";
};

struct CreateList {
    static constexpr const char* Name = "create_list";
    std::string name;
    std::vector<std::string> items;
};

struct AddItem {
    static constexpr const char* Name = "add_item";
    std::string listRef; ///< List id (digits) or list name.
    std::string text;
};

struct CreateAppointment {
    static constexpr const char* Name = "create_appointment";
    std::string title;
    Instant startAt{};
    std::optional<int> remindLeadMinutes; ///< Configured default when absent.
    std::string description;
};

struct CreateReminder {
    static constexpr const char* Name = "create_reminder";
    std::string text;
    Instant fireAt{};
};

struct QueryNotes {
    static constexpr const char* Name = "query_notes";
};

struct QueryAgenda {
    static constexpr const char* Name = "query_agenda";
};

struct QueryReminders {
    static constexpr const char* Name = "query_reminders";
};

using Action = std::variant<
    SaveNote,
    CreateList,
    AddItem,
    CreateAppointment,
    CreateReminder,
    QueryNotes,
    QueryAgenda,
    QueryReminders
>;

/** @brief Actions resolved from one utterance. Applied all-or-nothing. */
using ActionBatch = std::vector<Action>;

inline const char* ActionName(const Action& action) {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::Name; }, action);
}

} // namespace writher::domain
