/**
 * @file ActionSchema.cpp
 * @brief Implementation of BuildToolSchema.
 */

#include "application/ActionSchema.hpp"

namespace writher::application {

using json = nlohmann::json;

namespace {

json Function(const char* name, const char* description, json properties, json required) {
    return {
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", {
                {"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)}
            }}
        }}
    };
}

json StringProperty(const char* description) {
    return {{"type", "string"}, {"description", description}};
}

} // namespace

json BuildToolSchema() {
    json tools = json::array();

    tools.push_back(Function("save_note",
        "Save a free-text note. Use for thoughts and notes without a specific time.",
        {
            {"text", StringProperty("Full note content")},
            {"title", StringProperty("Short title for the note")},
            {"category", StringProperty("Category: general, work, personal, idea")}
        },
        json::array({"text"})));

    tools.push_back(Function("create_list",
        "Create a new named list (shopping list, todo list, packing list...) with its items.",
        {
            {"name", StringProperty("List name, e.g. 'Shopping'")},
            {"items", {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "Initial items"}}}
        },
        json::array({"name", "items"})));

    tools.push_back(Function("add_item",
        "Add an item to an existing list, found by name or id.",
        {
            {"list", StringProperty("Name or numeric id of the existing list")},
            {"text", StringProperty("Item to add")},
            {"items", {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", "Several items to add"}}}
        },
        json::array({"list"})));

    tools.push_back(Function("create_appointment",
        "Create a calendar appointment at an absolute date and time.",
        {
            {"title", StringProperty("Appointment title")},
            {"start_at", StringProperty("Absolute ISO-8601 date-time, e.g. 2026-02-23T15:00")},
            {"remind_lead_minutes", {{"type", "integer"}, {"description", "Minutes before the start to notify"}}},
            {"description", StringProperty("Optional details")}
        },
        json::array({"title", "start_at"})));

    tools.push_back(Function("create_reminder",
        "Set a reminder that triggers a notification at an absolute date and time.",
        {
            {"text", StringProperty("What to remind about")},
            {"fire_at", StringProperty("Absolute ISO-8601 date-time, e.g. 2026-02-23T10:00")}
        },
        json::array({"text", "fire_at"})));

    tools.push_back(Function("query_notes", "Show saved notes and lists.", json::object(), json::array()));
    tools.push_back(Function("query_agenda", "Show upcoming appointments.", json::object(), json::array()));
    tools.push_back(Function("query_reminders", "Show pending reminders.", json::object(), json::array()));

    return tools;
}

} // namespace writher::application
