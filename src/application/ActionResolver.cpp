/**
 * @file ActionResolver.cpp
 * @brief Implementation of ActionResolver.
 */

#include "application/ActionResolver.hpp"

#include <iostream>
#include "application/ActionSchema.hpp"
#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"

namespace writher::application {

using json = nlohmann::json;
using domain::FailureKind;
using domain::WritherError;

namespace {

std::string Trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

ActionResolver::ActionResolver(std::shared_ptr<domain::FunctionCallingService> backend,
                               const MessageCatalog& messages,
                               std::chrono::minutes pastTolerance)
    : m_backend(std::move(backend))
    , m_messages(messages)
    , m_pastTolerance(pastTolerance)
    , m_tools(BuildToolSchema()) {}

std::vector<domain::ToolCall> ActionResolver::callBackend(const std::string& transcript, domain::Instant now) {
    const std::string prompt = m_messages.systemPrompt(now);
    try {
        return m_backend->callFunctions(prompt, transcript, m_tools);
    } catch (const WritherError& e) {
        if (!e.isTransient()) {
            throw;
        }
        std::cerr << "[ActionResolver] Transient backend failure, retrying once: " << e.what() << std::endl;
    }

    try {
        return m_backend->callFunctions(prompt, transcript, m_tools);
    } catch (const WritherError& e) {
        if (e.kind() == FailureKind::BackendTimeout) {
            throw;
        }
        throw WritherError(FailureKind::BackendUnavailable, e.what());
    }
}

domain::ActionBatch ActionResolver::resolve(const std::string& transcript, domain::Instant now) {
    std::cout << "[ActionResolver] Resolving: \"" << transcript << "\"" << std::endl;
    auto calls = callBackend(transcript, now);
    if (calls.empty()) {
        throw WritherError(FailureKind::UnrecognizedAction, m_messages.get("not_understood"));
    }

    domain::ActionBatch batch;
    batch.reserve(calls.size());
    for (const auto& call : calls) {
        if (call.name == domain::AddItem::Name) {
            // "items" fans out into one AddItem per entry.
            json args = call.arguments.is_string() ? json::parse(call.arguments.get<std::string>(), nullptr, false)
                                                   : call.arguments;
            if (args.is_object() && args.contains("items") && args["items"].is_array() && !args.contains("text")) {
                for (const auto& item : args["items"]) {
                    json single = args;
                    single.erase("items");
                    single["text"] = item;
                    batch.push_back(toAction(domain::ToolCall{call.name, single}, now));
                }
                continue;
            }
        }
        batch.push_back(toAction(call, now));
    }

    std::cout << "[ActionResolver] Resolved " << batch.size() << " action(s):";
    for (const auto& action : batch) {
        std::cout << " " << domain::ActionName(action);
    }
    std::cout << std::endl;
    return batch;
}

domain::Action ActionResolver::toAction(const domain::ToolCall& call, domain::Instant now) const {
    json args = call.arguments;
    if (args.is_string()) {
        args = json::parse(args.get<std::string>(), nullptr, false);
    }
    if (args.is_null()) {
        args = json::object();
    }

    auto invalid = [&](const std::string& detail) {
        return WritherError(FailureKind::UnrecognizedAction,
                            m_messages.get("invalid_arguments", {{"name", call.name}, {"detail", detail}}));
    };

    if (!args.is_object()) {
        throw invalid("arguments are not an object");
    }

    auto requireText = [&](const char* field) {
        if (!args.contains(field) || !args[field].is_string()) {
            throw invalid(std::string("missing text field '") + field + "'");
        }
        std::string value = Trim(args[field].get<std::string>());
        if (value.empty()) {
            throw invalid(std::string("empty field '") + field + "'");
        }
        return value;
    };

    auto optionalText = [&](const char* field, const std::string& fallback) {
        if (args.contains(field) && args[field].is_string()) {
            std::string value = Trim(args[field].get<std::string>());
            if (!value.empty()) return value;
        }
        return fallback;
    };

    auto requireInstant = [&](const char* field) {
        const std::string raw = requireText(field);
        auto instant = domain::ParseIsoInstant(raw);
        if (!instant) {
            throw invalid(std::string("'") + field + "' is not an absolute date-time: " + raw);
        }
        if (*instant < now - m_pastTolerance) {
            throw WritherError(FailureKind::UnrecognizedAction,
                               m_messages.get("time_in_past", {{"name", call.name}, {"when", domain::FormatLocal(*instant)}}));
        }
        return *instant;
    };

    if (call.name == domain::SaveNote::Name) {
        domain::SaveNote action;
        action.text = requireText("text");
        action.title = optionalText("title", "");
        action.category = optionalText("category", "general");
        return action;
    }

    if (call.name == domain::CreateList::Name) {
        domain::CreateList action;
        action.name = requireText("name");
        if (!args.contains("items") || !args["items"].is_array()) {
            throw invalid("missing array field 'items'");
        }
        for (const auto& item : args["items"]) {
            if (!item.is_string()) {
                throw invalid("list items must be text");
            }
            std::string text = Trim(item.get<std::string>());
            if (!text.empty()) {
                action.items.push_back(text);
            }
        }
        return action;
    }

    if (call.name == domain::AddItem::Name) {
        domain::AddItem action;
        if (args.contains("list") && args["list"].is_number_integer()) {
            action.listRef = std::to_string(args["list"].get<long long>());
        } else {
            action.listRef = requireText("list");
        }
        action.text = requireText("text");
        return action;
    }

    if (call.name == domain::CreateAppointment::Name) {
        domain::CreateAppointment action;
        action.title = requireText("title");
        action.startAt = requireInstant("start_at");
        if (args.contains("remind_lead_minutes") && !args["remind_lead_minutes"].is_null()) {
            if (!args["remind_lead_minutes"].is_number_integer()) {
                throw invalid("'remind_lead_minutes' must be an integer");
            }
            int lead = args["remind_lead_minutes"].get<int>();
            if (lead < 0) {
                throw invalid("'remind_lead_minutes' must not be negative");
            }
            action.remindLeadMinutes = lead;
        }
        action.description = optionalText("description", "");
        return action;
    }

    if (call.name == domain::CreateReminder::Name) {
        domain::CreateReminder action;
        action.text = requireText("text");
        action.fireAt = requireInstant("fire_at");
        return action;
    }

    if (call.name == domain::QueryNotes::Name) return domain::QueryNotes{};
    if (call.name == domain::QueryAgenda::Name) return domain::QueryAgenda{};
    if (call.name == domain::QueryReminders::Name) return domain::QueryReminders{};

    throw WritherError(FailureKind::UnrecognizedAction, m_messages.get("unknown_command", {{"name", call.name}}));
}

} // namespace writher::application
