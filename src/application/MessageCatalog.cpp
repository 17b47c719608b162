/**
 * @file MessageCatalog.cpp
 * @brief English and Italian string tables.
 */

#include "application/MessageCatalog.hpp"

#include <unordered_map>
#include "domain/InstantFormat.hpp"

namespace writher::application {

namespace {

using Table = std::unordered_map<std::string, std::string>;

const Table& English() {
    static const Table table = {
        {"note_saved", "Note saved (#{id})"},
        {"list_saved", "List '{name}' saved ({count} items)"},
        {"added_to_list", "Added to '{name}'"},
        {"list_not_found", "List '{name}' not found"},
        {"list_exists", "A list named '{name}' already exists"},
        {"appointment_created", "Appointment created: {title} ({when})"},
        {"reminder_set", "Reminder set: {when}"},
        {"not_understood", "I didn't understand the command"},
        {"unknown_command", "Unknown command: {name}"},
        {"invalid_arguments", "Invalid arguments for {name}: {detail}"},
        {"time_in_past", "{name}: {when} is already in the past"},
        {"show_notes", "Here are your notes"},
        {"show_appointments", "Here is your agenda"},
        {"show_reminders", "Here are your reminders"},
        {"nothing_heard", "Nothing heard"},
        {"too_short", "Too short, skipped"},
        {"injection_saved", "Paste failed, text saved to recovery file"},
        {"assistant_error", "Assistant error"},
        {"backend_down", "Writher: assistant backend not reachable"},
        {"mic_missing", "No microphone detected"},
        {"reminder_toast_title", "Writher Reminder"},
        {"appointment_toast_title", "Writher Appointment"},
        {"appointment_toast_body", "{title} in {minutes} min"},
        {"appointment_toast_now", "{title} now!"},
        {"lang_name", "English"},
    };
    return table;
}

const Table& Italian() {
    static const Table table = {
        {"note_saved", "Nota salvata (#{id})"},
        {"list_saved", "Lista '{name}' salvata ({count} elementi)"},
        {"added_to_list", "Aggiunto a '{name}'"},
        {"list_not_found", "Lista '{name}' non trovata"},
        {"list_exists", "Esiste già una lista '{name}'"},
        {"appointment_created", "Appuntamento creato: {title} ({when})"},
        {"reminder_set", "Reminder impostato: {when}"},
        {"not_understood", "Non ho capito il comando"},
        {"unknown_command", "Comando sconosciuto: {name}"},
        {"show_notes", "Ecco le note"},
        {"show_appointments", "Ecco l'agenda"},
        {"show_reminders", "Ecco i reminder"},
        {"nothing_heard", "Non ho sentito nulla"},
        {"too_short", "Troppo breve, ignorato"},
        {"injection_saved", "Incolla fallito, testo salvato nel file di recupero"},
        {"assistant_error", "Errore assistente"},
        {"backend_down", "Writher: assistente non raggiungibile"},
        {"mic_missing", "Nessun microfono rilevato"},
        {"reminder_toast_title", "Writher Promemoria"},
        {"appointment_toast_title", "Writher Appuntamento"},
        {"appointment_toast_body", "{title} tra {minutes} min"},
        {"appointment_toast_now", "{title} adesso!"},
        {"lang_name", "Italian"},
    };
    return table;
}

std::string Substitute(std::string text, const MessageCatalog::Args& args) {
    for (const auto& [name, value] : args) {
        const std::string token = "{" + name + "}";
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return text;
}

} // namespace

Language LanguageFromCode(const std::string& code) {
    return code == "it" ? Language::Italian : Language::English;
}

MessageCatalog::MessageCatalog(Language language) : m_language(language) {}

std::string MessageCatalog::get(const std::string& key, const Args& args) const {
    const Table& active = m_language == Language::Italian ? Italian() : English();
    auto it = active.find(key);
    if (it == active.end()) {
        it = English().find(key);
        if (it == English().end()) {
            return key;
        }
    }
    return Substitute(it->second, args);
}

std::string MessageCatalog::systemPrompt(domain::Instant now) const {
    return Substitute(
        "You are Writher, a voice assistant for productivity. "
        "Current local date and time: {now}. "
        "The user speaks {lang_name}. "
        "Interpret the request and call the appropriate functions; call several "
        "functions when the request contains several actions. "
        "Convert relative times such as 'tomorrow at 9' or 'in one hour' into "
        "absolute ISO-8601 date-times (YYYY-MM-DDTHH:MM) in the user's local time. "
        "Always answer with function calls, never with plain text.",
        {{"now", domain::FormatLocalWithWeekday(now)}, {"lang_name", get("lang_name")}});
}

std::string MessageCatalog::languageCode() const {
    return m_language == Language::Italian ? "it" : "en";
}

} // namespace writher::application
