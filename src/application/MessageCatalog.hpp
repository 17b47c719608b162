/**
 * @file MessageCatalog.hpp
 * @brief Localized user-facing strings and the assistant system prompt.
 */

#pragma once

#include <map>
#include <string>
#include "domain/Clock.hpp"

namespace writher::application {

enum class Language { English, Italian };

/** @brief "en" / "it"; anything else falls back to English. */
Language LanguageFromCode(const std::string& code);

/**
 * @class MessageCatalog
 * @brief String table keyed by message id, with {placeholder} substitution.
 *
 * Keys missing from the active language fall back to English, and keys
 * missing everywhere are returned verbatim.
 */
class MessageCatalog {
public:
    using Args = std::map<std::string, std::string>;

    explicit MessageCatalog(Language language = Language::English);

    std::string get(const std::string& key, const Args& args = {}) const;

    /** @brief System prompt for the function-calling backend, anchored at `now`. */
    std::string systemPrompt(domain::Instant now) const;

    Language language() const { return m_language; }

    /** @brief Whisper language code ("en", "it"). */
    std::string languageCode() const;

private:
    Language m_language;
};

} // namespace writher::application
