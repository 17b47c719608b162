/**
 * @file Note.hpp
 * @brief Notes and lists kept by the assistant.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "domain/Clock.hpp"

namespace writher::domain {

/**
 * @struct Note
 * @brief Free-text note. Immutable once created, except for deletion.
 */
struct Note {
    std::int64_t id = 0;
    std::string title;
    std::string text;
    std::string category = "general";
    Instant createdAt{};
};

/**
 * @struct ListItem
 * @brief Entry of a list. Owned by exactly one NoteList.
 */
struct ListItem {
    std::int64_t id = 0;
    std::int64_t listId = 0;
    std::string text;
    bool done = false;
};

/**
 * @struct NoteList
 * @brief Named list (shopping, todo...). Deleting it deletes its items.
 */
struct NoteList {
    std::int64_t id = 0;
    std::string name; ///< Unique among lists, compared case-insensitively.
    Instant createdAt{};
    std::vector<ListItem> items;
};

} // namespace writher::domain
