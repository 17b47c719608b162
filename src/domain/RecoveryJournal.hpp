/**
 * @file RecoveryJournal.hpp
 * @brief Durable fallback for dictated text that could not be pasted.
 */

#pragma once

#include <string>

namespace writher::domain {

class RecoveryJournal {
public:
    virtual ~RecoveryJournal() = default;

    /**
     * @brief Appends one timestamped entry and flushes it to disk.
     * @return False if the entry could not be written.
     */
    virtual bool append(const std::string& text) = 0;
};

} // namespace writher::domain
