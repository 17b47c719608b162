/**
 * @file FileRecoveryJournal.hpp
 * @brief Append-only text file holding dictations that could not be pasted.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include "domain/RecoveryJournal.hpp"

namespace writher::infrastructure {

/**
 * @class FileRecoveryJournal
 * @brief One "[YYYY-MM-DD HH:MM:SS] text" line per entry, fsync'ed before append() returns.
 */
class FileRecoveryJournal : public domain::RecoveryJournal {
public:
    explicit FileRecoveryJournal(std::filesystem::path path);

    bool append(const std::string& text) override;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
    std::mutex m_mutex;
};

} // namespace writher::infrastructure
