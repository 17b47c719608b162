/**
 * @file SqliteStore.hpp
 * @brief SQLite implementation of the persistent store.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "domain/Clock.hpp"
#include "domain/Store.hpp"

struct sqlite3;

namespace writher::infrastructure {

/**
 * @class SqliteStore
 * @brief One connection, WAL journal, writes serialized by a recursive mutex.
 *
 * Separate SqliteStore instances on the same file (or separate processes)
 * are serialized by SQLite itself: every write starts with BEGIN IMMEDIATE,
 * and a busy connection waits up to the busy timeout.
 *
 * Instants are stored as INTEGER seconds since the Unix epoch.
 */
class SqliteStore : public domain::Store {
public:
    /**
     * @brief Opens (or creates) the database and verifies it.
     * @throws domain::StoreCorruptedError when the file cannot be opened, fails
     *         the integrity check, or the schema cannot be created.
     */
    explicit SqliteStore(const std::string& dbPath,
                         std::shared_ptr<domain::Clock> clock = std::make_shared<domain::SystemClock>());
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    void runAtomically(const std::function<void()>& work) override;

    std::int64_t saveNote(const domain::Note& note) override;
    std::vector<domain::Note> listNotes() override;
    bool deleteNote(std::int64_t id) override;

    std::int64_t createList(const std::string& name) override;
    std::int64_t addListItem(std::int64_t listId, const std::string& text) override;
    std::optional<domain::NoteList> findList(std::int64_t id) override;
    std::optional<domain::NoteList> findListByName(const std::string& name) override;
    std::vector<domain::NoteList> listLists() override;
    bool setItemDone(std::int64_t itemId, bool done) override;
    bool deleteList(std::int64_t id) override;

    std::int64_t createAppointment(const domain::Appointment& appointment) override;
    std::vector<domain::Appointment> listAppointments(std::optional<domain::Instant> from = std::nullopt,
                                                      std::optional<domain::Instant> to = std::nullopt) override;
    bool rescheduleAppointment(std::int64_t id, domain::Instant startAt) override;
    bool deleteAppointment(std::int64_t id) override;
    std::vector<domain::Appointment> claimDueAppointments(domain::Instant now) override;

    std::int64_t createReminder(const domain::Reminder& reminder) override;
    std::vector<domain::Reminder> listReminders(bool includeNotified = false) override;
    bool rescheduleReminder(std::int64_t id, domain::Instant fireAt) override;
    bool deleteReminder(std::int64_t id) override;
    std::vector<domain::Reminder> claimDueReminders(domain::Instant now) override;

    std::optional<std::string> getSetting(const std::string& key) override;
    void saveSetting(const std::string& key, const std::string& value) override;

    const std::string& path() const { return m_path; }

private:
    void exec(const char* sql);
    void initSchema();
    void checkIntegrity();
    void loadItems(domain::NoteList& list);
    std::optional<domain::NoteList> findListWhere(const char* sql, const std::string& arg);
    std::int64_t nowSeconds() const;

    std::string m_path;
    std::shared_ptr<domain::Clock> m_clock;
    sqlite3* m_db = nullptr;
    std::recursive_mutex m_mutex;
    int m_txDepth = 0;
};

} // namespace writher::infrastructure
