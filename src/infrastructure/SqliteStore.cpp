/**
 * @file SqliteStore.cpp
 * @brief Implementation of SqliteStore.
 */

#include "infrastructure/SqliteStore.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <iostream>
#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"

namespace writher::infrastructure {

using domain::FailureKind;
using domain::WritherError;

namespace {

constexpr int kBusyTimeoutMs = 5000;

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS notes (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    title      TEXT NOT NULL DEFAULT '',
    text       TEXT NOT NULL,
    category   TEXT NOT NULL DEFAULT 'general',
    created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS lists (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    name       TEXT NOT NULL COLLATE NOCASE UNIQUE,
    created_at INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS list_items (
    id       INTEGER PRIMARY KEY AUTOINCREMENT,
    list_id  INTEGER NOT NULL REFERENCES lists(id) ON DELETE CASCADE,
    text     TEXT NOT NULL,
    done     INTEGER NOT NULL DEFAULT 0,
    position INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_list_items_list ON list_items(list_id, position);
CREATE TABLE IF NOT EXISTS appointments (
    id                  INTEGER PRIMARY KEY AUTOINCREMENT,
    title               TEXT NOT NULL,
    description         TEXT NOT NULL DEFAULT '',
    start_at            INTEGER NOT NULL,
    remind_lead_minutes INTEGER NOT NULL DEFAULT 15,
    notified            INTEGER NOT NULL DEFAULT 0,
    created_at          INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_appointments_due ON appointments(notified, start_at);
CREATE TABLE IF NOT EXISTS reminders (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    text       TEXT NOT NULL,
    fire_at    INTEGER NOT NULL,
    notified   INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_reminders_due ON reminders(notified, fire_at);
CREATE TABLE IF NOT EXISTS settings (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TRIGGER IF NOT EXISTS appointments_notified_monotonic
BEFORE UPDATE OF notified ON appointments
WHEN OLD.notified = 1 AND NEW.notified = 0
BEGIN
    SELECT RAISE(ABORT, 'notified cannot be reset');
END;
CREATE TRIGGER IF NOT EXISTS reminders_notified_monotonic
BEFORE UPDATE OF notified ON reminders
WHEN OLD.notified = 1 AND NEW.notified = 0
BEGIN
    SELECT RAISE(ABORT, 'notified cannot be reset');
END;
)SQL";

WritherError Failure(sqlite3* db, const std::string& what) {
    return WritherError(FailureKind::PersistenceError, what + ": " + sqlite3_errmsg(db));
}

/** @brief Prepared statement, finalized on scope exit. */
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw Failure(db, "prepare");
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, std::int64_t value) {
        sqlite3_bind_int64(m_stmt, index, value);
        return *this;
    }
    Statement& bind(int index, int value) {
        sqlite3_bind_int(m_stmt, index, value);
        return *this;
    }
    Statement& bind(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }

    /** @return True while a row is available. */
    bool step() {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw Failure(m_db, "step");
    }

    std::int64_t int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
    std::string text(int col) const {
        const auto* value = sqlite3_column_text(m_stmt, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

domain::Appointment ReadAppointment(const Statement& st) {
    domain::Appointment a;
    a.id = st.int64(0);
    a.title = st.text(1);
    a.description = st.text(2);
    a.startAt = domain::FromEpochSeconds(st.int64(3));
    a.remindLeadMinutes = static_cast<int>(st.int64(4));
    a.notified = st.int64(5) != 0;
    return a;
}

domain::Reminder ReadReminder(const Statement& st) {
    domain::Reminder r;
    r.id = st.int64(0);
    r.text = st.text(1);
    r.fireAt = domain::FromEpochSeconds(st.int64(2));
    r.notified = st.int64(3) != 0;
    r.createdAt = domain::FromEpochSeconds(st.int64(4));
    return r;
}

} // namespace

SqliteStore::SqliteStore(const std::string& dbPath, std::shared_ptr<domain::Clock> clock)
    : m_path(dbPath), m_clock(std::move(clock)) {
    const int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        sqlite3_close(m_db);
        m_db = nullptr;
        throw domain::StoreCorruptedError("Cannot open database " + dbPath + ": " + message);
    }

    try {
        sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA foreign_keys=ON;");
        checkIntegrity();
        initSchema();
    } catch (const WritherError& e) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw domain::StoreCorruptedError("Database " + dbPath + " is unusable: " + e.what());
    }
    std::cout << "[SqliteStore] Opened " << dbPath << std::endl;
}

SqliteStore::~SqliteStore() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void SqliteStore::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(m_db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : sqlite3_errmsg(m_db);
        sqlite3_free(error);
        throw WritherError(FailureKind::PersistenceError, message);
    }
}

void SqliteStore::checkIntegrity() {
    Statement st(m_db, "PRAGMA quick_check;");
    if (!st.step() || st.text(0) != "ok") {
        throw WritherError(FailureKind::PersistenceError, "integrity check failed");
    }
}

void SqliteStore::initSchema() {
    exec(kSchema);
}

std::int64_t SqliteStore::nowSeconds() const {
    return domain::ToEpochSeconds(m_clock->now());
}

void SqliteStore::runAtomically(const std::function<void()>& work) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    const int depth = m_txDepth;
    const std::string savepoint = "sp_" + std::to_string(depth);
    if (depth == 0) {
        exec("BEGIN IMMEDIATE;");
    } else {
        exec(("SAVEPOINT " + savepoint + ";").c_str());
    }
    ++m_txDepth;

    try {
        work();
    } catch (...) {
        --m_txDepth;
        try {
            if (depth == 0) {
                exec("ROLLBACK;");
            } else {
                exec(("ROLLBACK TO " + savepoint + "; RELEASE " + savepoint + ";").c_str());
            }
        } catch (const WritherError& e) {
            std::cerr << "[SqliteStore] Rollback failed: " << e.what() << std::endl;
        }
        throw;
    }

    --m_txDepth;
    if (depth == 0) {
        try {
            exec("COMMIT;");
        } catch (const WritherError&) {
            exec("ROLLBACK;");
            throw;
        }
    } else {
        exec(("RELEASE " + savepoint + ";").c_str());
    }
}

// Notes

std::int64_t SqliteStore::saveNote(const domain::Note& note) {
    std::int64_t id = 0;
    runAtomically([&]() {
        Statement st(m_db, "INSERT INTO notes (title, text, category, created_at) VALUES (?1, ?2, ?3, ?4);");
        const std::int64_t created = note.createdAt == domain::Instant{} ? nowSeconds()
                                                                         : domain::ToEpochSeconds(note.createdAt);
        st.bind(1, note.title).bind(2, note.text).bind(3, note.category.empty() ? "general" : note.category)
          .bind(4, created);
        st.step();
        id = sqlite3_last_insert_rowid(m_db);
    });
    return id;
}

std::vector<domain::Note> SqliteStore::listNotes() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement st(m_db, "SELECT id, title, text, category, created_at FROM notes ORDER BY created_at DESC, id DESC;");
    std::vector<domain::Note> notes;
    while (st.step()) {
        domain::Note n;
        n.id = st.int64(0);
        n.title = st.text(1);
        n.text = st.text(2);
        n.category = st.text(3);
        n.createdAt = domain::FromEpochSeconds(st.int64(4));
        notes.push_back(std::move(n));
    }
    return notes;
}

bool SqliteStore::deleteNote(std::int64_t id) {
    bool deleted = false;
    runAtomically([&]() {
        Statement st(m_db, "DELETE FROM notes WHERE id = ?1;");
        st.bind(1, id);
        st.step();
        deleted = sqlite3_changes(m_db) > 0;
    });
    return deleted;
}

// Lists

std::int64_t SqliteStore::createList(const std::string& name) {
    std::int64_t id = 0;
    runAtomically([&]() {
        Statement st(m_db, "INSERT INTO lists (name, created_at) VALUES (?1, ?2);");
        st.bind(1, name).bind(2, nowSeconds());
        try {
            st.step();
        } catch (const WritherError&) {
            if ((sqlite3_extended_errcode(m_db) & 0xff) == SQLITE_CONSTRAINT) {
                throw WritherError(FailureKind::PersistenceError, "A list named '" + name + "' already exists");
            }
            throw;
        }
        id = sqlite3_last_insert_rowid(m_db);
    });
    return id;
}

std::int64_t SqliteStore::addListItem(std::int64_t listId, const std::string& text) {
    std::int64_t id = 0;
    runAtomically([&]() {
        Statement st(m_db,
            "INSERT INTO list_items (list_id, text, done, position) "
            "VALUES (?1, ?2, 0, (SELECT COALESCE(MAX(position), -1) + 1 FROM list_items WHERE list_id = ?1));");
        st.bind(1, listId).bind(2, text);
        try {
            st.step();
        } catch (const WritherError&) {
            if ((sqlite3_extended_errcode(m_db) & 0xff) == SQLITE_CONSTRAINT) {
                throw WritherError(FailureKind::PersistenceError, "List #" + std::to_string(listId) + " does not exist");
            }
            throw;
        }
        id = sqlite3_last_insert_rowid(m_db);
    });
    return id;
}

void SqliteStore::loadItems(domain::NoteList& list) {
    Statement st(m_db, "SELECT id, list_id, text, done FROM list_items WHERE list_id = ?1 ORDER BY position, id;");
    st.bind(1, list.id);
    while (st.step()) {
        domain::ListItem item;
        item.id = st.int64(0);
        item.listId = st.int64(1);
        item.text = st.text(2);
        item.done = st.int64(3) != 0;
        list.items.push_back(std::move(item));
    }
}

std::optional<domain::NoteList> SqliteStore::findList(std::int64_t id) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement st(m_db, "SELECT id, name, created_at FROM lists WHERE id = ?1;");
    st.bind(1, id);
    if (!st.step()) {
        return std::nullopt;
    }
    domain::NoteList list;
    list.id = st.int64(0);
    list.name = st.text(1);
    list.createdAt = domain::FromEpochSeconds(st.int64(2));
    loadItems(list);
    return list;
}

std::optional<domain::NoteList> SqliteStore::findListWhere(const char* sql, const std::string& arg) {
    std::int64_t id = 0;
    {
        Statement st(m_db, sql);
        st.bind(1, arg);
        if (!st.step()) {
            return std::nullopt;
        }
        id = st.int64(0);
    }
    return findList(id);
}

std::optional<domain::NoteList> SqliteStore::findListByName(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (auto exact = findListWhere("SELECT id FROM lists WHERE name = ?1 COLLATE NOCASE;", name)) {
        return exact;
    }
    return findListWhere(
        "SELECT id FROM lists WHERE instr(lower(name), lower(?1)) > 0 ORDER BY created_at DESC, id DESC LIMIT 1;",
        name);
}

std::vector<domain::NoteList> SqliteStore::listLists() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<domain::NoteList> lists;
    {
        Statement st(m_db, "SELECT id, name, created_at FROM lists ORDER BY created_at DESC, id DESC;");
        while (st.step()) {
            domain::NoteList list;
            list.id = st.int64(0);
            list.name = st.text(1);
            list.createdAt = domain::FromEpochSeconds(st.int64(2));
            lists.push_back(std::move(list));
        }
    }
    for (auto& list : lists) {
        loadItems(list);
    }
    return lists;
}

bool SqliteStore::setItemDone(std::int64_t itemId, bool done) {
    bool updated = false;
    runAtomically([&]() {
        Statement st(m_db, "UPDATE list_items SET done = ?1 WHERE id = ?2;");
        st.bind(1, done ? 1 : 0).bind(2, itemId);
        st.step();
        updated = sqlite3_changes(m_db) > 0;
    });
    return updated;
}

bool SqliteStore::deleteList(std::int64_t id) {
    bool deleted = false;
    runAtomically([&]() {
        Statement st(m_db, "DELETE FROM lists WHERE id = ?1;");
        st.bind(1, id);
        st.step();
        deleted = sqlite3_changes(m_db) > 0;
    });
    return deleted;
}

// Appointments

std::int64_t SqliteStore::createAppointment(const domain::Appointment& appointment) {
    std::int64_t id = 0;
    runAtomically([&]() {
        Statement st(m_db,
            "INSERT INTO appointments (title, description, start_at, remind_lead_minutes, notified, created_at) "
            "VALUES (?1, ?2, ?3, ?4, 0, ?5);");
        st.bind(1, appointment.title)
          .bind(2, appointment.description)
          .bind(3, domain::ToEpochSeconds(appointment.startAt))
          .bind(4, appointment.remindLeadMinutes)
          .bind(5, nowSeconds());
        st.step();
        id = sqlite3_last_insert_rowid(m_db);
    });
    return id;
}

std::vector<domain::Appointment> SqliteStore::listAppointments(std::optional<domain::Instant> from,
                                                               std::optional<domain::Instant> to) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement st(m_db,
        "SELECT id, title, description, start_at, remind_lead_minutes, notified FROM appointments "
        "WHERE start_at >= ?1 AND start_at <= ?2 ORDER BY start_at, id;");
    st.bind(1, from ? domain::ToEpochSeconds(*from) : INT64_MIN)
      .bind(2, to ? domain::ToEpochSeconds(*to) : INT64_MAX);
    std::vector<domain::Appointment> result;
    while (st.step()) {
        result.push_back(ReadAppointment(st));
    }
    return result;
}

bool SqliteStore::rescheduleAppointment(std::int64_t id, domain::Instant startAt) {
    bool updated = false;
    runAtomically([&]() {
        Statement st(m_db, "UPDATE appointments SET start_at = ?1 WHERE id = ?2;");
        st.bind(1, domain::ToEpochSeconds(startAt)).bind(2, id);
        st.step();
        updated = sqlite3_changes(m_db) > 0;
    });
    return updated;
}

bool SqliteStore::deleteAppointment(std::int64_t id) {
    bool deleted = false;
    runAtomically([&]() {
        Statement st(m_db, "DELETE FROM appointments WHERE id = ?1;");
        st.bind(1, id);
        st.step();
        deleted = sqlite3_changes(m_db) > 0;
    });
    return deleted;
}

std::vector<domain::Appointment> SqliteStore::claimDueAppointments(domain::Instant now) {
    std::vector<domain::Appointment> claimed;
    runAtomically([&]() {
        claimed.clear();
        std::vector<domain::Appointment> due;
        {
            Statement select(m_db,
                "SELECT id, title, description, start_at, remind_lead_minutes, notified FROM appointments "
                "WHERE notified = 0 AND start_at - remind_lead_minutes * 60 <= ?1 ORDER BY start_at, id;");
            select.bind(1, domain::ToEpochSeconds(now));
            while (select.step()) {
                due.push_back(ReadAppointment(select));
            }
        }
        for (auto& appointment : due) {
            Statement mark(m_db, "UPDATE appointments SET notified = 1 WHERE id = ?1 AND notified = 0;");
            mark.bind(1, appointment.id);
            mark.step();
            if (sqlite3_changes(m_db) == 1) {
                appointment.notified = true;
                claimed.push_back(appointment);
            }
        }
    });
    return claimed;
}

// Reminders

std::int64_t SqliteStore::createReminder(const domain::Reminder& reminder) {
    std::int64_t id = 0;
    runAtomically([&]() {
        Statement st(m_db, "INSERT INTO reminders (text, fire_at, notified, created_at) VALUES (?1, ?2, 0, ?3);");
        const std::int64_t created = reminder.createdAt == domain::Instant{} ? nowSeconds()
                                                                             : domain::ToEpochSeconds(reminder.createdAt);
        st.bind(1, reminder.text).bind(2, domain::ToEpochSeconds(reminder.fireAt)).bind(3, created);
        st.step();
        id = sqlite3_last_insert_rowid(m_db);
    });
    return id;
}

std::vector<domain::Reminder> SqliteStore::listReminders(bool includeNotified) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement st(m_db,
        "SELECT id, text, fire_at, notified, created_at FROM reminders "
        "WHERE notified = 0 OR ?1 = 1 ORDER BY fire_at, id;");
    st.bind(1, includeNotified ? 1 : 0);
    std::vector<domain::Reminder> result;
    while (st.step()) {
        result.push_back(ReadReminder(st));
    }
    return result;
}

bool SqliteStore::rescheduleReminder(std::int64_t id, domain::Instant fireAt) {
    bool updated = false;
    runAtomically([&]() {
        Statement st(m_db, "UPDATE reminders SET fire_at = ?1 WHERE id = ?2;");
        st.bind(1, domain::ToEpochSeconds(fireAt)).bind(2, id);
        st.step();
        updated = sqlite3_changes(m_db) > 0;
    });
    return updated;
}

bool SqliteStore::deleteReminder(std::int64_t id) {
    bool deleted = false;
    runAtomically([&]() {
        Statement st(m_db, "DELETE FROM reminders WHERE id = ?1;");
        st.bind(1, id);
        st.step();
        deleted = sqlite3_changes(m_db) > 0;
    });
    return deleted;
}

std::vector<domain::Reminder> SqliteStore::claimDueReminders(domain::Instant now) {
    std::vector<domain::Reminder> claimed;
    runAtomically([&]() {
        claimed.clear();
        std::vector<domain::Reminder> due;
        {
            Statement select(m_db,
                "SELECT id, text, fire_at, notified, created_at FROM reminders "
                "WHERE notified = 0 AND fire_at <= ?1 ORDER BY fire_at, id;");
            select.bind(1, domain::ToEpochSeconds(now));
            while (select.step()) {
                due.push_back(ReadReminder(select));
            }
        }
        for (auto& reminder : due) {
            Statement mark(m_db, "UPDATE reminders SET notified = 1 WHERE id = ?1 AND notified = 0;");
            mark.bind(1, reminder.id);
            mark.step();
            if (sqlite3_changes(m_db) == 1) {
                reminder.notified = true;
                claimed.push_back(reminder);
            }
        }
    });
    return claimed;
}

// Settings

std::optional<std::string> SqliteStore::getSetting(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    Statement st(m_db, "SELECT value FROM settings WHERE key = ?1;");
    st.bind(1, key);
    if (!st.step()) {
        return std::nullopt;
    }
    return st.text(0);
}

void SqliteStore::saveSetting(const std::string& key, const std::string& value) {
    runAtomically([&]() {
        Statement st(m_db,
            "INSERT INTO settings (key, value) VALUES (?1, ?2) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
        st.bind(1, key).bind(2, value);
        st.step();
    });
}

} // namespace writher::infrastructure
