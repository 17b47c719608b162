/**
 * @file Store.hpp
 * @brief Interface for the persistent store of notes, lists, appointments and reminders.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/Agenda.hpp"
#include "domain/Note.hpp"

namespace writher::domain {

/**
 * @class Store
 * @brief Single source of truth for every persisted entity.
 *
 * Every write is transactional. Writes from different threads are
 * serialized. Mutating calls throw WritherError(PersistenceError) on failure.
 */
class Store {
public:
    virtual ~Store() = default;

    /**
     * @brief Runs `work` inside one write transaction.
     *
     * Store calls made by `work` on the same thread join the transaction. If
     * `work` throws, everything it wrote is rolled back and the exception is
     * rethrown unchanged.
     */
    virtual void runAtomically(const std::function<void()>& work) = 0;

    // Notes
    virtual std::int64_t saveNote(const Note& note) = 0;
    virtual std::vector<Note> listNotes() = 0;
    virtual bool deleteNote(std::int64_t id) = 0;

    // Lists
    /** @throws WritherError(PersistenceError) when an active list already has that name. */
    virtual std::int64_t createList(const std::string& name) = 0;
    virtual std::int64_t addListItem(std::int64_t listId, const std::string& text) = 0;
    virtual std::optional<NoteList> findList(std::int64_t id) = 0;

    /**
     * @brief Finds a list by name.
     *
     * Exact case-insensitive match first, then the most recently created
     * list whose name contains `name`.
     */
    virtual std::optional<NoteList> findListByName(const std::string& name) = 0;
    virtual std::vector<NoteList> listLists() = 0;
    virtual bool setItemDone(std::int64_t itemId, bool done) = 0;
    /** @brief Deletes the list and all of its items. */
    virtual bool deleteList(std::int64_t id) = 0;

    // Appointments
    virtual std::int64_t createAppointment(const Appointment& appointment) = 0;
    virtual std::vector<Appointment> listAppointments(std::optional<Instant> from = std::nullopt,
                                                      std::optional<Instant> to = std::nullopt) = 0;
    /** @brief Moves the start time. Never touches the notified flag. */
    virtual bool rescheduleAppointment(std::int64_t id, Instant startAt) = 0;
    virtual bool deleteAppointment(std::int64_t id) = 0;

    /**
     * @brief Selects appointments whose reminder is due and marks them notified.
     *
     * Selection and update happen in one write transaction; an appointment is
     * returned by at most one call over the lifetime of the store.
     */
    virtual std::vector<Appointment> claimDueAppointments(Instant now) = 0;

    // Reminders
    virtual std::int64_t createReminder(const Reminder& reminder) = 0;
    virtual std::vector<Reminder> listReminders(bool includeNotified = false) = 0;
    /** @brief Moves the fire time. Never touches the notified flag. */
    virtual bool rescheduleReminder(std::int64_t id, Instant fireAt) = 0;
    virtual bool deleteReminder(std::int64_t id) = 0;

    /** @brief Same contract as claimDueAppointments, for reminders with fire_at <= now. */
    virtual std::vector<Reminder> claimDueReminders(Instant now) = 0;

    // Settings
    virtual std::optional<std::string> getSetting(const std::string& key) = 0;
    virtual void saveSetting(const std::string& key, const std::string& value) = 0;
};

} // namespace writher::domain
