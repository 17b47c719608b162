#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <sqlite3.h>

#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"
#include "fakes/TestDoubles.hpp"
#include "infrastructure/SqliteStore.hpp"

using namespace writher;
using domain::FailureKind;
using domain::WritherError;
using infrastructure::SqliteStore;
using std::chrono::minutes;

namespace {

void testListRoundTrip() {
    test::TempDatabase db("list_round_trip");
    auto clock = std::make_shared<test::ManualClock>();
    {
        SqliteStore store(db.path(), clock);
        const auto id = store.createList("Groceries");
        store.addListItem(id, "eggs");
        store.addListItem(id, "flour");
    }

    // Reopen: data must survive the restart.
    SqliteStore store(db.path(), clock);
    auto list = store.findListByName("groceries");
    assert(list && "Lookup is case-insensitive.");
    assert(list->name == "Groceries");
    assert(list->items.size() == 2);
    assert(list->items[0].text == "eggs" && list->items[1].text == "flour");
    assert(!list->items[0].done && !list->items[1].done && "Items start not done.");

    assert(store.setItemDone(list->items[1].id, true));
    auto reloaded = store.findList(list->id);
    assert(reloaded && reloaded->items[1].done);
    std::cout << "[PASS] List round trip with items in insertion order." << std::endl;
}

void testDuplicateListName() {
    test::TempDatabase db("duplicate_list");
    SqliteStore store(db.path(), std::make_shared<test::ManualClock>());
    store.createList("Todo");
    try {
        store.createList("TODO");
        assert(false && "Expected PersistenceError.");
    } catch (const WritherError& e) {
        assert(e.kind() == FailureKind::PersistenceError);
    }
    assert(store.listLists().size() == 1);
    std::cout << "[PASS] Duplicate list name rejected." << std::endl;
}

void testFindListBySubstring() {
    test::TempDatabase db("list_substring");
    auto clock = std::make_shared<test::ManualClock>();
    SqliteStore store(db.path(), clock);
    store.createList("Shopping weekend");
    clock->advance(minutes(1));
    const auto newer = store.createList("Shopping office");
    clock->advance(minutes(1));
    const auto exact = store.createList("Shop");

    auto byExact = store.findListByName("SHOP");
    assert(byExact && byExact->id == exact);
    auto bySubstring = store.findListByName("shopping");
    assert(bySubstring && bySubstring->id == newer && "Most recent partial match wins.");
    assert(!store.findListByName("hardware"));
    std::cout << "[PASS] List lookup: exact match first, then most recent substring." << std::endl;
}

void testCascadeDelete() {
    test::TempDatabase db("cascade");
    SqliteStore store(db.path(), std::make_shared<test::ManualClock>());
    const auto id = store.createList("Packing");
    store.addListItem(id, "socks");
    store.addListItem(id, "charger");
    assert(store.deleteList(id));
    assert(!store.findList(id));

    sqlite3* raw = nullptr;
    assert(sqlite3_open(db.path().c_str(), &raw) == SQLITE_OK);
    sqlite3_stmt* st = nullptr;
    assert(sqlite3_prepare_v2(raw, "SELECT COUNT(*) FROM list_items;", -1, &st, nullptr) == SQLITE_OK);
    assert(sqlite3_step(st) == SQLITE_ROW);
    assert(sqlite3_column_int(st, 0) == 0 && "Items are deleted with their list.");
    sqlite3_finalize(st);
    sqlite3_close(raw);
    std::cout << "[PASS] Deleting a list deletes its items." << std::endl;
}

void testAtomicRollback() {
    test::TempDatabase db("atomic");
    auto clock = std::make_shared<test::ManualClock>();
    SqliteStore store(db.path(), clock);

    bool threw = false;
    try {
        store.runAtomically([&]() {
            domain::Note note;
            note.text = "first half";
            store.saveNote(note);
            domain::Reminder reminder;
            reminder.text = "second half";
            reminder.fireAt = clock->now() + minutes(10);
            store.createReminder(reminder);
            throw WritherError(FailureKind::UnrecognizedAction, "third action invalid");
        });
    } catch (const WritherError& e) {
        threw = e.kind() == FailureKind::UnrecognizedAction;
    }
    assert(threw && "The original error propagates unchanged.");
    assert(store.listNotes().empty());
    assert(store.listReminders(true).empty());

    // Nested scopes join the outer transaction.
    store.runAtomically([&]() {
        domain::Note note;
        note.text = "kept";
        store.saveNote(note);
        try {
            store.runAtomically([&]() {
                store.createList("inner");
                throw std::runtime_error("inner failure");
            });
        } catch (const std::runtime_error&) {
        }
    });
    assert(store.listNotes().size() == 1);
    assert(store.listLists().empty());
    std::cout << "[PASS] Atomic scope rolls back everything on failure." << std::endl;
}

void testClaimsAreExactlyOnce() {
    test::TempDatabase db("claims");
    auto clock = std::make_shared<test::ManualClock>();
    SqliteStore store(db.path(), clock);
    const auto now = clock->now();

    domain::Reminder due;
    due.text = "due";
    due.fireAt = now - minutes(1);
    store.createReminder(due);
    domain::Reminder later;
    later.text = "later";
    later.fireAt = now + minutes(30);
    store.createReminder(later);

    domain::Appointment meeting;
    meeting.title = "standup";
    meeting.startAt = now + minutes(10);
    meeting.remindLeadMinutes = 15;
    store.createAppointment(meeting);
    domain::Appointment lunch;
    lunch.title = "lunch";
    lunch.startAt = now + minutes(60);
    lunch.remindLeadMinutes = 15;
    store.createAppointment(lunch);

    auto reminders = store.claimDueReminders(now);
    assert(reminders.size() == 1 && reminders[0].text == "due" && reminders[0].notified);
    assert(store.claimDueReminders(now).empty());

    auto appointments = store.claimDueAppointments(now);
    assert(appointments.size() == 1 && appointments[0].title == "standup");
    assert(store.claimDueAppointments(now).empty());

    assert(store.listReminders(false).size() == 1);
    assert(store.listReminders(true).size() == 2);
    std::cout << "[PASS] Due entities claimed exactly once." << std::endl;
}

void testNotifiedIsMonotonic() {
    test::TempDatabase db("monotonic");
    auto clock = std::make_shared<test::ManualClock>();
    SqliteStore store(db.path(), clock);
    const auto now = clock->now();

    domain::Reminder reminder;
    reminder.text = "water plants";
    reminder.fireAt = now;
    const auto id = store.createReminder(reminder);
    assert(store.claimDueReminders(now).size() == 1);

    // Moving the time forward after firing must not resurrect it.
    assert(store.rescheduleReminder(id, now + minutes(5)));
    clock->advance(minutes(10));
    assert(store.claimDueReminders(clock->now()).empty());
    auto all = store.listReminders(true);
    assert(all.size() == 1 && all[0].notified);
    assert(all[0].fireAt == now + minutes(5));

    // Same for an appointment moved after its reminder went out.
    domain::Appointment meeting;
    meeting.title = "Standup";
    meeting.startAt = clock->now() + minutes(10);
    meeting.remindLeadMinutes = 15;
    const auto meetingId = store.createAppointment(meeting);
    assert(store.claimDueAppointments(clock->now()).size() == 1);
    assert(store.rescheduleAppointment(meetingId, clock->now() + minutes(120)));
    clock->advance(minutes(180));
    assert(store.claimDueAppointments(clock->now()).empty());
    auto appointments = store.listAppointments();
    assert(appointments.size() == 1 && appointments[0].notified);
    assert(appointments[0].startAt == now + minutes(10) + minutes(120));

    // A raw reset attempt is refused by the database itself.
    sqlite3* raw = nullptr;
    assert(sqlite3_open(db.path().c_str(), &raw) == SQLITE_OK);
    char* err = nullptr;
    const int rc = sqlite3_exec(raw, "UPDATE reminders SET notified = 0;", nullptr, nullptr, &err);
    assert(rc != SQLITE_OK);
    sqlite3_free(err);
    sqlite3_close(raw);
    assert(store.listReminders(true)[0].notified);
    std::cout << "[PASS] notified never goes back to false." << std::endl;
}

void testSettings() {
    test::TempDatabase db("settings");
    SqliteStore store(db.path(), std::make_shared<test::ManualClock>());
    assert(!store.getSetting("hold_to_record"));
    store.saveSetting("hold_to_record", "1");
    store.saveSetting("hold_to_record", "0");
    auto value = store.getSetting("hold_to_record");
    assert(value && *value == "0");
    std::cout << "[PASS] Settings upsert." << std::endl;
}

void testAppointmentRange() {
    test::TempDatabase db("agenda");
    auto clock = std::make_shared<test::ManualClock>();
    SqliteStore store(db.path(), clock);
    const auto now = clock->now();

    domain::Appointment past;
    past.title = "yesterday";
    past.startAt = now - std::chrono::hours(24);
    store.createAppointment(past);
    domain::Appointment upcoming;
    upcoming.title = "tomorrow";
    upcoming.description = "bring documents";
    upcoming.startAt = now + std::chrono::hours(24);
    upcoming.remindLeadMinutes = 30;
    store.createAppointment(upcoming);

    auto agenda = store.listAppointments(now);
    assert(agenda.size() == 1);
    assert(agenda[0].title == "tomorrow" && agenda[0].description == "bring documents");
    assert(agenda[0].remindLeadMinutes == 30 && !agenda[0].notified);
    assert(store.listAppointments().size() == 2);
    assert(store.deleteAppointment(agenda[0].id));
    assert(store.listAppointments(now).empty());
    std::cout << "[PASS] Agenda range query." << std::endl;
}

void testCorruptFileRefused() {
    test::TempDatabase db("corrupt");
    {
        std::FILE* f = std::fopen(db.path().c_str(), "wb");
        assert(f);
        const char garbage[] = "this is definitely not an sqlite database file, just some text padding it out";
        for (int i = 0; i < 64; ++i) {
            std::fwrite(garbage, 1, sizeof(garbage), f);
        }
        std::fclose(f);
    }
    bool refused = false;
    try {
        SqliteStore store(db.path(), std::make_shared<test::ManualClock>());
    } catch (const domain::StoreCorruptedError& e) {
        refused = true;
        std::cout << "[Test] Refused as expected: " << e.what() << std::endl;
    }
    assert(refused);
    std::cout << "[PASS] Corrupted database refused at open." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SqliteStore Test..." << std::endl;

    testListRoundTrip();
    testDuplicateListName();
    testFindListBySubstring();
    testCascadeDelete();
    testAtomicRollback();
    testClaimsAreExactlyOnce();
    testNotifiedIsMonotonic();
    testSettings();
    testAppointmentRange();
    testCorruptFileRefused();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
