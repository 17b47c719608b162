/**
 * @file Agenda.hpp
 * @brief Notifiable entities: appointments and reminders.
 *
 * Both carry a fire time and a one-shot notified flag that only ever goes
 * from false to true.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "domain/Clock.hpp"

namespace writher::domain {

struct Appointment {
    std::int64_t id = 0;
    std::string title;
    std::string description;
    Instant startAt{};
    int remindLeadMinutes = 15;
    bool notified = false;

    /** @brief Instant at which the appointment notification becomes due. */
    Instant dueAt() const { return startAt - std::chrono::minutes(remindLeadMinutes); }
};

struct Reminder {
    std::int64_t id = 0;
    std::string text;
    Instant fireAt{};
    bool notified = false;
    Instant createdAt{};
};

} // namespace writher::domain
