/**
 * @file ReminderScheduler.cpp
 * @brief Implementation of ReminderScheduler.
 */

#include "application/ReminderScheduler.hpp"

#include <iostream>
#include "domain/Failure.hpp"

namespace writher::application {

ReminderScheduler::ReminderScheduler(domain::Store& store,
                                     std::shared_ptr<domain::NotificationSink> sink,
                                     std::shared_ptr<domain::Clock> clock,
                                     const MessageCatalog& messages,
                                     std::chrono::seconds interval)
    : m_store(store)
    , m_sink(std::move(sink))
    , m_clock(std::move(clock))
    , m_messages(messages)
    , m_interval(interval) {}

ReminderScheduler::~ReminderScheduler() {
    stop();
}

void ReminderScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) return;
        m_running = true;
    }
    m_worker = std::thread(&ReminderScheduler::workerLoop, this);
    std::cout << "[ReminderScheduler] Started, sweeping every " << m_interval.count() << " s" << std::endl;
}

void ReminderScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
    std::cout << "[ReminderScheduler] Stopped" << std::endl;
}

void ReminderScheduler::workerLoop() {
    while (true) {
        try {
            sweep();
        } catch (const domain::WritherError& e) {
            std::cerr << "[ReminderScheduler] Sweep failed: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ReminderScheduler] Sweep aborted: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_cv.wait_for(lock, m_interval, [this] { return !m_running; })) {
            return;
        }
    }
}

SweepReport ReminderScheduler::sweep() {
    SweepReport report;
    const domain::Instant now = m_clock->now();

    const auto reminders = m_store.claimDueReminders(now);
    for (const auto& reminder : reminders) {
        ++report.reminders;
        if (!deliver(m_messages.get("reminder_toast_title"), reminder.text)) {
            ++report.deliveryFailures;
        }
    }

    const auto appointments = m_store.claimDueAppointments(now);
    for (const auto& appointment : appointments) {
        ++report.appointments;
        if (!deliver(m_messages.get("appointment_toast_title"), appointmentBody(appointment, now))) {
            ++report.deliveryFailures;
        }
    }

    if (report.reminders > 0 || report.appointments > 0) {
        std::cout << "[ReminderScheduler] Fired " << report.reminders << " reminder(s) and "
                  << report.appointments << " appointment(s)" << std::endl;
    }
    return report;
}

bool ReminderScheduler::deliver(const std::string& title, const std::string& body) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (m_sink->fire(title, body)) {
            return true;
        }
        std::cerr << "[ReminderScheduler] Notification rejected (attempt " << attempt + 1 << "): " << body << std::endl;
    }
    return false;
}

std::string ReminderScheduler::appointmentBody(const domain::Appointment& appointment, domain::Instant now) const {
    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(appointment.startAt - now).count();
    if (remaining <= 0) {
        return m_messages.get("appointment_toast_now", {{"title", appointment.title}});
    }
    const long long minutes = (remaining + 59) / 60;
    return m_messages.get("appointment_toast_body",
                          {{"title", appointment.title}, {"minutes", std::to_string(minutes)}});
}

} // namespace writher::application
