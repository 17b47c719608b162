/**
 * @file ReminderScheduler.hpp
 * @brief Periodic sweep that notifies due reminders and appointments exactly once.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include "application/MessageCatalog.hpp"
#include "domain/Clock.hpp"
#include "domain/NotificationSink.hpp"
#include "domain/Store.hpp"

namespace writher::application {

/**
 * @struct SweepReport
 * @brief What one sweep claimed and how delivery went.
 */
struct SweepReport {
    std::size_t reminders = 0;
    std::size_t appointments = 0;
    std::size_t deliveryFailures = 0; ///< Claimed entities whose notification was rejected twice.
};

/**
 * @class ReminderScheduler
 * @brief Background thread claiming due entities from the store and firing them.
 *
 * An entity is claimed (marked notified) before its notification is shown,
 * so a crash between the two loses at most that one notification and never
 * shows it twice.
 */
class ReminderScheduler {
public:
    ReminderScheduler(domain::Store& store,
                      std::shared_ptr<domain::NotificationSink> sink,
                      std::shared_ptr<domain::Clock> clock,
                      const MessageCatalog& messages,
                      std::chrono::seconds interval = std::chrono::seconds(30));
    ~ReminderScheduler();

    ReminderScheduler(const ReminderScheduler&) = delete;
    ReminderScheduler& operator=(const ReminderScheduler&) = delete;

    /** @brief Starts the worker. The first sweep runs immediately. */
    void start();

    /** @brief Stops the worker and waits for the sweep in progress. */
    void stop();

    /** @brief Runs one sweep on the calling thread. */
    SweepReport sweep();

private:
    void workerLoop();
    bool deliver(const std::string& title, const std::string& body);
    std::string appointmentBody(const domain::Appointment& appointment, domain::Instant now) const;

    domain::Store& m_store;
    std::shared_ptr<domain::NotificationSink> m_sink;
    std::shared_ptr<domain::Clock> m_clock;
    const MessageCatalog& m_messages;
    std::chrono::seconds m_interval;

    std::thread m_worker;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};
};

} // namespace writher::application
