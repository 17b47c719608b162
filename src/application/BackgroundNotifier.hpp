/**
 * @file BackgroundNotifier.hpp
 * @brief NotificationSink that delivers on a background task.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "domain/NotificationSink.hpp"

namespace writher::application {

/**
 * @class BackgroundNotifier
 * @brief Hands every toast to the AsyncTaskManager so a slow notification
 *        daemon never stalls the caller (the coordination loop).
 */
class BackgroundNotifier : public domain::NotificationSink {
public:
    BackgroundNotifier(std::shared_ptr<domain::NotificationSink> sink, AsyncTaskManager& tasks);

    /** @brief Queues the notification. Always returns true; delivery failures are logged. */
    bool fire(const std::string& title, const std::string& body) override;

    /** @brief Deliveries the underlying sink rejected so far. */
    int rejected() const { return m_rejected->load(); }

private:
    std::shared_ptr<domain::NotificationSink> m_sink;
    AsyncTaskManager& m_tasks;
    std::shared_ptr<std::atomic<int>> m_rejected; ///< Shared with queued tasks, which may outlive this object.
};

} // namespace writher::application
