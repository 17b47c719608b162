/**
 * @file BackgroundNotifier.cpp
 * @brief Implementation of the BackgroundNotifier class.
 */
#include "application/BackgroundNotifier.hpp"

#include <iostream>

namespace writher::application {

BackgroundNotifier::BackgroundNotifier(std::shared_ptr<domain::NotificationSink> sink, AsyncTaskManager& tasks)
    : m_sink(std::move(sink))
    , m_tasks(tasks)
    , m_rejected(std::make_shared<std::atomic<int>>(0)) {}

bool BackgroundNotifier::fire(const std::string& title, const std::string& body) {
    auto sink = m_sink;
    auto rejected = m_rejected;
    m_tasks.SubmitTask(TaskType::Notification, "notification: " + title,
        [sink, rejected, title, body](std::shared_ptr<TaskStatus>) {
            if (!sink->fire(title, body)) {
                ++*rejected;
                std::cerr << "[BackgroundNotifier] Notification not shown: " << body << std::endl;
            }
        });
    return true;
}

} // namespace writher::application
