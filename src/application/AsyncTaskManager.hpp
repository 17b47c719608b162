/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background pipeline work.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <iterator>

namespace writher::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    Transcription,
    ActionResolution,
    Notification
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Runs long-latency work off the coordination loop and tracks it until completion.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;

    /** @brief Joins every task thread; nothing a task references may be destroyed before this returns. */
    ~AsyncTaskManager() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            workers.swap(m_workers);
        }
        if (!workers.empty()) {
            std::cout << "[AsyncTaskManager] Joining " << workers.size() << " task thread(s)." << std::endl;
        }
        for (auto& worker : workers) {
            worker.thread.join();
        }
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /** @brief Submits a new task to be executed in the background. */
    template<typename F>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        ReapFinishedWorkers();

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);
        std::thread thread([this, status](auto userFunc) {
            try {
                userFunc(status);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
                std::cerr << "[AsyncTaskManager] Task '" << status->description << "' failed: " << e.what() << std::endl;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f));
        m_workers.push_back(Worker{status, std::move(thread)});

        return status;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /**
     * @brief Blocks until every submitted task has finished or the timeout elapsed.
     * @return True if no task is running anymore.
     */
    bool waitForIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        return m_idleCv.wait_for(lock, timeout, [this] { return m_activeTasks.empty(); });
    }

private:
    struct Worker {
        std::shared_ptr<TaskStatus> status;
        std::thread thread;
    };

    /** @brief Joins the threads of completed tasks. Never called with the mutex held. */
    void ReapFinishedWorkers() {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_workers.begin(), m_workers.end(),
                [](const Worker& w) { return !w.status->isCompleted.load(); });
            std::move(split, m_workers.end(), std::back_inserter(finished));
            m_workers.erase(split, m_workers.end());
        }
        for (auto& worker : finished) {
            worker.thread.join();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        if (m_activeTasks.empty()) {
            m_idleCv.notify_all();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
    std::condition_variable m_idleCv;
};

} // namespace writher::application
