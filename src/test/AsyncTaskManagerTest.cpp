#include <cassert>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "application/AsyncTaskManager.hpp"
#include "application/BackgroundNotifier.hpp"
#include "fakes/TestDoubles.hpp"

using namespace writher;
using application::AsyncTaskManager;
using application::BackgroundNotifier;
using application::TaskStatus;
using application::TaskType;

namespace {

/** @brief Notification sink that blocks until opened, like a stuck notification daemon. */
class GatedNotifier : public domain::NotificationSink {
public:
    bool fire(const std::string& title, const std::string& body) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_open; });
        shown.push_back(title + "|" + body);
        return accept;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    std::vector<std::string> snapshot() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return shown;
    }

    bool accept = true;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
    std::vector<std::string> shown;
};

void testDestructorJoinsRunningTasks() {
    std::atomic<bool> finished{false};
    auto started = std::chrono::steady_clock::now();
    {
        AsyncTaskManager tasks;
        tasks.SubmitTask(TaskType::ActionResolution, "slow backend call", [&finished](std::shared_ptr<TaskStatus>) {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            finished = true;
        });
        // Leaves scope while the task is still sleeping.
    }
    assert(finished && "Destruction waits for the task body to return.");
    assert(std::chrono::steady_clock::now() - started >= std::chrono::milliseconds(300));
    std::cout << "[PASS] Destroying the manager joins running tasks." << std::endl;
}

void testFailedTaskIsReportedAndReaped() {
    AsyncTaskManager tasks;
    auto failing = tasks.SubmitTask(TaskType::Transcription, "broken model", [](std::shared_ptr<TaskStatus>) {
        throw std::runtime_error("model file missing");
    });
    assert(tasks.waitForIdle(std::chrono::seconds(5)));
    assert(failing->isCompleted && failing->failed);
    assert(failing->errorMessage == "model file missing");

    // Finished threads are joined on the next submission.
    std::atomic<int> runs{0};
    for (int i = 0; i < 20; ++i) {
        tasks.SubmitTask(TaskType::Transcription, "short", [&runs](std::shared_ptr<TaskStatus>) { ++runs; });
    }
    assert(tasks.waitForIdle(std::chrono::seconds(5)));
    assert(runs == 20);
    assert(tasks.GetActiveTasks().empty());
    std::cout << "[PASS] Task failures are recorded and finished threads reaped." << std::endl;
}

void testNotificationDoesNotBlockCaller() {
    auto sink = std::make_shared<GatedNotifier>();
    AsyncTaskManager tasks;
    BackgroundNotifier notifier(sink, tasks);

    const auto before = std::chrono::steady_clock::now();
    assert(notifier.fire("Writher", "Reminder saved"));
    assert(std::chrono::steady_clock::now() - before < std::chrono::milliseconds(200) &&
           "fire() returns while the daemon is stuck.");
    assert(sink->snapshot().empty());

    sink->open();
    assert(tasks.waitForIdle(std::chrono::seconds(5)));
    auto shown = sink->snapshot();
    assert(shown.size() == 1 && shown[0] == "Writher|Reminder saved");
    assert(notifier.rejected() == 0);
    std::cout << "[PASS] Toasts are delivered off the calling thread." << std::endl;
}

void testRejectedNotificationIsCounted() {
    auto sink = std::make_shared<test::FakeNotifier>();
    sink->rejectNext = 1;
    AsyncTaskManager tasks;
    BackgroundNotifier notifier(sink, tasks);

    notifier.fire("Writher", "first");
    assert(tasks.waitForIdle(std::chrono::seconds(5)));
    notifier.fire("Writher", "second");
    assert(tasks.waitForIdle(std::chrono::seconds(5)));

    assert(notifier.rejected() == 1);
    auto shown = sink->snapshot();
    assert(shown.size() == 1 && shown[0] == "Writher|second");
    std::cout << "[PASS] Rejected toasts are counted, later ones still delivered." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting AsyncTaskManager Test..." << std::endl;

    testDestructorJoinsRunningTasks();
    testFailedTaskIsReportedAndReaped();
    testNotificationDoesNotBlockCaller();
    testRejectedNotificationIsCounted();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
