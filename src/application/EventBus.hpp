/**
 * @file EventBus.hpp
 * @brief Single-threaded coordination loop that every component posts to.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "domain/Clock.hpp"

namespace writher::application {

/**
 * @class EventBus
 * @brief Queue of handlers executed one at a time on the loop thread.
 *
 * post() and postAfter() are thread-safe. Handlers never run concurrently
 * with each other, so state owned by the loop needs no locking. Timers are
 * measured against the injected Clock's monotonic time.
 */
class EventBus {
public:
    using Handler = std::function<void()>;
    using TimerId = std::uint64_t;

    explicit EventBus(std::shared_ptr<domain::Clock> clock);

    /** @brief Queues a handler for the next drain. */
    void post(Handler handler);

    /** @brief Queues a handler to run once `delay` has elapsed. Returns a non-zero id. */
    TimerId postAfter(std::chrono::milliseconds delay, Handler handler);

    /** @brief Cancels a pending timer. Unknown or fired ids are ignored. */
    void cancel(TimerId id);

    /** @brief Runs all queued handlers and due timers on the calling thread. */
    size_t drain();

    /** @brief Waits until work is ready or `maxWait` elapsed, then drains. */
    size_t waitAndDrain(std::chrono::milliseconds maxWait);

    /** @brief Runs the loop on the calling thread until stop() is called. */
    void run();

    /** @brief Makes run() return after the current drain. Safe to call from any thread. */
    void stop();

    size_t pendingTimers() const;

private:
    struct Timer {
        TimerId id;
        domain::MonotonicPoint due;
        Handler handler;
    };

    std::shared_ptr<domain::Clock> m_clock;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Handler> m_queue;
    std::vector<Timer> m_timers;
    TimerId m_nextTimerId = 1;
    std::atomic<bool> m_stopped{false};
};

} // namespace writher::application
