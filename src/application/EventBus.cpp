/**
 * @file EventBus.cpp
 * @brief Implementation of EventBus.
 */

#include "application/EventBus.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>

namespace writher::application {

EventBus::EventBus(std::shared_ptr<domain::Clock> clock)
    : m_clock(std::move(clock)) {}

void EventBus::post(Handler handler) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(handler));
    }
    m_cv.notify_one();
}

EventBus::TimerId EventBus::postAfter(std::chrono::milliseconds delay, Handler handler) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        id = m_nextTimerId++;
        m_timers.push_back(Timer{id, m_clock->monotonic() + delay, std::move(handler)});
    }
    m_cv.notify_one();
    return id;
}

void EventBus::cancel(TimerId id) {
    if (id == 0) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_timers.erase(std::remove_if(m_timers.begin(), m_timers.end(),
                                  [id](const Timer& t) { return t.id == id; }),
                   m_timers.end());
}

size_t EventBus::drain() {
    size_t executed = 0;
    while (true) {
        std::vector<Handler> ready;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            while (!m_queue.empty()) {
                ready.push_back(std::move(m_queue.front()));
                m_queue.pop_front();
            }

            const auto now = m_clock->monotonic();
            std::vector<Timer> due;
            auto it = std::partition(m_timers.begin(), m_timers.end(),
                                     [now](const Timer& t) { return t.due > now; });
            std::move(it, m_timers.end(), std::back_inserter(due));
            m_timers.erase(it, m_timers.end());
            std::sort(due.begin(), due.end(), [](const Timer& a, const Timer& b) {
                return a.due == b.due ? a.id < b.id : a.due < b.due;
            });
            for (auto& timer : due) {
                ready.push_back(std::move(timer.handler));
            }
        }

        if (ready.empty()) {
            return executed;
        }

        for (auto& handler : ready) {
            try {
                handler();
            } catch (const std::exception& e) {
                std::cerr << "[EventBus] Handler failed: " << e.what() << std::endl;
            }
            ++executed;
        }
    }
}

size_t EventBus::waitAndDrain(std::chrono::milliseconds maxWait) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto wait = maxWait;
        const auto now = m_clock->monotonic();
        for (const auto& timer : m_timers) {
            auto untilDue = std::chrono::duration_cast<std::chrono::milliseconds>(timer.due - now);
            if (untilDue < wait) {
                wait = std::max(untilDue, std::chrono::milliseconds(0));
            }
        }
        m_cv.wait_for(lock, wait, [this] { return !m_queue.empty() || m_stopped; });
    }
    return drain();
}

void EventBus::run() {
    std::cout << "[EventBus] Coordination loop started." << std::endl;
    while (!m_stopped) {
        waitAndDrain(std::chrono::milliseconds(250));
    }
    drain();
    std::cout << "[EventBus] Coordination loop stopped." << std::endl;
}

void EventBus::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopped = true;
    }
    m_cv.notify_all();
}

size_t EventBus::pendingTimers() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_timers.size();
}

} // namespace writher::application
