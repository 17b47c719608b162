/**
 * @file Clock.hpp
 * @brief Time source shared by the coordination loop, the pipeline and the scheduler.
 */

#pragma once

#include <chrono>

namespace writher::domain {

/** @brief Absolute wall-clock instant, always interpreted as UTC. */
using Instant = std::chrono::system_clock::time_point;

/** @brief Monotonic point used for session timing and timers. */
using MonotonicPoint = std::chrono::steady_clock::time_point;

/**
 * @class Clock
 * @brief Abstract time source so timers and sweeps can be driven deterministically in tests.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /** @brief Current wall-clock time. Used for fire times and timestamps. */
    virtual Instant now() const = 0;

    /** @brief Current monotonic time. Used for session durations and timers. */
    virtual MonotonicPoint monotonic() const = 0;
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::system_clock and std::chrono::steady_clock.
 */
class SystemClock : public Clock {
public:
    Instant now() const override { return std::chrono::system_clock::now(); }
    MonotonicPoint monotonic() const override { return std::chrono::steady_clock::now(); }
};

} // namespace writher::domain
