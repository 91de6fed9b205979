// =================================================================
// include/Tempo/Clock.hpp
// =================================================================
// Injectable monotonic time source.

#pragma once

#include <chrono>
#include <mutex>

namespace Tempo {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = SteadyClock::duration;

/**
 * @brief Source of monotonic timestamps for TTLs, windows and cooldowns
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override { return SteadyClock::now(); }
};

/**
 * @brief Clock that only moves when told to
 *
 * Starts at the real current time so that values stay comparable with
 * deadlines computed from steady_clock.
 */
class ManualClock : public Clock {
public:
    ManualClock() : m_now(SteadyClock::now()) {}
    explicit ManualClock(TimePoint start) : m_now(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(Duration delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += delta;
    }

    void set(TimePoint value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = value;
    }

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
};

/**
 * @brief Convert a duration to fractional seconds
 */
inline double toSeconds(Duration d) {
    return std::chrono::duration<double>(d).count();
}

/**
 * @brief Convert a duration to fractional milliseconds
 */
inline double toMillis(Duration d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

} // namespace Tempo
