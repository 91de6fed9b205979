// =================================================================
// include/Tempo/PeriodicTask.hpp
// =================================================================
// Owned background thread that runs a callback on a fixed interval.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace Tempo {

/**
 * @brief Background loop used for monitoring, cleanup and maintenance
 *
 * The callback first runs one interval after start(). Exceptions thrown
 * by the callback are logged and the loop keeps going. stop() wakes the
 * loop immediately and joins the thread; the destructor calls stop().
 */
class PeriodicTask {
public:
    /**
     * @brief Create a stopped task
     * @param name Component name used in log lines
     * @param interval Delay between callback runs, must be positive
     * @param callback Work to run each interval
     */
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> callback);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Number of completed callback runs
     */
    size_t runCount() const { return m_run_count.load(); }

private:
    void loop();

    std::string m_name;
    std::chrono::milliseconds m_interval;
    std::function<void()> m_callback;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_run_count{0};
    bool m_stop_requested = false;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace Tempo
