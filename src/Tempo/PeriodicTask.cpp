// =================================================================
// src/Tempo/PeriodicTask.cpp
// =================================================================
// Implementation for interval-driven background loops.

#include "Tempo/PeriodicTask.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"

namespace Tempo {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> callback)
    : m_name(std::move(name)), m_interval(interval), m_callback(std::move(callback)) {
    if (m_interval.count() <= 0) {
        throw ConfigurationError(m_name + " interval must be positive");
    }
    if (!m_callback) {
        throw ConfigurationError(m_name + " requires a callback");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (m_running.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = false;
    }
    m_thread = std::make_unique<std::thread>(&PeriodicTask::loop, this);
    Logger::getInstance().debug(m_name, "Started background task",
                                "Interval: " + std::to_string(m_interval.count()) + "ms");
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();

    if (m_thread && m_thread->joinable()) {
        m_thread->join();
        Logger::getInstance().debug(m_name, "Stopped background task");
    }
    m_thread.reset();
    m_running = false;
}

void PeriodicTask::loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, m_interval, [this] { return m_stop_requested; })) {
                break;
            }
        }

        try {
            m_callback();
        } catch (const std::exception& e) {
            Logger::getInstance().error(m_name, "Background task iteration failed", e.what());
        }
        m_run_count++;
    }
}

} // namespace Tempo
