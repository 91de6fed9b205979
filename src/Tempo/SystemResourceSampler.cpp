// =================================================================
// src/Tempo/SystemResourceSampler.cpp
// =================================================================
// Implementation for process resource sampling.

#include "Tempo/SystemResourceSampler.hpp"
#include <algorithm>
#include <thread>
#include <sys/resource.h>
#include <sys/sysinfo.h>

namespace Tempo {

SystemResourceSampler::SystemResourceSampler()
    : m_last_wall(std::chrono::steady_clock::now()),
      m_last_cpu_seconds(processCpuSeconds()),
      m_cores(std::max(1u, std::thread::hardware_concurrency())) {}

double SystemResourceSampler::processCpuSeconds() {
    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    double user = usage.ru_utime.tv_sec + usage.ru_utime.tv_usec / 1e6;
    double system = usage.ru_stime.tv_sec + usage.ru_stime.tv_usec / 1e6;
    return user + system;
}

ResourceUsage SystemResourceSampler::sample() {
    ResourceUsage result;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto now = std::chrono::steady_clock::now();
        double cpu_seconds = processCpuSeconds();
        double wall_seconds = std::chrono::duration<double>(now - m_last_wall).count();

        if (wall_seconds > 0.0) {
            double used = (cpu_seconds - m_last_cpu_seconds) / (wall_seconds * m_cores);
            result.cpu_usage = std::clamp(used * 100.0, 0.0, 100.0);
        }
        m_last_wall = now;
        m_last_cpu_seconds = cpu_seconds;
    }

    struct sysinfo info;
    if (sysinfo(&info) == 0 && info.totalram > 0) {
        double total = static_cast<double>(info.totalram) * info.mem_unit;
        double free = static_cast<double>(info.freeram + info.bufferram) * info.mem_unit;
        result.memory_usage = std::clamp((total - free) / total * 100.0, 0.0, 100.0);
    }

    struct rusage usage;
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        result.resident_bytes = static_cast<size_t>(usage.ru_maxrss) * 1024; // KB on Linux
    }

    return result;
}

} // namespace Tempo
