// =================================================================
// include/Tempo/SystemResourceSampler.hpp
// =================================================================
// Process CPU and memory sampling for the performance monitor.

#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>

namespace Tempo {

/**
 * @brief One resource reading
 */
struct ResourceUsage {
    double cpu_usage = 0.0;       ///< Process CPU percent since the previous reading
    double memory_usage = 0.0;    ///< System memory in use, percent
    size_t resident_bytes = 0;    ///< Peak resident set size of this process
};

/**
 * @brief Reads process and system resource usage
 *
 * CPU usage is the process user+system time consumed between two calls
 * divided by the wall time between them and the number of cores. The
 * first call reports 0.
 */
class SystemResourceSampler {
public:
    SystemResourceSampler();

    ResourceUsage sample();

private:
    static double processCpuSeconds();

    std::mutex m_mutex;
    std::chrono::steady_clock::time_point m_last_wall;
    double m_last_cpu_seconds = 0.0;
    unsigned int m_cores = 1;
};

} // namespace Tempo
