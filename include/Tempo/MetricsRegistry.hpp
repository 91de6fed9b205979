// =================================================================
// include/Tempo/MetricsRegistry.hpp
// =================================================================
// Thread-safe counters, in-flight gauge and rolling latency window.

#pragma once

#include "Tempo/Clock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Tempo {

// Counter names shared by the optimizer, monitor and reports
namespace MetricNames {
const char* const REQUESTS_TOTAL = "requests_total";
const char* const REQUESTS_SUCCEEDED = "requests_succeeded";
const char* const REQUESTS_FAILED = "requests_failed";
const char* const REQUESTS_TIMED_OUT = "requests_timed_out";
const char* const REQUESTS_REJECTED = "requests_rejected";
const char* const REQUESTS_CANCELLED = "requests_cancelled";
const char* const REQUESTS_OPTIMIZED = "requests_optimized";
const char* const REQUESTS_LOAD_BALANCED = "requests_load_balanced";
const char* const CACHE_HITS = "cache_hits";
const char* const CACHE_MISSES = "cache_misses";
} // namespace MetricNames

/**
 * @brief Immutable outcome of one request
 */
struct MetricSample {
    TimePoint timestamp;
    bool success;
    Duration latency;
};

/**
 * @brief Window bounds, whichever is hit first ages samples out
 */
struct WindowConfig {
    size_t max_samples = 1000;                               ///< Count bound
    std::chrono::milliseconds max_age{std::chrono::minutes(5)}; ///< Age bound
};

/**
 * @brief Bounded, time-aware sample buffer
 *
 * Sample must expose a `timestamp` member of type TimePoint. Samples
 * are expected in roughly chronological order; pruning drops from the
 * front.
 */
template <typename Sample>
class RollingWindow {
public:
    explicit RollingWindow(WindowConfig config = WindowConfig()) : m_config(config) {}

    void add(const Sample& sample) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_samples.push_back(sample);
        while (m_samples.size() > m_config.max_samples) {
            m_samples.pop_front();
        }
    }

    /**
     * @brief Copy of the samples still inside the window at `now`
     */
    std::vector<Sample> snapshot(TimePoint now) {
        std::lock_guard<std::mutex> lock(m_mutex);
        pruneLocked(now);
        return std::vector<Sample>(m_samples.begin(), m_samples.end());
    }

    /**
     * @brief Most recent sample still inside the window, if any
     */
    bool latest(TimePoint now, Sample& out) {
        std::lock_guard<std::mutex> lock(m_mutex);
        pruneLocked(now);
        if (m_samples.empty()) {
            return false;
        }
        out = m_samples.back();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_samples.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_samples.clear();
    }

    const WindowConfig& config() const { return m_config; }

private:
    void pruneLocked(TimePoint now) {
        while (!m_samples.empty() && now - m_samples.front().timestamp > m_config.max_age) {
            m_samples.pop_front();
        }
    }

    WindowConfig m_config;
    mutable std::mutex m_mutex;
    std::deque<Sample> m_samples;
};

/**
 * @brief Request counters derived from the registry
 */
struct RequestMetrics {
    uint64_t total_requests = 0;      ///< Lifetime request count
    uint64_t successful_requests = 0; ///< Lifetime successes
    uint64_t failed_requests = 0;     ///< Lifetime failures of any kind
    uint64_t timeout_requests = 0;    ///< Lifetime timeouts
    uint64_t rejected_requests = 0;   ///< Lifetime capacity rejections
    double requests_per_second = 0.0; ///< Throughput over the rolling window
    double error_rate = 0.0;          ///< Failed share of the rolling window
    size_t window_samples = 0;        ///< Samples currently in the window
    int64_t concurrent_requests = 0;  ///< Requests in flight right now
    int64_t max_concurrent_requests = 0; ///< High-water mark of in-flight requests
};

/**
 * @brief Latency distribution over the rolling window, in milliseconds
 */
struct LatencyMetrics {
    size_t sample_count = 0;
    double mean_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
};

/**
 * @brief Process-local metrics store for the optimization layer
 *
 * One instance is constructed per optimizer and shared by reference
 * with the monitor. Counter increments and gauge updates are lock-free
 * once a counter exists.
 */
class MetricsRegistry {
public:
    explicit MetricsRegistry(const Clock& clock, WindowConfig window = WindowConfig());

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /**
     * @brief Add to a named counter, creating it on first use
     * @param name Counter name
     * @param delta Amount to add
     */
    void increment(const std::string& name, uint64_t delta = 1);

    /**
     * @brief Current value of a named counter, 0 if never incremented
     */
    uint64_t counter(const std::string& name) const;

    /**
     * @brief All counters by name
     */
    std::map<std::string, uint64_t> counters() const;

    /**
     * @brief Mark a request as in flight
     */
    void beginRequest();

    /**
     * @brief Mark an in-flight request as finished
     */
    void endRequest();

    int64_t inFlight() const { return m_in_flight.load(); }
    int64_t maxInFlight() const { return m_max_in_flight.load(); }

    /**
     * @brief Record a finished request into counters and the latency window
     * @param success Whether the request produced a result
     * @param latency End-to-end latency
     */
    void recordRequest(bool success, Duration latency);

    RequestMetrics requestMetrics() const;
    LatencyMetrics latencyMetrics() const;

    /**
     * @brief Nearest-rank percentile of an ascending sequence
     *
     * Returns the element at index ceil(p * n) - 1, clamped to the valid
     * range. Identical inputs always give identical results.
     *
     * @param sorted Ascending values
     * @param p Fraction in [0, 1]
     * @return Selected value, 0 for an empty input
     */
    static double percentile(const std::vector<double>& sorted, double p);

    /**
     * @brief Drop all counters, gauges and samples
     */
    void reset();

private:
    std::atomic<uint64_t>& counterRef(const std::string& name);

    const Clock& m_clock;
    mutable std::shared_mutex m_counters_mutex;
    std::map<std::string, std::unique_ptr<std::atomic<uint64_t>>> m_counters;

    std::atomic<int64_t> m_in_flight{0};
    std::atomic<int64_t> m_max_in_flight{0};

    mutable RollingWindow<MetricSample> m_latency_window;
};

} // namespace Tempo
