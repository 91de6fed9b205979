// =================================================================
// src/Tempo/MetricsRegistry.cpp
// =================================================================
// Implementation for the metrics registry.

#include "Tempo/MetricsRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace Tempo {

MetricsRegistry::MetricsRegistry(const Clock& clock, WindowConfig window)
    : m_clock(clock), m_latency_window(window) {}

std::atomic<uint64_t>& MetricsRegistry::counterRef(const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(m_counters_mutex);
        auto it = m_counters.find(name);
        if (it != m_counters.end()) {
            return *it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_counters_mutex);
    auto& slot = m_counters[name];
    if (!slot) {
        slot = std::make_unique<std::atomic<uint64_t>>(0);
    }
    return *slot;
}

void MetricsRegistry::increment(const std::string& name, uint64_t delta) {
    counterRef(name).fetch_add(delta);
}

uint64_t MetricsRegistry::counter(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_counters_mutex);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second->load();
}

std::map<std::string, uint64_t> MetricsRegistry::counters() const {
    std::shared_lock<std::shared_mutex> lock(m_counters_mutex);
    std::map<std::string, uint64_t> result;
    for (const auto& [name, value] : m_counters) {
        result[name] = value->load();
    }
    return result;
}

void MetricsRegistry::beginRequest() {
    int64_t current = ++m_in_flight;
    int64_t previous_max = m_max_in_flight.load();
    while (current > previous_max &&
           !m_max_in_flight.compare_exchange_weak(previous_max, current)) {
    }
}

void MetricsRegistry::endRequest() {
    --m_in_flight;
}

void MetricsRegistry::recordRequest(bool success, Duration latency) {
    increment(MetricNames::REQUESTS_TOTAL);
    increment(success ? MetricNames::REQUESTS_SUCCEEDED : MetricNames::REQUESTS_FAILED);
    m_latency_window.add(MetricSample{m_clock.now(), success, latency});
}

RequestMetrics MetricsRegistry::requestMetrics() const {
    TimePoint now = m_clock.now();
    auto samples = m_latency_window.snapshot(now);

    RequestMetrics metrics;
    metrics.total_requests = counter(MetricNames::REQUESTS_TOTAL);
    metrics.successful_requests = counter(MetricNames::REQUESTS_SUCCEEDED);
    metrics.failed_requests = counter(MetricNames::REQUESTS_FAILED);
    metrics.timeout_requests = counter(MetricNames::REQUESTS_TIMED_OUT);
    metrics.rejected_requests = counter(MetricNames::REQUESTS_REJECTED);
    metrics.concurrent_requests = m_in_flight.load();
    metrics.max_concurrent_requests = m_max_in_flight.load();
    metrics.window_samples = samples.size();

    if (!samples.empty()) {
        size_t failures = std::count_if(samples.begin(), samples.end(),
                                        [](const MetricSample& s) { return !s.success; });
        metrics.error_rate = static_cast<double>(failures) / samples.size();

        // Span of at least one second so a burst does not report absurd rates
        double span = std::max(1.0, toSeconds(now - samples.front().timestamp));
        metrics.requests_per_second = samples.size() / span;
    }

    return metrics;
}

LatencyMetrics MetricsRegistry::latencyMetrics() const {
    auto samples = m_latency_window.snapshot(m_clock.now());

    LatencyMetrics metrics;
    metrics.sample_count = samples.size();
    if (samples.empty()) {
        return metrics;
    }

    std::vector<double> values;
    values.reserve(samples.size());
    for (const auto& sample : samples) {
        values.push_back(toMillis(sample.latency));
    }
    std::sort(values.begin(), values.end());

    metrics.mean_ms = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    metrics.min_ms = values.front();
    metrics.max_ms = values.back();
    metrics.p50_ms = percentile(values, 0.50);
    metrics.p95_ms = percentile(values, 0.95);
    metrics.p99_ms = percentile(values, 0.99);

    return metrics;
}

double MetricsRegistry::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }

    p = std::clamp(p, 0.0, 1.0);
    // Epsilon keeps products like 0.3 * 10 from rounding up a rank
    double rank = std::ceil(p * sorted.size() - 1e-9);
    size_t index = rank < 1.0 ? 0 : static_cast<size_t>(rank) - 1;
    return sorted[std::min(index, sorted.size() - 1)];
}

void MetricsRegistry::reset() {
    {
        // Counters stay allocated, callers may still hold references
        std::unique_lock<std::shared_mutex> lock(m_counters_mutex);
        for (auto& [name, value] : m_counters) {
            value->store(0);
        }
    }
    m_in_flight = 0;
    m_max_in_flight = 0;
    m_latency_window.clear();
}

} // namespace Tempo
