// =================================================================
// src/Tempo/PerformanceMonitor.cpp
// =================================================================
// Implementation for performance aggregation and alerting.

#include "Tempo/PerformanceMonitor.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"
#include "nlohmann/json.hpp"
#include <cmath>
#include <sstream>

namespace Tempo {

void AlertThresholds::validate() const {
    if (max_response_time.count() <= 0) {
        throw ConfigurationError("thresholds.max_response_time must be positive");
    }
    if (std::isnan(min_cache_hit_rate) || min_cache_hit_rate < 0.0 || min_cache_hit_rate > 1.0) {
        throw ConfigurationError("thresholds.min_cache_hit_rate must be within [0, 1]");
    }
    if (std::isnan(max_error_rate) || max_error_rate < 0.0 || max_error_rate > 1.0) {
        throw ConfigurationError("thresholds.max_error_rate must be within [0, 1]");
    }
    if (max_concurrent_requests <= 0) {
        throw ConfigurationError("thresholds.max_concurrent_requests must be positive");
    }
    if (std::isnan(max_cpu_usage) || max_cpu_usage <= 0.0 || max_cpu_usage > 100.0) {
        throw ConfigurationError("thresholds.max_cpu_usage must be within (0, 100]");
    }
    if (std::isnan(max_memory_usage) || max_memory_usage <= 0.0 || max_memory_usage > 100.0) {
        throw ConfigurationError("thresholds.max_memory_usage must be within (0, 100]");
    }
}

void MonitorConfig::validate() const {
    thresholds.validate();
    if (monitoring_interval.count() <= 0) {
        throw ConfigurationError("monitor.monitoring_interval must be positive");
    }
    if (alert_cooldown.count() < 0) {
        throw ConfigurationError("monitor.alert_cooldown must not be negative");
    }
    if (window.max_samples == 0 || window.max_age.count() <= 0) {
        throw ConfigurationError("monitor window bounds must be positive");
    }
}

std::string alertTypeName(AlertType type) {
    switch (type) {
        case AlertType::RESPONSE_TIME: return "response_time";
        case AlertType::CACHE_HIT_RATE: return "cache_hit_rate";
        case AlertType::ERROR_RATE: return "error_rate";
        case AlertType::CONCURRENCY: return "concurrency";
        case AlertType::SYSTEM_RESOURCE: return "system_resource";
        default: return "unknown";
    }
}

std::string alertSeverityName(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::INFO: return "info";
        case AlertSeverity::WARNING: return "warning";
        case AlertSeverity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

PerformanceMonitor::PerformanceMonitor(MetricsRegistry& registry, const MonitorConfig& config, const Clock& clock)
    : m_registry(registry),
      m_config(config),
      m_clock(clock),
      m_cache_window(config.window),
      m_system_window(config.window) {
    m_config.validate();
    m_thresholds = std::make_shared<const AlertThresholds>(m_config.thresholds);

    registerAlertHandler("log", [](const PerformanceAlert& alert) {
        Logger::getInstance().logAlert(alertSeverityName(alert.severity), alert.metric,
                                       alert.value, alert.threshold);
    });
}

PerformanceMonitor::~PerformanceMonitor() {
    stopMonitoring();
}

void PerformanceMonitor::recordRequest(bool success, Duration latency) {
    m_registry.recordRequest(success, latency);
}

void PerformanceMonitor::recordCacheMetrics(uint64_t hits, uint64_t misses, size_t size,
                                            uint64_t evictions, double average_age_seconds) {
    CacheSample sample;
    sample.timestamp = m_clock.now();
    sample.hits = hits;
    sample.misses = misses;
    sample.size = size;
    sample.evictions = evictions;
    sample.average_age_seconds = average_age_seconds;
    m_cache_window.add(sample);
}

void PerformanceMonitor::recordSystemMetrics(double cpu_usage, double memory_usage, size_t worker_count,
                                             size_t heap_size, double gc_pause_ms) {
    SystemSample sample;
    sample.timestamp = m_clock.now();
    sample.cpu_usage = cpu_usage;
    sample.memory_usage = memory_usage;
    sample.worker_count = worker_count;
    sample.heap_size = heap_size;
    sample.gc_pause_ms = gc_pause_ms;
    m_system_window.add(sample);
}

SystemPerformanceReport PerformanceMonitor::report() const {
    TimePoint now = m_clock.now();

    SystemPerformanceReport report;
    report.generated_at = std::chrono::system_clock::now();
    report.requests = m_registry.requestMetrics();
    report.latency = m_registry.latencyMetrics();
    report.thresholds = thresholds();

    CacheSample cache_sample;
    if (m_cache_window.latest(now, cache_sample)) {
        report.cache = cache_sample;
    }

    auto system_samples = m_system_window.snapshot(now);
    if (!system_samples.empty()) {
        report.system = system_samples.back();
        double cpu_total = 0.0;
        double memory_total = 0.0;
        for (const auto& sample : system_samples) {
            cpu_total += sample.cpu_usage;
            memory_total += sample.memory_usage;
        }
        report.average_cpu_usage = cpu_total / system_samples.size();
        report.average_memory_usage = memory_total / system_samples.size();
    }

    {
        std::lock_guard<std::mutex> lock(m_alerts_mutex);
        report.active_alert_states = m_alert_states.size();
    }
    return report;
}

std::string PerformanceMonitor::reportToJson(const SystemPerformanceReport& report, int indent) {
    nlohmann::json json;

    json["requests"] = {
        {"total", report.requests.total_requests},
        {"successful", report.requests.successful_requests},
        {"failed", report.requests.failed_requests},
        {"timeouts", report.requests.timeout_requests},
        {"rejected", report.requests.rejected_requests},
        {"requests_per_second", report.requests.requests_per_second},
        {"error_rate", report.requests.error_rate},
        {"window_samples", report.requests.window_samples},
        {"concurrent", report.requests.concurrent_requests},
        {"max_concurrent", report.requests.max_concurrent_requests}
    };

    json["latency_ms"] = {
        {"samples", report.latency.sample_count},
        {"mean", report.latency.mean_ms},
        {"p50", report.latency.p50_ms},
        {"p95", report.latency.p95_ms},
        {"p99", report.latency.p99_ms},
        {"min", report.latency.min_ms},
        {"max", report.latency.max_ms}
    };

    if (report.cache) {
        json["cache"] = {
            {"hits", report.cache->hits},
            {"misses", report.cache->misses},
            {"hit_rate", report.cache->hitRate()},
            {"size", report.cache->size},
            {"evictions", report.cache->evictions},
            {"average_age_seconds", report.cache->average_age_seconds}
        };
    } else {
        json["cache"] = nullptr;
    }

    if (report.system) {
        json["system"] = {
            {"cpu_usage", report.system->cpu_usage},
            {"memory_usage", report.system->memory_usage},
            {"average_cpu_usage", report.average_cpu_usage},
            {"average_memory_usage", report.average_memory_usage},
            {"worker_count", report.system->worker_count},
            {"heap_size", report.system->heap_size},
            {"gc_pause_ms", report.system->gc_pause_ms}
        };
    } else {
        json["system"] = nullptr;
    }

    json["thresholds"] = {
        {"max_response_time_ms", report.thresholds.max_response_time.count()},
        {"min_cache_hit_rate", report.thresholds.min_cache_hit_rate},
        {"max_error_rate", report.thresholds.max_error_rate},
        {"max_concurrent_requests", report.thresholds.max_concurrent_requests},
        {"max_cpu_usage", report.thresholds.max_cpu_usage},
        {"max_memory_usage", report.thresholds.max_memory_usage}
    };

    json["active_alert_states"] = report.active_alert_states;
    json["generated_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        report.generated_at.time_since_epoch()).count();

    return json.dump(indent);
}

std::string PerformanceMonitor::alertToJson(const PerformanceAlert& alert) {
    nlohmann::json json = {
        {"id", alert.id},
        {"type", alertTypeName(alert.type)},
        {"severity", alertSeverityName(alert.severity)},
        {"message", alert.message},
        {"metric", alert.metric},
        {"value", alert.value},
        {"threshold", alert.threshold}
    };
    return json.dump();
}

void PerformanceMonitor::startMonitoring(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        interval = m_config.monitoring_interval;
    }

    std::lock_guard<std::mutex> lock(m_task_mutex);
    if (m_monitor_task && m_monitor_task->isRunning()) {
        return;
    }
    m_monitor_task = std::make_unique<PeriodicTask>("PerformanceMonitor", interval, [this] {
        runMonitoringCycle();
    });
    m_monitor_task->start();
    Logger::getInstance().info("PerformanceMonitor", "Monitoring started",
                               "Interval: " + std::to_string(interval.count()) + "ms");
}

void PerformanceMonitor::stopMonitoring() {
    std::unique_ptr<PeriodicTask> task;
    {
        std::lock_guard<std::mutex> lock(m_task_mutex);
        task = std::move(m_monitor_task);
    }
    if (task) {
        task->stop();
        Logger::getInstance().info("PerformanceMonitor", "Monitoring stopped");
    }
}

bool PerformanceMonitor::isMonitoring() const {
    std::lock_guard<std::mutex> lock(m_task_mutex);
    return m_monitor_task && m_monitor_task->isRunning();
}

std::vector<PerformanceAlert> PerformanceMonitor::runMonitoringCycle() {
    runCollectors();

    SystemPerformanceReport snapshot = report();
    std::vector<PerformanceAlert> fired = applyCooldown(evaluateThresholds(snapshot, snapshot.thresholds));

    if (!fired.empty()) {
        dispatchAlerts(fired);
    }
    return fired;
}

void PerformanceMonitor::runCollectors() {
    std::vector<std::pair<std::string, MetricsCollector>> collectors;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        collectors.assign(m_collectors.begin(), m_collectors.end());
    }

    for (const auto& [name, collector] : collectors) {
        try {
            collector(*this);
        } catch (const std::exception& e) {
            Logger::getInstance().error("PerformanceMonitor", "Collector '" + name + "' failed", e.what());
        }
    }
}

std::vector<PerformanceMonitor::Breach> PerformanceMonitor::evaluateThresholds(
    const SystemPerformanceReport& report, const AlertThresholds& thresholds) const {
    std::vector<Breach> breaches;

    double max_response_ms = static_cast<double>(thresholds.max_response_time.count());
    if (report.latency.sample_count > 0 && report.latency.mean_ms > max_response_ms) {
        std::ostringstream message;
        message << "Average response time " << report.latency.mean_ms << "ms exceeds " << max_response_ms << "ms";
        breaches.push_back({AlertType::RESPONSE_TIME, AlertSeverity::WARNING, "average_response_time",
                            report.latency.mean_ms, max_response_ms, message.str()});
    }

    if (report.cache && report.cache->lookups() >= m_config.min_rate_samples &&
        report.cache->hitRate() < thresholds.min_cache_hit_rate) {
        std::ostringstream message;
        message << "Cache hit rate " << report.cache->hitRate() << " below " << thresholds.min_cache_hit_rate;
        breaches.push_back({AlertType::CACHE_HIT_RATE, AlertSeverity::WARNING, "cache_hit_rate",
                            report.cache->hitRate(), thresholds.min_cache_hit_rate, message.str()});
    }

    if (report.requests.window_samples >= m_config.min_rate_samples &&
        report.requests.error_rate > thresholds.max_error_rate) {
        std::ostringstream message;
        message << "Error rate " << report.requests.error_rate << " exceeds " << thresholds.max_error_rate;
        breaches.push_back({AlertType::ERROR_RATE, AlertSeverity::CRITICAL, "error_rate",
                            report.requests.error_rate, thresholds.max_error_rate, message.str()});
    }

    if (report.requests.concurrent_requests > thresholds.max_concurrent_requests) {
        std::ostringstream message;
        message << report.requests.concurrent_requests << " concurrent requests exceed "
                << thresholds.max_concurrent_requests;
        breaches.push_back({AlertType::CONCURRENCY, AlertSeverity::WARNING, "concurrent_requests",
                            static_cast<double>(report.requests.concurrent_requests),
                            static_cast<double>(thresholds.max_concurrent_requests), message.str()});
    }

    if (report.system) {
        if (report.system->cpu_usage > thresholds.max_cpu_usage) {
            std::ostringstream message;
            message << "CPU usage " << report.system->cpu_usage << "% exceeds " << thresholds.max_cpu_usage << "%";
            breaches.push_back({AlertType::SYSTEM_RESOURCE, AlertSeverity::WARNING, "cpu_usage",
                                report.system->cpu_usage, thresholds.max_cpu_usage, message.str()});
        }
        if (report.system->memory_usage > thresholds.max_memory_usage) {
            std::ostringstream message;
            message << "Memory usage " << report.system->memory_usage << "% exceeds "
                    << thresholds.max_memory_usage << "%";
            breaches.push_back({AlertType::SYSTEM_RESOURCE, AlertSeverity::WARNING, "memory_usage",
                                report.system->memory_usage, thresholds.max_memory_usage, message.str()});
        }
    }

    return breaches;
}

std::string PerformanceMonitor::stateKey(const std::string& metric, AlertSeverity severity) {
    return metric + "_" + alertSeverityName(severity);
}

std::vector<PerformanceAlert> PerformanceMonitor::applyCooldown(const std::vector<Breach>& breaches) {
    std::vector<PerformanceAlert> fired;
    TimePoint now = m_clock.now();

    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    for (const auto& breach : breaches) {
        std::string key = stateKey(breach.metric, breach.severity);
        auto it = m_alert_states.find(key);

        if (it != m_alert_states.end() && !(now > it->second.cooldown_until)) {
            it->second.suppressed_count++;
            continue;
        }

        if (it == m_alert_states.end()) {
            AlertState state;
            state.alert_type = breach.type;
            it = m_alert_states.emplace(key, state).first;
        }
        it->second.last_fired_at = now;
        it->second.cooldown_until = now + m_config.alert_cooldown;
        it->second.fire_count++;

        PerformanceAlert alert;
        alert.id = "alert-" + std::to_string(++m_alert_sequence);
        alert.type = breach.type;
        alert.severity = breach.severity;
        alert.message = breach.message;
        alert.metric = breach.metric;
        alert.value = breach.value;
        alert.threshold = breach.threshold;
        alert.timestamp = now;
        fired.push_back(alert);

        m_alert_history.push_back(alert);
        if (m_alert_history.size() > m_config.max_alert_history) {
            m_alert_history.erase(m_alert_history.begin());
        }
    }
    return fired;
}

void PerformanceMonitor::dispatchAlerts(const std::vector<PerformanceAlert>& alerts) {
    std::vector<std::pair<std::string, AlertHandler>> handlers;
    {
        std::lock_guard<std::mutex> lock(m_handlers_mutex);
        handlers.assign(m_handlers.begin(), m_handlers.end());
    }

    for (const auto& alert : alerts) {
        for (const auto& [name, handler] : handlers) {
            try {
                handler(alert);
            } catch (const std::exception& e) {
                Logger::getInstance().error("PerformanceMonitor",
                                            "Alert handler '" + name + "' failed for " + alert.id, e.what());
            }
        }
    }
}

void PerformanceMonitor::registerAlertHandler(const std::string& name, AlertHandler handler) {
    if (!handler) {
        throw ConfigurationError("alert handler '" + name + "' is empty");
    }
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_handlers[name] = std::move(handler);
}

bool PerformanceMonitor::removeAlertHandler(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    return m_handlers.erase(name) > 0;
}

void PerformanceMonitor::registerCollector(const std::string& name, MetricsCollector collector) {
    if (!collector) {
        throw ConfigurationError("collector '" + name + "' is empty");
    }
    std::lock_guard<std::mutex> lock(m_handlers_mutex);
    m_collectors[name] = std::move(collector);
}

void PerformanceMonitor::setThresholds(const AlertThresholds& thresholds) {
    thresholds.validate();
    auto replacement = std::make_shared<const AlertThresholds>(thresholds);
    {
        std::lock_guard<std::mutex> lock(m_thresholds_mutex);
        m_thresholds = std::move(replacement);
    }
    Logger::getInstance().info("PerformanceMonitor", "Alert thresholds updated");
}

AlertThresholds PerformanceMonitor::thresholds() const {
    std::lock_guard<std::mutex> lock(m_thresholds_mutex);
    return *m_thresholds;
}

std::vector<PerformanceAlert> PerformanceMonitor::alertHistory() const {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    return m_alert_history;
}

std::optional<AlertState> PerformanceMonitor::alertState(const std::string& metric, AlertSeverity severity) const {
    std::lock_guard<std::mutex> lock(m_alerts_mutex);
    auto it = m_alert_states.find(stateKey(metric, severity));
    if (it == m_alert_states.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace Tempo
