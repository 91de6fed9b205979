// =================================================================
// include/Tempo/PerformanceMonitor.hpp
// =================================================================
// Periodic performance aggregation, threshold evaluation and alerting.

#pragma once

#include "Tempo/Clock.hpp"
#include "Tempo/MetricsRegistry.hpp"
#include "Tempo/PeriodicTask.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Tempo {

/**
 * @brief Thresholds that trigger performance alerts
 */
struct AlertThresholds {
    std::chrono::milliseconds max_response_time{5000}; ///< Mean latency ceiling
    double min_cache_hit_rate = 0.7;                   ///< Cache hit rate floor
    double max_error_rate = 0.05;                      ///< Windowed failure share ceiling
    int64_t max_concurrent_requests = 100;             ///< In-flight request ceiling
    double max_cpu_usage = 80.0;                       ///< CPU percentage ceiling
    double max_memory_usage = 85.0;                    ///< Memory percentage ceiling

    /**
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

/**
 * @brief Monitor configuration
 */
struct MonitorConfig {
    AlertThresholds thresholds;
    std::chrono::milliseconds monitoring_interval{std::chrono::seconds(30)}; ///< Evaluation tick
    std::chrono::milliseconds alert_cooldown{std::chrono::minutes(5)};      ///< Quiet period per (metric, severity)
    WindowConfig window;                               ///< Bounds of every rolling window
    size_t min_rate_samples = 100;                     ///< Samples needed before rate alerts fire
    size_t max_alert_history = 100;                    ///< Fired alerts retained for inspection

    /**
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

enum class AlertType {
    RESPONSE_TIME,
    CACHE_HIT_RATE,
    ERROR_RATE,
    CONCURRENCY,
    SYSTEM_RESOURCE
};

enum class AlertSeverity {
    INFO,
    WARNING,
    CRITICAL
};

std::string alertTypeName(AlertType type);
std::string alertSeverityName(AlertSeverity severity);

/**
 * @brief A fired alert
 */
struct PerformanceAlert {
    std::string id;                                    ///< "alert-<sequence>"
    AlertType type = AlertType::RESPONSE_TIME;
    AlertSeverity severity = AlertSeverity::WARNING;
    std::string message;                               ///< Human readable summary
    std::string metric;                                ///< Metric that breached
    double value = 0.0;                                ///< Observed value
    double threshold = 0.0;                            ///< Configured threshold
    TimePoint timestamp;                               ///< Monitor clock time of firing
};

/**
 * @brief Cooldown bookkeeping for one (metric, severity) pair
 */
struct AlertState {
    AlertType alert_type = AlertType::RESPONSE_TIME;
    TimePoint last_fired_at;
    TimePoint cooldown_until;
    uint64_t fire_count = 0;
    uint64_t suppressed_count = 0;                     ///< Breaches swallowed by the cooldown
};

/**
 * @brief Cumulative cache counters at one point in time
 */
struct CacheSample {
    TimePoint timestamp;
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t size = 0;
    uint64_t evictions = 0;
    double average_age_seconds = 0.0;

    uint64_t lookups() const { return hits + misses; }
    double hitRate() const { return lookups() > 0 ? static_cast<double>(hits) / lookups() : 0.0; }
};

/**
 * @brief Process resource usage at one point in time
 */
struct SystemSample {
    TimePoint timestamp;
    double cpu_usage = 0.0;                            ///< Percent
    double memory_usage = 0.0;                         ///< Percent
    size_t worker_count = 0;
    size_t heap_size = 0;                              ///< Bytes
    double gc_pause_ms = 0.0;
};

/**
 * @brief Point-in-time aggregation across all rolling windows
 */
struct SystemPerformanceReport {
    RequestMetrics requests;
    LatencyMetrics latency;
    std::optional<CacheSample> cache;                  ///< Latest cache sample in the window
    std::optional<SystemSample> system;                ///< Latest system sample in the window
    double average_cpu_usage = 0.0;                    ///< Mean over the system window
    double average_memory_usage = 0.0;                 ///< Mean over the system window
    AlertThresholds thresholds;                        ///< Thresholds active when generated
    size_t active_alert_states = 0;                    ///< (metric, severity) pairs that ever fired
    std::chrono::system_clock::time_point generated_at;
};

using AlertHandler = std::function<void(const PerformanceAlert&)>;

class PerformanceMonitor;
using MetricsCollector = std::function<void(PerformanceMonitor&)>;

/**
 * @brief Aggregates metrics and raises alerts on threshold breaches
 *
 * Request samples go through the shared MetricsRegistry; cache and
 * system samples are kept in the monitor's own rolling windows. A single
 * periodic task runs collectors, builds a report, evaluates thresholds
 * and dispatches alerts. No monitor lock is held while collectors or
 * alert handlers run.
 */
class PerformanceMonitor {
public:
    /**
     * @brief Constructor
     * @param registry Registry shared with the request path
     * @param config Validated eagerly
     * @param clock Time source for windows and cooldowns
     * @throws ConfigurationError on invalid configuration
     */
    PerformanceMonitor(MetricsRegistry& registry, const MonitorConfig& config, const Clock& clock);
    virtual ~PerformanceMonitor();

    PerformanceMonitor(const PerformanceMonitor&) = delete;
    PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

    void recordRequest(bool success, Duration latency);

    /**
     * @brief Record cumulative cache counters
     */
    void recordCacheMetrics(uint64_t hits, uint64_t misses, size_t size,
                            uint64_t evictions, double average_age_seconds);

    void recordSystemMetrics(double cpu_usage, double memory_usage, size_t worker_count,
                             size_t heap_size, double gc_pause_ms);

    SystemPerformanceReport report() const;

    /**
     * @brief Serialize a report as JSON
     * @param report Report to serialize
     * @param indent Indentation, -1 for a single line
     */
    static std::string reportToJson(const SystemPerformanceReport& report, int indent = 2);

    static std::string alertToJson(const PerformanceAlert& alert);

    /**
     * @brief Start the evaluation loop
     * @param interval Tick period, zero for the configured interval
     */
    void startMonitoring(std::chrono::milliseconds interval = std::chrono::milliseconds(0));

    void stopMonitoring();

    bool isMonitoring() const;

    /**
     * @brief Run one evaluation tick synchronously
     * @return Alerts fired by this tick
     */
    std::vector<PerformanceAlert> runMonitoringCycle();

    /**
     * @brief Add or replace a named alert handler
     *
     * Every handler sees every alert. An exception thrown by one handler
     * is logged and does not stop the others.
     */
    void registerAlertHandler(const std::string& name, AlertHandler handler);

    bool removeAlertHandler(const std::string& name);

    /**
     * @brief Add or replace a named sample source polled each tick
     */
    void registerCollector(const std::string& name, MetricsCollector collector);

    /**
     * @brief Replace the active thresholds from the next tick on
     * @throws ConfigurationError when the thresholds are invalid
     */
    void setThresholds(const AlertThresholds& thresholds);

    AlertThresholds thresholds() const;

    std::vector<PerformanceAlert> alertHistory() const;

    std::optional<AlertState> alertState(const std::string& metric, AlertSeverity severity) const;

    const MonitorConfig& config() const { return m_config; }

private:
    struct Breach {
        AlertType type;
        AlertSeverity severity;
        std::string metric;
        double value;
        double threshold;
        std::string message;
    };

    std::vector<Breach> evaluateThresholds(const SystemPerformanceReport& report,
                                           const AlertThresholds& thresholds) const;
    std::vector<PerformanceAlert> applyCooldown(const std::vector<Breach>& breaches);
    void runCollectors();
    void dispatchAlerts(const std::vector<PerformanceAlert>& alerts);
    static std::string stateKey(const std::string& metric, AlertSeverity severity);

    MetricsRegistry& m_registry;
    MonitorConfig m_config;
    const Clock& m_clock;

    mutable RollingWindow<CacheSample> m_cache_window;
    mutable RollingWindow<SystemSample> m_system_window;

    mutable std::mutex m_thresholds_mutex;
    std::shared_ptr<const AlertThresholds> m_thresholds;

    mutable std::mutex m_handlers_mutex;
    std::map<std::string, AlertHandler> m_handlers;
    std::map<std::string, MetricsCollector> m_collectors;

    mutable std::mutex m_alerts_mutex;
    std::map<std::string, AlertState> m_alert_states;
    std::vector<PerformanceAlert> m_alert_history;
    std::atomic<uint64_t> m_alert_sequence{0};

    mutable std::mutex m_task_mutex;
    std::unique_ptr<PeriodicTask> m_monitor_task;
};

} // namespace Tempo
