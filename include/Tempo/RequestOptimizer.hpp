// =================================================================
// include/Tempo/RequestOptimizer.hpp
// =================================================================
// Facade sequencing cache, load balancer, backend and metrics per request.

#pragma once

#include "Tempo/CacheStore.hpp"
#include "Tempo/Cancellation.hpp"
#include "Tempo/Clock.hpp"
#include "Tempo/Config.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/GenerationBackend.hpp"
#include "Tempo/MetricsRegistry.hpp"
#include "Tempo/PerformanceMonitor.hpp"
#include "Tempo/SessionLoadBalancer.hpp"
#include "Tempo/SystemResourceSampler.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace Tempo {

/**
 * @brief Inbound generation request
 */
struct OptimizationRequest {
    std::string session_id;                             ///< Caller session, bound to one worker
    std::string preferred_worker_id;                    ///< Optional sticky worker preference
    std::string analysis_type;                          ///< Analysis type, part of the cache key
    std::string content;                                ///< Request content, part of the cache key
    std::string prompt;                                 ///< Prompt sent to the backend on a miss
    int max_tokens = 1000;                              ///< Generation length limit
    double temperature = 0.7;                           ///< Sampling temperature
    std::string priority = "normal";                    ///< Caller priority label, logged only
    std::vector<std::string> required_tags;             ///< Any-of worker tag filter
    std::optional<std::chrono::milliseconds> timeout;   ///< Generation timeout override
    std::optional<std::chrono::milliseconds> slot_wait; ///< Slot wait override
};

/**
 * @brief Result returned to callers
 */
struct OptimizationResult {
    std::string content;                                ///< Generated or cached text
    int tokens_used = 0;                                ///< Tokens the result cost
    std::chrono::milliseconds response_time{0};         ///< End-to-end time of this call
    bool cache_hit = false;                             ///< Served from the cache
    bool optimized = false;                             ///< Cache hit, or request rewritten before dispatch
    bool cached = false;                                ///< Result was stored for future hits
    std::string session_id;
    std::string worker_id;                              ///< Worker that generated it, empty on a hit
    std::string finish_reason;                          ///< Backend finish reason, "cache" on a hit
};

/**
 * @brief Read-only roll-up composed from the other components
 */
struct PerformanceOptimizationMetrics {
    uint64_t total_requests = 0;
    uint64_t optimized_requests = 0;
    uint64_t cache_hits = 0;
    uint64_t load_balanced_requests = 0;
    uint64_t failed_requests = 0;
    double cache_hit_rate = 0.0;
    double optimization_rate = 0.0;
    size_t active_sessions = 0;
    double average_response_time_ms = 0.0;
};

/**
 * @brief Scores a generated result in [0, 1] for cache retention
 */
using QualityScorer = std::function<double(const std::string& prompt, const GenerationResult& result)>;

/**
 * @brief Entry point of the optimization layer
 *
 * Owns one MetricsRegistry, CacheStore, SessionLoadBalancer and
 * PerformanceMonitor built from the configuration. Each optimize() call
 * runs cache lookup, then on a miss waits for a worker slot, calls the
 * backend once, stores a complete result and releases the slot. Any
 * failure after the lookup releases the slot and throws an
 * OptimizationError; failed or truncated results are never cached.
 */
class RequestOptimizer {
public:
    /**
     * @brief Constructor
     * @param backend Generation backend, must not be null
     * @param config Validated eagerly
     * @param clock Time source shared with every component
     * @throws ConfigurationError on invalid configuration
     */
    RequestOptimizer(std::shared_ptr<GenerationBackend> backend,
                     const TempoConfig& config,
                     std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
    virtual ~RequestOptimizer();

    RequestOptimizer(const RequestOptimizer&) = delete;
    RequestOptimizer& operator=(const RequestOptimizer&) = delete;

    /**
     * @brief Serve one request
     * @param request Request to serve
     * @param token Cancels slot waiting and generation
     * @return Cached or generated result
     * @throws OptimizationError with the failure kind
     */
    virtual OptimizationResult optimize(const OptimizationRequest& request,
                                        const CancellationToken& token = CancellationToken());

    PerformanceOptimizationMetrics metrics() const;

    SystemPerformanceReport report() const;
    CacheStatistics cacheStatistics() const;
    LoadBalancingMetrics loadBalancingMetrics() const;

    /**
     * @brief Replace the quality scorer used before caching
     */
    void registerQualityScorer(QualityScorer scorer);

    /**
     * @brief Built-in heuristic used when no scorer is registered
     *
     * Starts at 0.5 and adds 0.2 for a response/prompt length ratio in
     * [0.5, 5], 0.2 when no apology or error wording appears and 0.1 for
     * sentence punctuation.
     */
    static double defaultQualityScore(const std::string& prompt, const GenerationResult& result);

    /**
     * @brief Insert seeds synchronously
     * @return Number of entries inserted
     */
    size_t warmCache(const std::vector<CacheSeed>& seeds);

    /**
     * @brief Start monitoring, maintenance, session cleanup and cache warm-up
     */
    void start();

    /**
     * @brief Stop every background task and wait for abandoned generations
     */
    void stop();

    bool isRunning() const { return m_running; }

    MetricsRegistry& registry() { return *m_registry; }
    CacheStore& cache() { return *m_cache; }
    SessionLoadBalancer& loadBalancer() { return *m_balancer; }
    PerformanceMonitor& monitor() { return *m_monitor; }
    const TempoConfig& config() const { return m_config; }

private:
    struct PreparedRequest {
        std::string prompt;
        int max_tokens;
        double temperature;
        bool rewritten;
    };

    void validateRequest(const OptimizationRequest& request) const;
    PreparedRequest prepareRequest(const OptimizationRequest& request) const;
    GenerationResult runGeneration(const GenerationRequest& request, const CancellationToken& token);
    double scoreQuality(const std::string& prompt, const GenerationResult& result) const;
    std::chrono::milliseconds elapsedSince(TimePoint started) const;
    void recordFailure(ErrorKind kind, const OptimizationRequest& request, TimePoint started);
    void registerCollectors();
    void abandon(std::future<void> generation);
    void reapAbandoned(bool wait);

    static std::string collapseWhitespace(const std::string& text);

    TempoConfig m_config;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<GenerationBackend> m_backend;

    std::unique_ptr<MetricsRegistry> m_registry;
    std::unique_ptr<CacheStore> m_cache;
    std::unique_ptr<SessionLoadBalancer> m_balancer;
    std::unique_ptr<PerformanceMonitor> m_monitor;
    SystemResourceSampler m_sampler;

    mutable std::mutex m_scorer_mutex;
    QualityScorer m_quality_scorer;

    std::mutex m_abandoned_mutex;
    std::vector<std::future<void>> m_abandoned;

    std::mutex m_lifecycle_mutex;
    std::atomic<bool> m_running{false};
    std::unique_ptr<std::thread> m_warm_thread;
};

} // namespace Tempo
