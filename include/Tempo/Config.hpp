// =================================================================
// include/Tempo/Config.hpp
// =================================================================
// Aggregate configuration for every Tempo component.

#pragma once

#include "Tempo/CacheStore.hpp"
#include "Tempo/HttpGenerationBackend.hpp"
#include "Tempo/PerformanceMonitor.hpp"
#include "Tempo/SessionLoadBalancer.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace Tempo {

/**
 * @brief Request optimizer configuration
 */
struct OptimizerConfig {
    std::chrono::milliseconds default_timeout{30000};   ///< Generation timeout when a request sets none
    std::chrono::milliseconds default_slot_wait{5000};  ///< Time to wait for a worker slot when a request sets none
    bool optimize_prompts = true;                       ///< Rewrite prompts and sampling options
    int max_tokens_ceiling = 2000;                      ///< max_tokens above this is clamped
    int clamped_max_tokens = 1500;                      ///< Value used when clamping max_tokens
    double temperature_ceiling = 0.8;                   ///< Temperature above this is clamped
    double clamped_temperature = 0.7;                   ///< Value used when clamping temperature
    bool warm_on_start = true;                          ///< Warm the cache in the background on start()

    /**
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";                         ///< Minimum console level
    std::string log_dir;                                ///< Rotating file output, empty to disable
};

/**
 * @brief Complete configuration of an optimization layer instance
 */
struct TempoConfig {
    CacheConfig cache;
    LoadBalancerConfig load_balancer;
    MonitorConfig monitor;
    OptimizerConfig optimizer;
    BackendConfig backend;
    LoggingConfig logging;
    std::vector<CacheSeed> warm_cache;                  ///< Seeds loaded on start()

    /**
     * @brief Validate every section
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

} // namespace Tempo
