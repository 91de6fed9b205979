// =================================================================
// src/Tempo/ConfigLoader.cpp
// =================================================================
// Implementation for YAML configuration loading.

#include "Tempo/ConfigLoader.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <filesystem>

namespace Tempo {

namespace {

std::chrono::milliseconds readDuration(const YAML::Node& node, const std::string& key,
                                       std::chrono::milliseconds fallback) {
    if (!node[key]) {
        return fallback;
    }
    return ConfigLoader::parseDuration(node[key].as<std::string>());
}

template <typename T>
T readValue(const YAML::Node& node, const std::string& key, const T& fallback) {
    if (!node[key]) {
        return fallback;
    }
    return node[key].as<T>();
}

void parseCache(const YAML::Node& node, CacheConfig& cache) {
    cache.max_size = readValue<size_t>(node, "max_size", cache.max_size);
    cache.base_ttl = readDuration(node, "base_ttl", cache.base_ttl);
    cache.max_ttl = readDuration(node, "max_ttl", cache.max_ttl);
    cache.compression_threshold = readValue<size_t>(node, "compression_threshold", cache.compression_threshold);
    cache.compression_enabled = readValue<bool>(node, "compression_enabled", cache.compression_enabled);
    cache.shard_count = readValue<size_t>(node, "shard_count", cache.shard_count);
    cache.recency_weight = readValue<double>(node, "recency_weight", cache.recency_weight);
    cache.frequency_weight = readValue<double>(node, "frequency_weight", cache.frequency_weight);
    cache.quality_weight = readValue<double>(node, "quality_weight", cache.quality_weight);
    cache.history_weight = readValue<double>(node, "history_weight", cache.history_weight);
    cache.min_samples_for_tuning = readValue<size_t>(node, "min_samples_for_tuning", cache.min_samples_for_tuning);
    cache.maintenance_interval = readDuration(node, "maintenance_interval", cache.maintenance_interval);
}

void parseLoadBalancer(const YAML::Node& node, LoadBalancerConfig& balancer) {
    balancer.inactivity_threshold = readDuration(node, "inactivity_threshold", balancer.inactivity_threshold);
    balancer.cleanup_interval = readDuration(node, "cleanup_interval", balancer.cleanup_interval);
    balancer.shard_count = readValue<size_t>(node, "shard_count", balancer.shard_count);
    balancer.remember_affinity = readValue<bool>(node, "remember_affinity", balancer.remember_affinity);

    size_t worker_capacity = readValue<size_t>(node, "worker_capacity", 5);

    if (!node["workers"]) {
        balancer.workers = LoadBalancerConfig::defaultWorkers(worker_capacity);
        return;
    }

    balancer.workers.clear();
    for (const auto& worker_node : node["workers"]) {
        WorkerSpec spec;
        spec.id = readValue<std::string>(worker_node, "id", "");
        spec.capacity = readValue<size_t>(worker_node, "capacity", worker_capacity);
        if (worker_node["tags"]) {
            for (const auto& tag : worker_node["tags"]) {
                spec.tags.push_back(tag.as<std::string>());
            }
        }
        balancer.workers.push_back(spec);
    }
}

void parseMonitor(const YAML::Node& node, MonitorConfig& monitor) {
    monitor.monitoring_interval = readDuration(node, "interval", monitor.monitoring_interval);
    monitor.alert_cooldown = readDuration(node, "alert_cooldown", monitor.alert_cooldown);
    monitor.window.max_samples = readValue<size_t>(node, "window_size", monitor.window.max_samples);
    monitor.window.max_age = readDuration(node, "window_age", monitor.window.max_age);
    monitor.min_rate_samples = readValue<size_t>(node, "min_rate_samples", monitor.min_rate_samples);
    monitor.max_alert_history = readValue<size_t>(node, "max_alert_history", monitor.max_alert_history);

    if (node["thresholds"]) {
        const YAML::Node thresholds = node["thresholds"];
        AlertThresholds& t = monitor.thresholds;
        t.max_response_time = readDuration(thresholds, "max_response_time", t.max_response_time);
        t.min_cache_hit_rate = readValue<double>(thresholds, "min_cache_hit_rate", t.min_cache_hit_rate);
        t.max_error_rate = readValue<double>(thresholds, "max_error_rate", t.max_error_rate);
        t.max_concurrent_requests = readValue<int64_t>(thresholds, "max_concurrent_requests", t.max_concurrent_requests);
        t.max_cpu_usage = readValue<double>(thresholds, "max_cpu_usage", t.max_cpu_usage);
        t.max_memory_usage = readValue<double>(thresholds, "max_memory_usage", t.max_memory_usage);
    }
}

void parseOptimizer(const YAML::Node& node, OptimizerConfig& optimizer) {
    optimizer.default_timeout = readDuration(node, "default_timeout", optimizer.default_timeout);
    optimizer.default_slot_wait = readDuration(node, "default_slot_wait", optimizer.default_slot_wait);
    optimizer.optimize_prompts = readValue<bool>(node, "optimize_prompts", optimizer.optimize_prompts);
    optimizer.max_tokens_ceiling = readValue<int>(node, "max_tokens_ceiling", optimizer.max_tokens_ceiling);
    optimizer.clamped_max_tokens = readValue<int>(node, "clamped_max_tokens", optimizer.clamped_max_tokens);
    optimizer.temperature_ceiling = readValue<double>(node, "temperature_ceiling", optimizer.temperature_ceiling);
    optimizer.clamped_temperature = readValue<double>(node, "clamped_temperature", optimizer.clamped_temperature);
    optimizer.warm_on_start = readValue<bool>(node, "warm_on_start", optimizer.warm_on_start);
}

void parseBackend(const YAML::Node& node, BackendConfig& backend) {
    backend.server_url = readValue<std::string>(node, "server_url", backend.server_url);
    backend.model = readValue<std::string>(node, "model", backend.model);
    backend.connect_timeout = readDuration(node, "connect_timeout", backend.connect_timeout);
    backend.read_timeout = readDuration(node, "read_timeout", backend.read_timeout);
}

void parseWarmCache(const YAML::Node& node, std::vector<CacheSeed>& seeds) {
    for (const auto& seed_node : node) {
        CacheSeed seed;
        seed.analysis_type = readValue<std::string>(seed_node, "analysis_type", "");
        seed.content = readValue<std::string>(seed_node, "content", "");
        seed.result = readValue<std::string>(seed_node, "result", "");
        seed.tokens_used = readValue<int>(seed_node, "tokens_used", 0);
        seed.quality = readValue<double>(seed_node, "quality", seed.quality);
        seeds.push_back(seed);
    }
}

} // namespace

TempoConfig ConfigLoader::loadFromFile(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw ConfigurationError("configuration file not found: " + config_path);
    }

    try {
        TempoConfig config = parse(YAML::LoadFile(config_path));
        Logger::getInstance().info("ConfigLoader", "Loaded configuration", config_path);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("failed to parse " + config_path + ": " + e.what());
    }
}

TempoConfig ConfigLoader::loadFromString(const std::string& yaml_text) {
    try {
        return parse(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("failed to parse configuration: ") + e.what());
    }
}

TempoConfig ConfigLoader::parse(const YAML::Node& root) {
    TempoConfig config;
    config.load_balancer.workers = LoadBalancerConfig::defaultWorkers();

    if (root && !root.IsNull() && !root.IsMap()) {
        throw ConfigurationError("configuration root must be a mapping");
    }

    if (root["logging"]) {
        config.logging.level = readValue<std::string>(root["logging"], "level", config.logging.level);
        config.logging.log_dir = readValue<std::string>(root["logging"], "log_dir", config.logging.log_dir);
    }
    if (root["cache"]) {
        parseCache(root["cache"], config.cache);
    }
    if (root["load_balancer"]) {
        parseLoadBalancer(root["load_balancer"], config.load_balancer);
    }
    if (root["monitor"]) {
        parseMonitor(root["monitor"], config.monitor);
    }
    if (root["optimizer"]) {
        parseOptimizer(root["optimizer"], config.optimizer);
    }
    if (root["backend"]) {
        parseBackend(root["backend"], config.backend);
    }
    if (root["warm_cache"]) {
        parseWarmCache(root["warm_cache"], config.warm_cache);
    }

    config.validate();
    return config;
}

std::chrono::milliseconds ConfigLoader::parseDuration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
        pos++;
    }
    if (pos == 0) {
        throw ConfigurationError("invalid duration '" + text + "'");
    }

    double value = 0.0;
    try {
        value = std::stod(text.substr(0, pos));
    } catch (const std::exception&) {
        throw ConfigurationError("invalid duration '" + text + "'");
    }

    std::string unit = text.substr(pos);
    double multiplier = 0.0;
    if (unit.empty() || unit == "ms") {
        multiplier = 1.0;
    } else if (unit == "s") {
        multiplier = 1000.0;
    } else if (unit == "m") {
        multiplier = 60.0 * 1000.0;
    } else if (unit == "h") {
        multiplier = 60.0 * 60.0 * 1000.0;
    } else {
        throw ConfigurationError("invalid duration unit in '" + text + "'");
    }

    return std::chrono::milliseconds(static_cast<int64_t>(value * multiplier));
}

void ConfigLoader::applyLogging(const LoggingConfig& logging) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleLogLevel(Logger::parseLevel(logging.level));
    if (!logging.log_dir.empty()) {
        logger.initialize(logging.log_dir);
    }
}

} // namespace Tempo
