// =================================================================
// src/Tempo/Core.cpp
// =================================================================
// Implementation for the command-line application logic.

#include "Tempo/Core.hpp"
#include "Tempo/ConfigLoader.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/HttpGenerationBackend.hpp"
#include "Tempo/Logger.hpp"
#include "nlohmann/json.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Tempo {

namespace {

nlohmann::json resultToJson(const OptimizationResult& result) {
    return {
        {"content", result.content},
        {"tokens_used", result.tokens_used},
        {"response_time_ms", result.response_time.count()},
        {"cache_hit", result.cache_hit},
        {"optimized", result.optimized},
        {"cached", result.cached},
        {"session_id", result.session_id},
        {"worker_id", result.worker_id},
        {"finish_reason", result.finish_reason}
    };
}

nlohmann::json metricsToJson(const PerformanceOptimizationMetrics& metrics) {
    return {
        {"total_requests", metrics.total_requests},
        {"optimized_requests", metrics.optimized_requests},
        {"cache_hits", metrics.cache_hits},
        {"load_balanced_requests", metrics.load_balanced_requests},
        {"failed_requests", metrics.failed_requests},
        {"cache_hit_rate", metrics.cache_hit_rate},
        {"optimization_rate", metrics.optimization_rate},
        {"active_sessions", metrics.active_sessions},
        {"average_response_time_ms", metrics.average_response_time_ms}
    };
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands)
{
}

int Core::run() {
    if (m_commands.active_command == "validate") {
        return handleValidate();
    } else if (m_commands.active_command == "generate") {
        return handleGenerate();
    } else if (m_commands.active_command == "replay") {
        return handleReplay();
    }

    std::cerr << "No command specified. Use --help for usage." << std::endl;
    return 1;
}

TempoConfig Core::loadConfig(bool required) const {
    TempoConfig config;
    if (!required && !std::filesystem::exists(m_commands.config_path)) {
        Logger::getInstance().warning("Core", "Configuration file not found, using defaults",
                                      m_commands.config_path);
        config.load_balancer.workers = LoadBalancerConfig::defaultWorkers();
        config.validate();
    } else {
        config = ConfigLoader::loadFromFile(m_commands.config_path);
    }

    if (!m_commands.log_level.empty()) {
        config.logging.level = m_commands.log_level;
    }
    ConfigLoader::applyLogging(config.logging);
    return config;
}

int Core::handleValidate() {
    TempoConfig config;
    try {
        config = loadConfig(true);
    } catch (const ConfigurationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    size_t total_capacity = 0;
    for (const auto& worker : config.load_balancer.workers) {
        total_capacity += worker.capacity;
    }

    std::cout << "Configuration OK: " << m_commands.config_path << std::endl;
    std::cout << "  cache:         max_size=" << config.cache.max_size
              << " base_ttl=" << config.cache.base_ttl.count() << "ms"
              << " max_ttl=" << config.cache.max_ttl.count() << "ms"
              << " compression=" << (config.cache.compression_enabled ? "on" : "off") << std::endl;
    std::cout << "  load_balancer: workers=" << config.load_balancer.workers.size()
              << " total_capacity=" << total_capacity
              << " inactivity=" << config.load_balancer.inactivity_threshold.count() << "ms" << std::endl;
    std::cout << "  monitor:       interval=" << config.monitor.monitoring_interval.count() << "ms"
              << " cooldown=" << config.monitor.alert_cooldown.count() << "ms" << std::endl;
    std::cout << "  backend:       " << config.backend.server_url
              << " model=" << config.backend.model << std::endl;
    std::cout << "  warm_cache:    " << config.warm_cache.size() << " seed(s)" << std::endl;
    return 0;
}

int Core::handleGenerate() {
    TempoConfig config = loadConfig(false);

    auto backend = std::make_shared<HttpGenerationBackend>(config.backend);
    if (!backend->isHealthy()) {
        Logger::getInstance().warning("Core", "Backend did not answer the health check",
                                      config.backend.server_url);
    }

    RequestOptimizer optimizer(backend, config);
    optimizer.warmCache(config.warm_cache);

    OptimizationRequest request;
    request.session_id = m_commands.session_id;
    request.analysis_type = m_commands.analysis_type;
    request.content = m_commands.content;
    request.prompt = m_commands.prompt.empty() ? m_commands.content : m_commands.prompt;
    request.max_tokens = m_commands.max_tokens;
    request.temperature = m_commands.temperature;

    try {
        OptimizationResult result = optimizer.optimize(request);
        std::cout << resultToJson(result).dump(2) << std::endl;
    } catch (const OptimizationError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

OptimizationRequest Core::parseReplayLine(const std::string& line, size_t line_number) {
    const std::string where = "line " + std::to_string(line_number) + ": ";

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(where + e.what());
    }
    if (!json.is_object()) {
        throw std::invalid_argument(where + "expected a JSON object");
    }

    try {
        OptimizationRequest request;
        request.analysis_type = json.at("analysis_type").get<std::string>();
        request.content = json.at("content").get<std::string>();
        request.prompt = json.value("prompt", request.content);
        request.session_id = json.value("session_id", "replay-" + std::to_string(line_number));
        request.preferred_worker_id = json.value("preferred_worker_id", "");
        request.max_tokens = json.value("max_tokens", request.max_tokens);
        request.temperature = json.value("temperature", request.temperature);
        request.priority = json.value("priority", request.priority);
        if (json.contains("required_tags")) {
            request.required_tags = json["required_tags"].get<std::vector<std::string>>();
        }
        if (json.contains("timeout_ms")) {
            request.timeout = std::chrono::milliseconds(json["timeout_ms"].get<int64_t>());
        }
        return request;
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(where + e.what());
    }
}

int Core::handleReplay() {
    TempoConfig config = loadConfig(false);

    std::ifstream input(m_commands.requests_file);
    if (!input) {
        std::cerr << "[ERROR] Cannot open " << m_commands.requests_file << std::endl;
        return 1;
    }

    std::vector<OptimizationRequest> requests;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            requests.push_back(parseReplayLine(line, line_number));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[ERROR] " << e.what() << std::endl;
            return 1;
        }
    }

    auto backend = std::make_shared<HttpGenerationBackend>(config.backend);
    RequestOptimizer optimizer(backend, config);
    optimizer.warmCache(config.warm_cache);

    ReplaySummary outcome = replayRequests(optimizer, requests, m_commands.concurrency);

    std::vector<PerformanceAlert> alerts = optimizer.monitor().runMonitoringCycle();

    nlohmann::json summary;
    summary["requests"] = requests.size();
    summary["succeeded"] = outcome.succeeded;
    summary["failed"] = outcome.failures;
    summary["metrics"] = metricsToJson(optimizer.metrics());
    summary["report"] = nlohmann::json::parse(PerformanceMonitor::reportToJson(optimizer.report()));
    summary["alerts"] = nlohmann::json::array();
    for (const auto& alert : alerts) {
        summary["alerts"].push_back(nlohmann::json::parse(PerformanceMonitor::alertToJson(alert)));
    }
    std::cout << summary.dump(2) << std::endl;

    return outcome.failures.empty() ? 0 : 2;
}

ReplaySummary Core::replayRequests(RequestOptimizer& optimizer,
                                   const std::vector<OptimizationRequest>& requests,
                                   size_t concurrency) {
    std::atomic<size_t> next{0};
    std::mutex outcome_mutex;
    ReplaySummary outcome;

    auto worker = [&]() {
        for (size_t i = next++; i < requests.size(); i = next++) {
            std::string failure;
            try {
                optimizer.optimize(requests[i]);
            } catch (const OptimizationError& e) {
                Logger::getInstance().warning("Core", "Replayed request failed", e.what());
                failure = errorKindName(e.kind());
            } catch (const std::exception& e) {
                Logger::getInstance().error("Core", "Replayed request failed unexpectedly", e.what());
                failure = errorKindName(ErrorKind::FATAL);
            }

            std::lock_guard<std::mutex> lock(outcome_mutex);
            if (failure.empty()) {
                outcome.succeeded++;
            } else {
                outcome.failures[failure]++;
            }
        }
    };

    size_t thread_count = std::min(std::max<size_t>(concurrency, 1), std::max<size_t>(requests.size(), 1));
    std::vector<std::thread> threads;
    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return outcome;
}

} // namespace Tempo
