// =================================================================
// src/Tempo/RequestOptimizer.cpp
// =================================================================
// Implementation for the request optimization pipeline.

#include "Tempo/RequestOptimizer.hpp"
#include "Tempo/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <condition_variable>
#include <sstream>
#include <stdexcept>

namespace Tempo {

namespace {

// Keeps the in-flight gauge balanced on every exit path
class InFlightGuard {
public:
    explicit InFlightGuard(MetricsRegistry& registry) : m_registry(registry) { m_registry.beginRequest(); }
    ~InFlightGuard() { m_registry.endRequest(); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    MetricsRegistry& m_registry;
};

// Releases a held worker slot unless released explicitly first
class SlotGuard {
public:
    SlotGuard(SessionLoadBalancer& balancer, std::string session_id, uint64_t binding_id)
        : m_balancer(balancer), m_session_id(std::move(session_id)), m_binding_id(binding_id) {}
    ~SlotGuard() { release(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

    void release() {
        if (m_held) {
            m_held = false;
            m_balancer.release(m_session_id, m_binding_id);
        }
    }

private:
    SessionLoadBalancer& m_balancer;
    std::string m_session_id;
    uint64_t m_binding_id;
    bool m_held = true;
};

// Shared between the caller and the generation task, which may outlive the call
struct GenerationCall {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<GenerationResult> result;
    std::exception_ptr error;
};

} // namespace

RequestOptimizer::RequestOptimizer(std::shared_ptr<GenerationBackend> backend,
                                   const TempoConfig& config,
                                   std::shared_ptr<Clock> clock)
    : m_config(config), m_clock(std::move(clock)), m_backend(std::move(backend)) {
    if (!m_backend) {
        throw ConfigurationError("RequestOptimizer requires a generation backend");
    }
    if (!m_clock) {
        throw ConfigurationError("RequestOptimizer requires a clock");
    }
    m_config.validate();

    m_registry = std::make_unique<MetricsRegistry>(*m_clock, m_config.monitor.window);
    m_cache = std::make_unique<CacheStore>(m_config.cache, *m_clock);
    m_balancer = std::make_unique<SessionLoadBalancer>(m_config.load_balancer, *m_clock);
    m_monitor = std::make_unique<PerformanceMonitor>(*m_registry, m_config.monitor, *m_clock);
    registerCollectors();

    Logger::getInstance().info("RequestOptimizer", "Optimization layer initialized",
                               "Backend: " + m_backend->getName());
}

RequestOptimizer::~RequestOptimizer() {
    stop();
}

void RequestOptimizer::registerCollectors() {
    m_monitor->registerCollector("cache", [this](PerformanceMonitor& monitor) {
        CacheStatistics statistics = m_cache->stats();
        monitor.recordCacheMetrics(statistics.hits, statistics.misses, statistics.size,
                                   statistics.evictions, statistics.average_age_seconds);
    });

    m_monitor->registerCollector("system", [this](PerformanceMonitor& monitor) {
        ResourceUsage usage = m_sampler.sample();
        monitor.recordSystemMetrics(usage.cpu_usage, usage.memory_usage,
                                    m_balancer->metrics().total_workers, usage.resident_bytes, 0.0);
    });
}

OptimizationResult RequestOptimizer::optimize(const OptimizationRequest& request, const CancellationToken& token) {
    validateRequest(request);

    TimePoint started = m_clock->now();
    InFlightGuard in_flight(*m_registry);

    if (token.isCancelled()) {
        recordFailure(ErrorKind::CANCELLED, request, started);
        throw OptimizationError(ErrorKind::CANCELLED, "request cancelled before cache lookup");
    }

    // CACHE_LOOKUP
    std::optional<CacheEntry> cached = m_cache->lookup(request.analysis_type, request.content);
    if (cached) {
        m_registry->increment(MetricNames::CACHE_HITS);
        m_registry->increment(MetricNames::REQUESTS_OPTIMIZED);

        OptimizationResult result;
        result.content = cached->content;
        result.tokens_used = cached->tokens_used;
        result.response_time = elapsedSince(started);
        result.cache_hit = true;
        result.optimized = true;
        result.cached = true;
        result.session_id = request.session_id;
        result.finish_reason = "cache";

        m_registry->recordRequest(true, m_clock->now() - started);
        Logger::getInstance().logRequestOutcome(request.session_id, true, result.response_time.count(), true);
        return result;
    }
    m_registry->increment(MetricNames::CACHE_MISSES);

    PreparedRequest prepared = prepareRequest(request);

    // AWAIT_SLOT
    auto slot_wait = request.slot_wait.value_or(m_config.optimizer.default_slot_wait);
    AssignmentResult assignment = m_balancer->assignWaiting(request.session_id, request.preferred_worker_id,
                                                            request.required_tags,
                                                            SteadyClock::now() + slot_wait, token);
    if (assignment.status == AssignmentStatus::CANCELLED) {
        recordFailure(ErrorKind::CANCELLED, request, started);
        throw OptimizationError(ErrorKind::CANCELLED, "request cancelled while waiting for a worker slot");
    }
    if (!assignment.assigned()) {
        m_registry->increment(MetricNames::REQUESTS_REJECTED);
        recordFailure(ErrorKind::CAPACITY, request, started);
        throw OptimizationError(ErrorKind::CAPACITY,
                                "no worker slot available within " + std::to_string(slot_wait.count()) + "ms");
    }
    m_registry->increment(MetricNames::REQUESTS_LOAD_BALANCED);
    SlotGuard slot(*m_balancer, request.session_id, assignment.binding_id);

    // GENERATE
    GenerationRequest generation;
    generation.prompt = prepared.prompt;
    generation.analysis_type = request.analysis_type;
    generation.session_id = request.session_id;
    generation.worker_id = assignment.worker_id;
    generation.max_tokens = prepared.max_tokens;
    generation.temperature = prepared.temperature;
    generation.deadline = SteadyClock::now() + request.timeout.value_or(m_config.optimizer.default_timeout);
    generation.cancellation = token;

    GenerationResult generated;
    try {
        generated = runGeneration(generation, token);
    } catch (const OptimizationError& e) {
        slot.release();
        recordFailure(e.kind(), request, started);
        throw;
    }

    // STORE
    bool stored = false;
    if (generated.finish_reason == "stop" && !generated.text.empty()) {
        double quality = scoreQuality(prepared.prompt, generated);
        m_cache->store(request.analysis_type, request.content, generated.text, generated.tokens_used, quality);
        stored = true;
    } else {
        Logger::getInstance().debug("RequestOptimizer", "Result not cached",
                                    "Finish reason: " + generated.finish_reason);
    }

    // RELEASE_SLOT
    slot.release();

    if (prepared.rewritten) {
        m_registry->increment(MetricNames::REQUESTS_OPTIMIZED);
    }

    OptimizationResult result;
    result.content = generated.text;
    result.tokens_used = generated.tokens_used;
    result.response_time = elapsedSince(started);
    result.cache_hit = false;
    result.optimized = prepared.rewritten;
    result.cached = stored;
    result.session_id = request.session_id;
    result.worker_id = assignment.worker_id;
    result.finish_reason = generated.finish_reason;

    m_registry->recordRequest(true, m_clock->now() - started);
    Logger::getInstance().logRequestOutcome(request.session_id, false, result.response_time.count(), true);
    return result;
}

void RequestOptimizer::validateRequest(const OptimizationRequest& request) const {
    if (request.session_id.empty()) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "session_id must not be empty");
    }
    if (request.analysis_type.empty()) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "analysis_type must not be empty");
    }
    if (request.content.empty() && request.prompt.empty()) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "content or prompt is required");
    }
    if (request.max_tokens <= 0) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "max_tokens must be positive");
    }
    if (std::isnan(request.temperature) || request.temperature < 0.0) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "temperature must not be negative");
    }
    if (request.timeout && request.timeout->count() <= 0) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "timeout must be positive");
    }
    if (request.slot_wait && request.slot_wait->count() < 0) {
        throw OptimizationError(ErrorKind::INVALID_REQUEST, "slot_wait must not be negative");
    }
}

std::string RequestOptimizer::collapseWhitespace(const std::string& text) {
    std::string collapsed;
    collapsed.reserve(text.size());

    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(static_cast<char>(c));
    }
    return collapsed;
}

RequestOptimizer::PreparedRequest RequestOptimizer::prepareRequest(const OptimizationRequest& request) const {
    PreparedRequest prepared{request.prompt.empty() ? request.content : request.prompt,
                             request.max_tokens, request.temperature, false};

    const OptimizerConfig& options = m_config.optimizer;
    if (!options.optimize_prompts) {
        return prepared;
    }

    std::string collapsed = collapseWhitespace(prepared.prompt);
    if (collapsed != prepared.prompt) {
        prepared.prompt = std::move(collapsed);
        prepared.rewritten = true;
    }
    if (prepared.max_tokens > options.max_tokens_ceiling) {
        prepared.max_tokens = options.clamped_max_tokens;
        prepared.rewritten = true;
    }
    if (prepared.temperature > options.temperature_ceiling) {
        prepared.temperature = options.clamped_temperature;
        prepared.rewritten = true;
    }

    if (prepared.rewritten) {
        std::ostringstream context;
        context << "Session: " << request.session_id << ", ";
        context << "Max tokens: " << request.max_tokens << " -> " << prepared.max_tokens << ", ";
        context << "Temperature: " << request.temperature << " -> " << prepared.temperature;
        Logger::getInstance().debug("RequestOptimizer", "Request rewritten before dispatch", context.str());
    }
    return prepared;
}

GenerationResult RequestOptimizer::runGeneration(const GenerationRequest& request, const CancellationToken& token) {
    reapAbandoned(false);

    auto call = std::make_shared<GenerationCall>();
    std::shared_ptr<GenerationBackend> backend = m_backend;

    std::future<void> task = std::async(std::launch::async, [backend, call, request] {
        std::optional<GenerationResult> result;
        std::exception_ptr error;
        try {
            result = backend->generate(request);
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(call->mutex);
            call->result = std::move(result);
            call->error = error;
            call->done = true;
        }
        call->cv.notify_all();
    });

    CancellationRegistration registration = token.onCancel([call] {
        std::lock_guard<std::mutex> lock(call->mutex);
        call->cv.notify_all();
    });

    std::unique_lock<std::mutex> lock(call->mutex);
    call->cv.wait_until(lock, request.deadline, [&] { return call->done || token.isCancelled(); });

    if (!call->done) {
        lock.unlock();
        abandon(std::move(task));
        if (token.isCancelled()) {
            throw OptimizationError(ErrorKind::CANCELLED, "request cancelled during generation");
        }
        throw OptimizationError(ErrorKind::TIMEOUT, "generation did not finish before the deadline");
    }

    std::exception_ptr error = call->error;
    std::optional<GenerationResult> result = std::move(call->result);
    lock.unlock();
    task.get();

    if (error) {
        try {
            std::rethrow_exception(error);
        } catch (const OptimizationError&) {
            throw;
        } catch (const BackendError& e) {
            throw OptimizationError(e.transient() ? ErrorKind::TRANSIENT : ErrorKind::FATAL, e.what());
        } catch (const std::exception& e) {
            throw OptimizationError(ErrorKind::TRANSIENT, e.what());
        } catch (...) {
            throw OptimizationError(ErrorKind::FATAL, "generation backend raised a non-standard exception");
        }
    }
    if (!result) {
        throw OptimizationError(ErrorKind::FATAL, "generation backend returned no result");
    }
    return *result;
}

double RequestOptimizer::defaultQualityScore(const std::string& prompt, const GenerationResult& result) {
    const std::string& response = result.text;
    if (response.empty()) {
        return 0.0;
    }

    double score = 0.5;

    // Length appropriateness (not too short, not too long)
    if (!prompt.empty()) {
        double length_ratio = static_cast<double>(response.length()) / prompt.length();
        if (length_ratio >= 0.5 && length_ratio <= 5.0) {
            score += 0.2;
        }
    }

    std::string lower_response = response;
    std::transform(lower_response.begin(), lower_response.end(), lower_response.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_response.find("error") == std::string::npos &&
        lower_response.find("sorry") == std::string::npos &&
        lower_response.find("unable") == std::string::npos) {
        score += 0.2;
    }

    size_t sentence_count = std::count(response.begin(), response.end(), '.') +
                            std::count(response.begin(), response.end(), '!') +
                            std::count(response.begin(), response.end(), '?');
    if (sentence_count > 0) {
        score += 0.1;
    }

    return std::min(1.0, score);
}

double RequestOptimizer::scoreQuality(const std::string& prompt, const GenerationResult& result) const {
    QualityScorer scorer;
    {
        std::lock_guard<std::mutex> lock(m_scorer_mutex);
        scorer = m_quality_scorer;
    }
    if (!scorer) {
        return defaultQualityScore(prompt, result);
    }

    double score = 0.0;
    try {
        score = scorer(prompt, result);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("RequestOptimizer", "Quality scorer failed, using default", e.what());
        return defaultQualityScore(prompt, result);
    }
    if (std::isnan(score)) {
        return defaultQualityScore(prompt, result);
    }
    return std::clamp(score, 0.0, 1.0);
}

void RequestOptimizer::registerQualityScorer(QualityScorer scorer) {
    std::lock_guard<std::mutex> lock(m_scorer_mutex);
    m_quality_scorer = std::move(scorer);
}

std::chrono::milliseconds RequestOptimizer::elapsedSince(TimePoint started) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(m_clock->now() - started);
}

void RequestOptimizer::recordFailure(ErrorKind kind, const OptimizationRequest& request, TimePoint started) {
    if (kind == ErrorKind::TIMEOUT) {
        m_registry->increment(MetricNames::REQUESTS_TIMED_OUT);
    } else if (kind == ErrorKind::CANCELLED) {
        m_registry->increment(MetricNames::REQUESTS_CANCELLED);
    }
    m_registry->recordRequest(false, m_clock->now() - started);

    Logger::getInstance().logRequestOutcome(request.session_id, false, elapsedSince(started).count(), false);
    Logger::getInstance().debug("RequestOptimizer", "Request failed", errorKindName(kind));
}

void RequestOptimizer::abandon(std::future<void> generation) {
    std::lock_guard<std::mutex> lock(m_abandoned_mutex);
    m_abandoned.push_back(std::move(generation));
    Logger::getInstance().warning("RequestOptimizer", "Abandoned a generation still in progress",
                                  "Pending: " + std::to_string(m_abandoned.size()));
}

void RequestOptimizer::reapAbandoned(bool wait) {
    std::vector<std::future<void>> finished;
    {
        std::lock_guard<std::mutex> lock(m_abandoned_mutex);
        auto split = std::partition(m_abandoned.begin(), m_abandoned.end(), [wait](std::future<void>& f) {
            return !wait && f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        for (auto it = split; it != m_abandoned.end(); ++it) {
            finished.push_back(std::move(*it));
        }
        m_abandoned.erase(split, m_abandoned.end());
    }

    // Joins happen outside the lock; get() cannot throw, the task stores its own errors
    for (auto& generation : finished) {
        generation.get();
    }
}

PerformanceOptimizationMetrics RequestOptimizer::metrics() const {
    PerformanceOptimizationMetrics metrics;
    metrics.total_requests = m_registry->counter(MetricNames::REQUESTS_TOTAL);
    metrics.optimized_requests = m_registry->counter(MetricNames::REQUESTS_OPTIMIZED);
    metrics.cache_hits = m_registry->counter(MetricNames::CACHE_HITS);
    metrics.load_balanced_requests = m_registry->counter(MetricNames::REQUESTS_LOAD_BALANCED);
    metrics.failed_requests = m_registry->counter(MetricNames::REQUESTS_FAILED);
    metrics.cache_hit_rate = m_cache->stats().hit_rate;
    metrics.active_sessions = m_balancer->activeSessionCount();
    metrics.average_response_time_ms = m_registry->latencyMetrics().mean_ms;

    if (metrics.total_requests > 0) {
        metrics.optimization_rate = static_cast<double>(metrics.optimized_requests) / metrics.total_requests;
    }
    return metrics;
}

SystemPerformanceReport RequestOptimizer::report() const {
    return m_monitor->report();
}

CacheStatistics RequestOptimizer::cacheStatistics() const {
    return m_cache->stats();
}

LoadBalancingMetrics RequestOptimizer::loadBalancingMetrics() const {
    return m_balancer->metrics();
}

size_t RequestOptimizer::warmCache(const std::vector<CacheSeed>& seeds) {
    return m_cache->warm(seeds);
}

void RequestOptimizer::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running) {
        return;
    }

    m_monitor->startMonitoring();
    m_cache->startMaintenance();
    m_balancer->startCleanup();

    if (m_config.optimizer.warm_on_start && !m_config.warm_cache.empty()) {
        m_warm_thread = std::make_unique<std::thread>([this] {
            try {
                m_cache->warm(m_config.warm_cache);
            } catch (const std::exception& e) {
                Logger::getInstance().error("RequestOptimizer", "Cache warm-up failed", e.what());
            }
        });
    }

    m_running = true;
    Logger::getInstance().info("RequestOptimizer", "Optimization layer started");
}

void RequestOptimizer::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);

    if (m_monitor) {
        m_monitor->stopMonitoring();
    }
    if (m_balancer) {
        m_balancer->stopCleanup();
    }
    if (m_cache) {
        m_cache->stopMaintenance();
    }
    if (m_warm_thread && m_warm_thread->joinable()) {
        m_warm_thread->join();
    }
    m_warm_thread.reset();
    reapAbandoned(true);

    if (m_running.exchange(false)) {
        Logger::getInstance().info("RequestOptimizer", "Optimization layer stopped");
    }
}

} // namespace Tempo
