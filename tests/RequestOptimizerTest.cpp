// =================================================================
// tests/RequestOptimizerTest.cpp
// =================================================================
// Unit tests for RequestOptimizer component.

#include "Tempo/RequestOptimizer.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

// Blocks generation calls until opened
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered++;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_open; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_cv.notify_all();
    }

    bool waitForEntered(int count) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::seconds(5), [&] { return m_entered >= count; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_open = false;
    int m_entered = 0;
};

// Mock generation backend for testing
class MockBackend : public Tempo::GenerationBackend {
public:
    using Behavior = std::function<Tempo::GenerationResult(const Tempo::GenerationRequest&)>;

    MockBackend() {
        m_behavior = [](const Tempo::GenerationRequest& request) {
            Tempo::GenerationResult result;
            result.text = "Analysis for " + request.analysis_type + ": the outlook is stable.";
            result.tokens_used = 25;
            return result;
        };
    }

    Tempo::GenerationResult generate(const Tempo::GenerationRequest& request) override {
        Behavior behavior;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls++;
            m_last_request = request;
            behavior = m_behavior;
        }
        return behavior(request);
    }

    std::string getName() const override {
        return "mock";
    }

    void setBehavior(Behavior behavior) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_behavior = std::move(behavior);
    }

    int calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    Tempo::GenerationRequest lastRequest() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_request;
    }

private:
    mutable std::mutex m_mutex;
    Behavior m_behavior;
    int m_calls = 0;
    Tempo::GenerationRequest m_last_request;
};

} // namespace

class RequestOptimizerTest {
private:
    Tempo::TempoConfig testConfig(size_t capacity) {
        Tempo::TempoConfig config;
        config.load_balancer.workers = {{"worker-1", capacity, {"aws"}}};
        config.optimizer.default_slot_wait = std::chrono::milliseconds(100);
        config.optimizer.default_timeout = std::chrono::seconds(5);
        return config;
    }

    Tempo::OptimizationRequest makeRequest(const std::string& session, const std::string& content) {
        Tempo::OptimizationRequest request;
        request.session_id = session;
        request.analysis_type = "risk";
        request.content = content;
        request.prompt = "Assess the risk profile of " + content;
        return request;
    }

    template <typename Fn>
    Tempo::ErrorKind expectFailure(Fn&& fn) {
        try {
            fn();
        } catch (const Tempo::OptimizationError& e) {
            return e.kind();
        }
        assert(false && "Expected an OptimizationError");
        return Tempo::ErrorKind::FATAL;
    }

public:
    void testMissThenHit() {
        std::cout << "Testing cache miss followed by hit..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer optimizer(backend, testConfig(2));

        auto first = optimizer.optimize(makeRequest("s1", "Acme Corp"));
        assert(!first.cache_hit && "First request should miss");
        assert(first.cached && "Complete result should be stored");
        assert(first.worker_id == "worker-1" && "Miss should name the worker");
        assert(first.finish_reason == "stop" && "Backend finish reason should pass through");
        assert(!first.optimized && "Clean request within limits should not count as optimized");

        auto second = optimizer.optimize(makeRequest("s2", "  acme corp "));
        assert(second.cache_hit && "Normalized repeat should hit");
        assert(second.content == first.content && "Hit should return the stored text");
        assert(second.tokens_used == 25 && "Hit should return stored token usage");
        assert(second.finish_reason == "cache" && second.worker_id.empty() && "Hit should not touch a worker");
        assert(second.optimized && "Cache hits count as optimized");
        assert(backend->calls() == 1 && "Backend should be called once");

        auto metrics = optimizer.metrics();
        assert(metrics.total_requests == 2 && "Both requests should be counted");
        assert(metrics.cache_hits == 1 && "One hit should be counted");
        assert(metrics.load_balanced_requests == 1 && "Only the miss should be load balanced");
        assert(metrics.optimized_requests == 1 && "Only the hit counts as optimized");
        assert(metrics.optimization_rate == 0.5 && "Optimization rate should be optimized over total");
        assert(metrics.cache_hit_rate == 0.5 && "Hit rate should come from the cache");
        assert(metrics.failed_requests == 0 && "Nothing should fail");
        assert(metrics.active_sessions == 0 && "Slots should be released");

        auto cache_stats = optimizer.cacheStatistics();
        assert(cache_stats.size == 1 && cache_stats.hits == 1 && cache_stats.misses == 1 && "Cache should hold one entry");

        auto balancing = optimizer.loadBalancingMetrics();
        assert(balancing.total_sessions == 1 && "Only the miss should request a slot");
        assert(balancing.balanced_sessions == 1 && balancing.active_sessions == 0 && "Miss should be balanced then released");

        std::cout << "✓ Miss then hit test passed" << std::endl;
    }

    void testRequestRewriting() {
        std::cout << "Testing prompt and option rewriting..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer optimizer(backend, testConfig(2));

        auto request = makeRequest("s1", "Globex");
        request.prompt = "  Assess   the\n\nrisk of   Globex  ";
        request.max_tokens = 4000;
        request.temperature = 0.95;

        auto result = optimizer.optimize(request);
        auto sent = backend->lastRequest();
        assert(sent.prompt == "Assess the risk of Globex" && "Whitespace should be collapsed");
        assert(sent.max_tokens == 1500 && "Oversized max_tokens should be clamped");
        assert(sent.temperature == 0.7 && "High temperature should be clamped");
        assert(sent.session_id == "s1" && sent.worker_id == "worker-1" && "Backend should see the binding");
        assert(result.optimized && "Rewritten request should count as optimized");
        assert(optimizer.metrics().optimized_requests == 1 && "Rewrite should be counted");

        Tempo::TempoConfig passthrough = testConfig(2);
        passthrough.optimizer.optimize_prompts = false;
        auto plain_backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer plain(plain_backend, passthrough);
        plain.optimize(request);
        assert(plain_backend->lastRequest().max_tokens == 4000 && "Disabled rewriting should pass options through");

        std::cout << "✓ Rewriting test passed" << std::endl;
    }

    void testCapacityRejection() {
        std::cout << "Testing capacity rejection..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        auto gate = std::make_shared<Gate>();
        backend->setBehavior([gate](const Tempo::GenerationRequest&) {
            gate->wait();
            Tempo::GenerationResult result;
            result.text = "Slow but complete.";
            return result;
        });
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        std::atomic<bool> first_ok{false};
        std::thread holder([&]() {
            auto result = optimizer.optimize(makeRequest("holder", "Initech"));
            first_ok = !result.content.empty();
        });
        assert(gate->waitForEntered(1) && "First request should reach the backend");

        auto request = makeRequest("waiter", "Umbrella");
        request.slot_wait = std::chrono::milliseconds(50);
        auto kind = expectFailure([&]() { optimizer.optimize(request); });
        assert(kind == Tempo::ErrorKind::CAPACITY && "Full pool should reject with a capacity error");

        gate->open();
        holder.join();
        assert(first_ok && "Held request should complete normally");

        auto counters = optimizer.registry().counters();
        assert(counters[Tempo::MetricNames::REQUESTS_REJECTED] == 1 && "Rejection should be counted");
        assert(optimizer.metrics().failed_requests == 1 && "Rejection should count as a failure");
        assert(optimizer.metrics().active_sessions == 0 && "No binding should remain");

        std::cout << "✓ Capacity rejection test passed" << std::endl;
    }

    void testTimeoutReleasesSlot() {
        std::cout << "Testing generation timeout..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        auto gate = std::make_shared<Gate>();
        backend->setBehavior([gate](const Tempo::GenerationRequest&) {
            gate->wait();
            Tempo::GenerationResult result;
            result.text = "Too late.";
            return result;
        });
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        auto request = makeRequest("slow", "Hooli");
        request.timeout = std::chrono::milliseconds(50);

        auto started = std::chrono::steady_clock::now();
        auto kind = expectFailure([&]() { optimizer.optimize(request); });
        assert(kind == Tempo::ErrorKind::TIMEOUT && "Slow backend should time out");
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(3) && "Timeout should not wait for the backend");
        assert(optimizer.loadBalancer().activeSessionCount() == 0 && "Timed out request should release its slot");
        assert(optimizer.registry().counter(Tempo::MetricNames::REQUESTS_TIMED_OUT) == 1 && "Timeout should be counted");

        gate->open();
        backend->setBehavior([](const Tempo::GenerationRequest&) {
            Tempo::GenerationResult result;
            result.text = "Fast answer.";
            return result;
        });
        auto next = optimizer.optimize(makeRequest("next", "Pied Piper"));
        assert(next.worker_id == "worker-1" && "Freed slot should be usable again");
        assert(!optimizer.cache().contains("risk", "Hooli") && "Timed out result should never be cached");

        optimizer.stop();

        std::cout << "✓ Timeout test passed" << std::endl;
    }

    void testBackendErrorMapping() {
        std::cout << "Testing backend error mapping..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        backend->setBehavior([](const Tempo::GenerationRequest&) -> Tempo::GenerationResult {
            throw Tempo::BackendError("503 from upstream", true);
        });
        auto transient = expectFailure([&]() { optimizer.optimize(makeRequest("a", "one")); });
        assert(transient == Tempo::ErrorKind::TRANSIENT && "Transient backend errors should stay transient");

        backend->setBehavior([](const Tempo::GenerationRequest&) -> Tempo::GenerationResult {
            throw Tempo::BackendError("400 bad model", false);
        });
        auto fatal = expectFailure([&]() { optimizer.optimize(makeRequest("b", "two")); });
        assert(fatal == Tempo::ErrorKind::FATAL && "Permanent backend errors should be fatal");

        backend->setBehavior([](const Tempo::GenerationRequest&) -> Tempo::GenerationResult {
            throw std::runtime_error("socket reset");
        });
        auto unknown = expectFailure([&]() { optimizer.optimize(makeRequest("c", "three")); });
        assert(unknown == Tempo::ErrorKind::TRANSIENT && "Other exceptions should be treated as transient");

        try {
            optimizer.optimize(makeRequest("d", "four"));
            assert(false && "Expected a failure");
        } catch (const Tempo::OptimizationError& e) {
            assert(e.retryable() && "Transient failures should be retryable");
        }

        assert(optimizer.cache().size() == 0 && "Failures should never be cached");
        assert(optimizer.metrics().failed_requests == 4 && "Every failure should be counted");
        assert(optimizer.loadBalancer().activeSessionCount() == 0 && "Every slot should be released");

        std::cout << "✓ Error mapping test passed" << std::endl;
    }

    void testTruncatedResultNotCached() {
        std::cout << "Testing truncated results..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        backend->setBehavior([](const Tempo::GenerationRequest&) {
            Tempo::GenerationResult result;
            result.text = "Partial analysis that was cut";
            result.finish_reason = "length";
            return result;
        });
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        auto first = optimizer.optimize(makeRequest("s", "Soylent"));
        assert(first.finish_reason == "length" && !first.cached && "Truncated result should be returned but not cached");

        optimizer.optimize(makeRequest("s", "Soylent"));
        assert(backend->calls() == 2 && "Repeat should go back to the backend");

        std::cout << "✓ Truncated result test passed" << std::endl;
    }

    void testCancellation() {
        std::cout << "Testing cancellation..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        auto gate = std::make_shared<Gate>();
        backend->setBehavior([gate](const Tempo::GenerationRequest&) {
            gate->wait();
            return Tempo::GenerationResult{"Ignored.", 1, "stop"};
        });
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        Tempo::CancellationSource before;
        before.cancel();
        auto early = expectFailure([&]() { optimizer.optimize(makeRequest("early", "x"), before.token()); });
        assert(early == Tempo::ErrorKind::CANCELLED && "Pre-cancelled request should fail fast");
        assert(backend->calls() == 0 && "Pre-cancelled request should not reach the backend");

        Tempo::CancellationSource during;
        std::thread canceller([&]() {
            gate->waitForEntered(1);
            during.cancel();
        });
        auto late = expectFailure([&]() { optimizer.optimize(makeRequest("late", "y"), during.token()); });
        canceller.join();

        assert(late == Tempo::ErrorKind::CANCELLED && "Cancel during generation should surface");
        assert(optimizer.loadBalancer().activeSessionCount() == 0 && "Cancelled request should release its slot");
        assert(optimizer.registry().counter(Tempo::MetricNames::REQUESTS_CANCELLED) == 2 && "Both cancellations should be counted");

        gate->open();
        optimizer.stop();

        std::cout << "✓ Cancellation test passed" << std::endl;
    }

    void testInvalidRequests() {
        std::cout << "Testing request validation..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        auto no_session = makeRequest("", "x");
        assert(expectFailure([&]() { optimizer.optimize(no_session); }) == Tempo::ErrorKind::INVALID_REQUEST &&
               "Missing session should be invalid");

        auto bad_tokens = makeRequest("s", "x");
        bad_tokens.max_tokens = 0;
        assert(expectFailure([&]() { optimizer.optimize(bad_tokens); }) == Tempo::ErrorKind::INVALID_REQUEST &&
               "Non-positive max_tokens should be invalid");

        auto bad_timeout = makeRequest("s", "x");
        bad_timeout.timeout = std::chrono::milliseconds(0);
        assert(expectFailure([&]() { optimizer.optimize(bad_timeout); }) == Tempo::ErrorKind::INVALID_REQUEST &&
               "Zero timeout should be invalid");

        assert(backend->calls() == 0 && "Invalid requests should not reach the backend");

        bool threw = false;
        try {
            Tempo::RequestOptimizer broken(nullptr, testConfig(1));
        } catch (const Tempo::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Missing backend should be a configuration error");

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testQualityScoring() {
        std::cout << "Testing quality scoring..." << std::endl;

        Tempo::GenerationResult good{"The exposure is limited.", 5, "stop"};
        double high = Tempo::RequestOptimizer::defaultQualityScore("Assess the exposure", good);
        assert(std::abs(high - 1.0) < 1e-9 && "Well-formed answer should score full marks");

        Tempo::GenerationResult apology{"sorry", 1, "stop"};
        double low = Tempo::RequestOptimizer::defaultQualityScore("Assess the exposure of the portfolio", apology);
        assert(low == 0.5 && "Short apology should keep only the base score");
        assert(Tempo::RequestOptimizer::defaultQualityScore("x", Tempo::GenerationResult{"", 0, "stop"}) == 0.0 &&
               "Empty answer should score zero");

        auto backend = std::make_shared<MockBackend>();
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));
        optimizer.registerQualityScorer([](const std::string&, const Tempo::GenerationResult&) { return 7.0; });
        optimizer.optimize(makeRequest("s", "clamped"));

        optimizer.registerQualityScorer([](const std::string&, const Tempo::GenerationResult&) -> double {
            throw std::runtime_error("scorer down");
        });
        optimizer.optimize(makeRequest("s", "fallback"));

        for (const auto& entry : optimizer.cache().entries()) {
            assert(entry.quality >= 0.0 && entry.quality <= 1.0 && "Stored quality should be clamped");
        }
        assert(optimizer.cache().size() == 2 && "Both results should be cached");

        std::cout << "✓ Quality scoring test passed" << std::endl;
    }

    void testSameSessionConcurrency() {
        std::cout << "Testing concurrent requests on one session..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        auto gate = std::make_shared<Gate>();
        backend->setBehavior([gate](const Tempo::GenerationRequest& request) {
            gate->wait();
            return Tempo::GenerationResult{"Answer for " + request.prompt + ".", 3, "stop"};
        });
        Tempo::RequestOptimizer optimizer(backend, testConfig(1));

        std::thread first([&]() { optimizer.optimize(makeRequest("shared", "alpha")); });
        std::thread second([&]() { optimizer.optimize(makeRequest("shared", "beta")); });
        assert(gate->waitForEntered(2) && "Both requests should share the session's slot");

        auto binding = optimizer.loadBalancer().binding("shared");
        assert(binding && binding->in_flight == 2 && "Binding should carry both requests");

        gate->open();
        first.join();
        second.join();

        assert(optimizer.loadBalancer().activeSessionCount() == 0 && "Binding should be released after both finish");
        assert(optimizer.cache().size() == 2 && "Both results should be cached");

        std::cout << "✓ Same session concurrency test passed" << std::endl;
    }

    void testLifecycleAndWarmup() {
        std::cout << "Testing start, warm-up and stop..." << std::endl;

        auto backend = std::make_shared<MockBackend>();
        Tempo::TempoConfig config = testConfig(2);
        config.warm_cache = {{"risk", "Warm Co", "Pre-computed risk answer.", 12, 0.9}};
        Tempo::RequestOptimizer optimizer(backend, config);

        optimizer.start();
        assert(optimizer.isRunning() && "Optimizer should report running");
        assert(optimizer.monitor().isMonitoring() && "Monitoring should start with the optimizer");

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!optimizer.cache().contains("risk", "Warm Co") && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        auto result = optimizer.optimize(makeRequest("s", "warm co"));
        assert(result.cache_hit && result.content == "Pre-computed risk answer." && "Warmed entry should serve hits");
        assert(backend->calls() == 0 && "Warm hit should not reach the backend");

        optimizer.monitor().runMonitoringCycle();
        auto report = optimizer.report();
        assert(report.cache && report.cache->hits == 1 && "Cache collector should feed the report");
        assert(report.system && "System collector should feed the report");

        optimizer.stop();
        assert(!optimizer.isRunning() && "Optimizer should report stopped");
        assert(!optimizer.monitor().isMonitoring() && "Monitoring should stop with the optimizer");

        std::cout << "✓ Lifecycle test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RequestOptimizer unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testMissThenHit();
        std::cout << std::endl;

        testRequestRewriting();
        std::cout << std::endl;

        testCapacityRejection();
        std::cout << std::endl;

        testTimeoutReleasesSlot();
        std::cout << std::endl;

        testBackendErrorMapping();
        std::cout << std::endl;

        testTruncatedResultNotCached();
        std::cout << std::endl;

        testCancellation();
        std::cout << std::endl;

        testInvalidRequests();
        std::cout << std::endl;

        testQualityScoring();
        std::cout << std::endl;

        testSameSessionConcurrency();
        std::cout << std::endl;

        testLifecycleAndWarmup();
        std::cout << std::endl;

        std::cout << "All RequestOptimizer tests passed!" << std::endl;
    }
};

int main() {
    try {
        RequestOptimizerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All RequestOptimizer component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
