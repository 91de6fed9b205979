// =================================================================
// tests/PerformanceMonitorTest.cpp
// =================================================================
// Unit tests for PerformanceMonitor component.

#include "Tempo/PerformanceMonitor.hpp"
#include "Tempo/Errors.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <vector>

class PerformanceMonitorTest {
private:
    Tempo::MonitorConfig quietConfig() {
        Tempo::MonitorConfig config;
        config.min_rate_samples = 10;
        config.alert_cooldown = std::chrono::minutes(5);
        return config;
    }

public:
    void testCacheAlertCooldown() {
        std::cout << "Testing cache hit rate alert with cooldown..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        Tempo::AlertThresholds thresholds;
        thresholds.min_cache_hit_rate = 0.5;
        monitor.setThresholds(thresholds);

        std::vector<Tempo::PerformanceAlert> received;
        monitor.registerAlertHandler("capture", [&received](const Tempo::PerformanceAlert& alert) {
            received.push_back(alert);
        });

        monitor.recordCacheMetrics(30, 70, 10, 0, 1.0);
        auto first = monitor.runMonitoringCycle();

        clock.advance(std::chrono::seconds(30));
        monitor.recordCacheMetrics(60, 140, 12, 0, 2.0);
        auto second = monitor.runMonitoringCycle();

        assert(first.size() == 1 && "First low hit rate tick should alert");
        assert(second.empty() && "Second tick within the cooldown should be suppressed");
        assert(received.size() == 1 && "Handler should see exactly one alert");
        assert(received[0].type == Tempo::AlertType::CACHE_HIT_RATE && "Alert should be a cache alert");
        assert(received[0].severity == Tempo::AlertSeverity::WARNING && "Cache alerts are warnings");
        assert(received[0].metric == "cache_hit_rate" && "Metric name should be reported");
        assert(std::abs(received[0].value - 0.3) < 1e-9 && "Alert should carry the observed rate");
        assert(received[0].threshold == 0.5 && "Alert should carry the threshold");

        auto state = monitor.alertState("cache_hit_rate", Tempo::AlertSeverity::WARNING);
        assert(state && state->fire_count == 1 && state->suppressed_count == 1 && "State should track the suppression");

        clock.advance(std::chrono::minutes(5));
        monitor.recordCacheMetrics(90, 210, 12, 0, 2.0);
        assert(monitor.runMonitoringCycle().size() == 1 && "Alert should fire again after the cooldown");
        assert(monitor.alertHistory().size() == 2 && "History should keep every fired alert");

        std::cout << "✓ Cache alert cooldown test passed" << std::endl;
    }

    void testMinimumSamplesGate() {
        std::cout << "Testing minimum sample gate for rate alerts..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        monitor.recordCacheMetrics(0, 9, 0, 0, 0.0);
        for (int i = 0; i < 9; ++i) {
            monitor.recordRequest(false, std::chrono::milliseconds(5));
        }
        assert(monitor.runMonitoringCycle().empty() && "Rates below the sample gate should not alert");

        monitor.recordCacheMetrics(0, 10, 0, 0, 0.0);
        monitor.recordRequest(false, std::chrono::milliseconds(5));
        auto alerts = monitor.runMonitoringCycle();

        bool cache_alert = false;
        bool error_alert = false;
        for (const auto& alert : alerts) {
            if (alert.type == Tempo::AlertType::CACHE_HIT_RATE) {
                cache_alert = true;
            }
            if (alert.type == Tempo::AlertType::ERROR_RATE) {
                error_alert = true;
                assert(alert.severity == Tempo::AlertSeverity::CRITICAL && "Error rate alerts are critical");
            }
        }
        assert(cache_alert && error_alert && "Rates at the sample gate should alert");

        std::cout << "✓ Sample gate test passed" << std::endl;
    }

    void testResponseTimeAndConcurrency() {
        std::cout << "Testing response time and concurrency alerts..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::MonitorConfig config = quietConfig();
        config.thresholds.max_response_time = std::chrono::milliseconds(100);
        config.thresholds.max_concurrent_requests = 2;
        Tempo::PerformanceMonitor monitor(registry, config, clock);

        monitor.recordRequest(true, std::chrono::milliseconds(90));
        monitor.recordRequest(true, std::chrono::milliseconds(100));
        assert(monitor.runMonitoringCycle().empty() && "Mean at or below the limit should not alert");

        monitor.recordRequest(true, std::chrono::milliseconds(400));
        for (int i = 0; i < 3; ++i) {
            registry.beginRequest();
        }
        auto alerts = monitor.runMonitoringCycle();
        for (int i = 0; i < 3; ++i) {
            registry.endRequest();
        }

        assert(alerts.size() == 2 && "Both breaches should alert");
        assert(alerts[0].metric == "average_response_time" && "Response time alert should come first");
        assert(alerts[1].metric == "concurrent_requests" && alerts[1].value == 3.0 && "Concurrency alert should report in-flight count");
        assert(alerts[0].id != alerts[1].id && "Alert ids should be unique");

        std::cout << "✓ Response time and concurrency test passed" << std::endl;
    }

    void testSystemResourceAlerts() {
        std::cout << "Testing system resource alerts..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        monitor.recordSystemMetrics(40.0, 50.0, 5, 0, 0.0);
        assert(monitor.runMonitoringCycle().empty() && "Healthy usage should not alert");

        monitor.recordSystemMetrics(95.0, 90.0, 5, 0, 0.0);
        auto alerts = monitor.runMonitoringCycle();
        assert(alerts.size() == 2 && "CPU and memory breaches should alert separately");
        for (const auto& alert : alerts) {
            assert(alert.type == Tempo::AlertType::SYSTEM_RESOURCE && "Both should be system resource alerts");
        }

        auto report = monitor.report();
        assert(report.system && report.system->cpu_usage == 95.0 && "Report should carry the latest sample");
        assert(report.average_cpu_usage == 67.5 && "Report should average the window");
        assert(report.active_alert_states == 2 && "Two alert states should exist");

        std::cout << "✓ System resource alert test passed" << std::endl;
    }

    void testHandlerIsolation() {
        std::cout << "Testing alert handler isolation..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        int delivered = 0;
        monitor.registerAlertHandler("a-broken", [](const Tempo::PerformanceAlert&) {
            throw std::runtime_error("handler failure");
        });
        monitor.registerAlertHandler("b-counter", [&delivered](const Tempo::PerformanceAlert&) {
            delivered++;
        });

        monitor.recordSystemMetrics(99.0, 10.0, 1, 0, 0.0);
        auto alerts = monitor.runMonitoringCycle();
        assert(alerts.size() == 1 && "CPU breach should alert");
        assert(delivered == 1 && "A failing handler should not block the others");

        assert(monitor.removeAlertHandler("a-broken") && "Registered handler should be removable");
        assert(!monitor.removeAlertHandler("a-broken") && "Removing twice should report false");

        bool threw = false;
        try {
            monitor.registerAlertHandler("empty", nullptr);
        } catch (const Tempo::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Empty handler should be rejected");

        std::cout << "✓ Handler isolation test passed" << std::endl;
    }

    void testCollectorsRunEachCycle() {
        std::cout << "Testing metric collectors..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        int calls = 0;
        monitor.registerCollector("cache", [&calls](Tempo::PerformanceMonitor& m) {
            calls++;
            m.recordCacheMetrics(8, 2, 4, 0, 1.0);
        });
        monitor.registerCollector("failing", [](Tempo::PerformanceMonitor&) {
            throw std::runtime_error("collector failure");
        });

        monitor.runMonitoringCycle();
        monitor.runMonitoringCycle();

        assert(calls == 2 && "Collector should run once per cycle despite a failing neighbour");
        auto report = monitor.report();
        assert(report.cache && report.cache->hitRate() == 0.8 && "Collected sample should reach the report");

        std::cout << "✓ Collector test passed" << std::endl;
    }

    void testThresholdValidation() {
        std::cout << "Testing threshold validation..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        Tempo::AlertThresholds bad;
        bad.min_cache_hit_rate = 1.5;
        bool threw = false;
        try {
            monitor.setThresholds(bad);
        } catch (const Tempo::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Out of range hit rate should be rejected");
        assert(monitor.thresholds().min_cache_hit_rate == 0.7 && "Rejected update should keep the old thresholds");

        Tempo::AlertThresholds good;
        good.max_error_rate = 0.1;
        monitor.setThresholds(good);
        assert(monitor.thresholds().max_error_rate == 0.1 && "Valid update should apply");

        std::cout << "✓ Threshold validation test passed" << std::endl;
    }

    void testConcurrentThresholdUpdates() {
        std::cout << "Testing threshold updates during monitoring..." << std::endl;

        Tempo::SystemClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        std::atomic<bool> done{false};
        std::thread updater([&monitor, &done]() {
            for (int i = 0; i < 200; ++i) {
                Tempo::AlertThresholds thresholds;
                thresholds.max_cpu_usage = (i % 2 == 0) ? 50.0 : 90.0;
                monitor.setThresholds(thresholds);
            }
            done = true;
        });

        while (!done) {
            monitor.recordSystemMetrics(70.0, 10.0, 1, 0, 0.0);
            monitor.runMonitoringCycle();
        }
        updater.join();

        double cpu_limit = monitor.thresholds().max_cpu_usage;
        assert((cpu_limit == 50.0 || cpu_limit == 90.0) && "Thresholds should always be a whole snapshot");

        std::cout << "✓ Concurrent threshold update test passed" << std::endl;
    }

    void testBackgroundMonitoring() {
        std::cout << "Testing background monitoring loop..." << std::endl;

        Tempo::SystemClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        std::atomic<int> cycles{0};
        monitor.registerCollector("count", [&cycles](Tempo::PerformanceMonitor&) { cycles++; });

        monitor.startMonitoring(std::chrono::milliseconds(10));
        assert(monitor.isMonitoring() && "Monitor should report running");

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (cycles < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        monitor.stopMonitoring();

        assert(cycles >= 3 && "Loop should keep running cycles");
        assert(!monitor.isMonitoring() && "Monitor should report stopped");

        std::cout << "✓ Background monitoring test passed" << std::endl;
    }

    void testJsonExport() {
        std::cout << "Testing JSON export..." << std::endl;

        Tempo::ManualClock clock;
        Tempo::MetricsRegistry registry(clock);
        Tempo::PerformanceMonitor monitor(registry, quietConfig(), clock);

        auto empty = nlohmann::json::parse(Tempo::PerformanceMonitor::reportToJson(monitor.report()));
        assert(empty["cache"].is_null() && empty["system"].is_null() && "Missing samples should export as null");

        for (int ms = 10; ms <= 100; ms += 10) {
            monitor.recordRequest(true, std::chrono::milliseconds(ms));
        }
        monitor.recordCacheMetrics(3, 1, 2, 0, 4.0);

        auto json = nlohmann::json::parse(Tempo::PerformanceMonitor::reportToJson(monitor.report()));
        assert(json["requests"]["total"] == 10 && "Request totals should export");
        assert(json["latency_ms"]["p50"] == 50.0 && "Percentiles should export");
        assert(json["cache"]["hit_rate"] == 0.75 && "Cache hit rate should export");
        assert(json["thresholds"]["min_cache_hit_rate"] == 0.7 && "Thresholds should export");

        Tempo::PerformanceAlert alert;
        alert.id = "alert-7";
        alert.type = Tempo::AlertType::ERROR_RATE;
        alert.severity = Tempo::AlertSeverity::CRITICAL;
        alert.metric = "error_rate";
        alert.value = 0.2;
        alert.threshold = 0.05;
        auto alert_json = nlohmann::json::parse(Tempo::PerformanceMonitor::alertToJson(alert));
        assert(alert_json["type"] == "error_rate" && alert_json["severity"] == "critical" && "Enum names should export");

        std::cout << "✓ JSON export test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PerformanceMonitor unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testCacheAlertCooldown();
        std::cout << std::endl;

        testMinimumSamplesGate();
        std::cout << std::endl;

        testResponseTimeAndConcurrency();
        std::cout << std::endl;

        testSystemResourceAlerts();
        std::cout << std::endl;

        testHandlerIsolation();
        std::cout << std::endl;

        testCollectorsRunEachCycle();
        std::cout << std::endl;

        testThresholdValidation();
        std::cout << std::endl;

        testConcurrentThresholdUpdates();
        std::cout << std::endl;

        testBackgroundMonitoring();
        std::cout << std::endl;

        testJsonExport();
        std::cout << std::endl;

        std::cout << "All PerformanceMonitor tests passed!" << std::endl;
    }
};

int main() {
    try {
        PerformanceMonitorTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PerformanceMonitor component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
