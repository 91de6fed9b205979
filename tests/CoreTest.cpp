// =================================================================
// tests/CoreTest.cpp
// =================================================================
// Unit tests for the command-line application logic.

#include "Tempo/Core.hpp"
#include "Tempo/Errors.hpp"
#include <iostream>
#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

// Backend that is never reached by the scripted optimizer
class IdleBackend : public Tempo::GenerationBackend {
public:
    Tempo::GenerationResult generate(const Tempo::GenerationRequest&) override {
        throw Tempo::BackendError("not expected", false);
    }

    std::string getName() const override {
        return "idle";
    }
};

// Optimizer whose outcome is chosen by the request content
class ScriptedOptimizer : public Tempo::RequestOptimizer {
public:
    explicit ScriptedOptimizer(const Tempo::TempoConfig& config)
        : Tempo::RequestOptimizer(std::make_shared<IdleBackend>(), config) {}

    Tempo::OptimizationResult optimize(const Tempo::OptimizationRequest& request,
                                       const Tempo::CancellationToken&) override {
        if (request.content == "capacity") {
            throw Tempo::OptimizationError(Tempo::ErrorKind::CAPACITY, "full");
        }
        if (request.content == "runtime") {
            throw std::runtime_error("corrupt cache entry");
        }
        if (request.content == "system") {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        Tempo::OptimizationResult result;
        result.content = "ok";
        result.session_id = request.session_id;
        return result;
    }
};

Tempo::OptimizationRequest requestFor(const std::string& content) {
    Tempo::OptimizationRequest request;
    request.session_id = "replay-" + content;
    request.analysis_type = "risk";
    request.content = content;
    request.prompt = content;
    return request;
}

} // namespace

class CoreTest {
public:
    void testReplayCountsEveryFailure() {
        std::cout << "Testing replay failure accounting..." << std::endl;

        ScriptedOptimizer optimizer{Tempo::TempoConfig()};
        std::vector<Tempo::OptimizationRequest> requests = {
            requestFor("fine"), requestFor("capacity"), requestFor("runtime"),
            requestFor("fine"), requestFor("system"), requestFor("capacity"),
        };

        Tempo::ReplaySummary summary = Tempo::Core::replayRequests(optimizer, requests, 3);

        assert(summary.succeeded == 2 && "Successful requests should be counted");
        assert(summary.failures["capacity"] == 2 && "Typed failures should be counted by kind");
        assert(summary.failures["fatal"] == 2 && "Unexpected exceptions should count as fatal");
        assert(summary.failures.size() == 2 && "No other failure kinds should appear");

        std::cout << "✓ Replay failure accounting test passed" << std::endl;
    }

    void testReplayWithMoreThreadsThanRequests() {
        std::cout << "Testing replay thread bounds..." << std::endl;

        ScriptedOptimizer optimizer{Tempo::TempoConfig()};

        auto single = Tempo::Core::replayRequests(optimizer, {requestFor("fine")}, 16);
        assert(single.succeeded == 1 && single.failures.empty() && "One request should run once");

        auto empty = Tempo::Core::replayRequests(optimizer, {}, 4);
        assert(empty.succeeded == 0 && empty.failures.empty() && "Empty replay should do nothing");

        std::cout << "✓ Replay thread bounds test passed" << std::endl;
    }

    void testParseReplayLine() {
        std::cout << "Testing replay line parsing..." << std::endl;

        auto request = Tempo::Core::parseReplayLine(
            R"({"analysis_type":"risk","content":"Acme","required_tags":["aws"],"timeout_ms":2500,"max_tokens":300})", 7);
        assert(request.analysis_type == "risk" && request.content == "Acme" && "Required fields should be read");
        assert(request.prompt == "Acme" && "Prompt should default to the content");
        assert(request.session_id == "replay-7" && "Session should default to the line number");
        assert(request.required_tags.size() == 1 && request.required_tags[0] == "aws" && "Tags should be read");
        assert(request.timeout && request.timeout->count() == 2500 && "Timeout should be read in milliseconds");
        assert(request.max_tokens == 300 && "Token limit should be read");

        const std::vector<std::string> bad_lines = {
            "not json",
            "[1, 2]",
            R"({"content":"missing type"})",
            R"({"analysis_type":"risk","content":42})",
        };
        for (const auto& line : bad_lines) {
            bool threw = false;
            try {
                Tempo::Core::parseReplayLine(line, 3);
            } catch (const std::invalid_argument& e) {
                threw = std::string(e.what()).find("line 3") == 0;
            }
            assert(threw && "Unusable lines should be rejected with their line number");
        }

        std::cout << "✓ Replay line parsing test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Core unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testReplayCountsEveryFailure();
        std::cout << std::endl;

        testReplayWithMoreThreadsThanRequests();
        std::cout << std::endl;

        testParseReplayLine();
        std::cout << std::endl;

        std::cout << "All Core tests passed!" << std::endl;
    }
};

int main() {
    try {
        CoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Core component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
