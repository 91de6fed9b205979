// =================================================================
// tests/HttpGenerationBackendTest.cpp
// =================================================================
// Unit tests for the HTTP generation backend.

#include "Tempo/HttpGenerationBackend.hpp"
#include "Tempo/Errors.hpp"
#include "nlohmann/json.hpp"
#include <iostream>
#include <cassert>

class HttpGenerationBackendTest {
public:
    void testRequestBody() {
        std::cout << "Testing request body..." << std::endl;

        Tempo::BackendConfig config;
        config.model = "llama3:8b";
        Tempo::HttpGenerationBackend backend(config);

        Tempo::GenerationRequest request;
        request.prompt = "Summarize the migration plan";
        request.max_tokens = 256;
        request.temperature = 0.2;

        auto body = nlohmann::json::parse(backend.buildRequestBody(request));
        assert(body["model"] == "llama3:8b" && "Body should name the configured model");
        assert(body["prompt"] == "Summarize the migration plan" && "Body should carry the prompt");
        assert(body["stream"] == false && "Responses should not be streamed");
        assert(body["options"]["num_predict"] == 256 && "max_tokens should map to num_predict");
        assert(body["options"]["temperature"] == 0.2 && "Temperature should pass through");

        std::cout << "✓ Request body test passed" << std::endl;
    }

    void testResponseParsing() {
        std::cout << "Testing response parsing..." << std::endl;

        auto complete = Tempo::HttpGenerationBackend::parseResponseBody(
            R"({"response":"Plan looks sound.","done":true,"done_reason":"stop","eval_count":12,"prompt_eval_count":30})");
        assert(complete.text == "Plan looks sound." && "Text should be extracted");
        assert(complete.tokens_used == 42 && "Prompt and completion tokens should be summed");
        assert(complete.finish_reason == "stop" && "done_reason should be used");

        auto truncated = Tempo::HttpGenerationBackend::parseResponseBody(
            R"({"response":"Plan looks","done":true,"done_reason":"length"})");
        assert(truncated.finish_reason == "length" && "Truncation should be reported");

        auto unfinished = Tempo::HttpGenerationBackend::parseResponseBody(R"({"response":"Plan","done":false})");
        assert(unfinished.finish_reason == "length" && "Unfinished output should not count as complete");

        for (const char* bad : {"not json", R"({"done":true})", R"({"response":42})"}) {
            bool threw = false;
            try {
                Tempo::HttpGenerationBackend::parseResponseBody(bad);
            } catch (const Tempo::BackendError& e) {
                threw = !e.transient();
            }
            assert(threw && "Malformed bodies should raise a permanent backend error");
        }

        std::cout << "✓ Response parsing test passed" << std::endl;
    }

    void testUnreachableServer() {
        std::cout << "Testing unreachable server..." << std::endl;

        Tempo::BackendConfig config;
        config.server_url = "http://127.0.0.1:1";
        config.connect_timeout = std::chrono::milliseconds(500);
        config.read_timeout = std::chrono::milliseconds(500);
        Tempo::HttpGenerationBackend backend(config);

        assert(!backend.isHealthy() && "Closed port should not be healthy");

        Tempo::GenerationRequest request;
        request.prompt = "hello";
        bool transient = false;
        try {
            backend.generate(request);
        } catch (const Tempo::BackendError& e) {
            transient = e.transient();
        }
        assert(transient && "Connection failures should be transient");

        std::cout << "✓ Unreachable server test passed" << std::endl;
    }

    void testConfigValidation() {
        std::cout << "Testing backend configuration validation..." << std::endl;

        Tempo::BackendConfig config;
        config.model = "";
        bool threw = false;
        try {
            Tempo::HttpGenerationBackend backend(config);
        } catch (const Tempo::ConfigurationError&) {
            threw = true;
        }
        assert(threw && "Empty model should be rejected");

        std::cout << "✓ Backend configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running HttpGenerationBackend unit tests..." << std::endl;
        std::cout << "====================================" << std::endl << std::endl;

        testRequestBody();
        std::cout << std::endl;

        testResponseParsing();
        std::cout << std::endl;

        testUnreachableServer();
        std::cout << std::endl;

        testConfigValidation();
        std::cout << std::endl;

        std::cout << "All HttpGenerationBackend tests passed!" << std::endl;
    }
};

int main() {
    try {
        HttpGenerationBackendTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All HttpGenerationBackend component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
