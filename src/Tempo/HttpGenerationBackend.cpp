// =================================================================
// src/Tempo/HttpGenerationBackend.cpp
// =================================================================
// Implementation for the Ollama-compatible HTTP backend.

#include "Tempo/HttpGenerationBackend.hpp"
#include "Tempo/Errors.hpp"
#include "Tempo/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <algorithm>

namespace Tempo {

void BackendConfig::validate() const {
    if (server_url.empty()) {
        throw ConfigurationError("backend.server_url must not be empty");
    }
    if (model.empty()) {
        throw ConfigurationError("backend.model must not be empty");
    }
    if (connect_timeout.count() <= 0 || read_timeout.count() <= 0) {
        throw ConfigurationError("backend timeouts must be positive");
    }
}

HttpGenerationBackend::HttpGenerationBackend(const BackendConfig& config)
    : m_config(config) {
    m_config.validate();
    Logger::getInstance().info("HttpGenerationBackend", "Configured generation backend",
                               m_config.server_url + " model " + m_config.model);
}

std::string HttpGenerationBackend::getName() const {
    return "ollama:" + m_config.model;
}

std::string HttpGenerationBackend::buildRequestBody(const GenerationRequest& request) const {
    nlohmann::json request_body = {
        {"model", m_config.model},
        {"prompt", request.prompt},
        {"stream", false},
        {"options", {
            {"num_predict", request.max_tokens},
            {"temperature", request.temperature}
        }}
    };
    return request_body.dump();
}

GenerationResult HttpGenerationBackend::parseResponseBody(const std::string& body) {
    try {
        auto json_response = nlohmann::json::parse(body);
        if (!json_response.contains("response") || !json_response["response"].is_string()) {
            throw BackendError("Backend response has no text", false);
        }

        GenerationResult result;
        result.text = json_response["response"].get<std::string>();
        result.tokens_used = json_response.value("eval_count", 0) + json_response.value("prompt_eval_count", 0);

        if (json_response.contains("done_reason") && json_response["done_reason"].is_string()) {
            result.finish_reason = json_response["done_reason"].get<std::string>();
        } else {
            result.finish_reason = json_response.value("done", true) ? "stop" : "length";
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(std::string("Malformed backend response: ") + e.what(), false);
    }
}

GenerationResult HttpGenerationBackend::generate(const GenerationRequest& request) {
    if (request.cancellation.isCancelled()) {
        throw BackendError("Request cancelled before dispatch", false);
    }

    auto read_timeout = m_config.read_timeout;
    if (request.deadline != TimePoint()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(request.deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            throw BackendError("Deadline passed before dispatch", true);
        }
        read_timeout = std::min(read_timeout, remaining);
    }

    httplib::Client client(m_config.server_url.c_str());
    client.set_connection_timeout(m_config.connect_timeout.count() / 1000,
                                  (m_config.connect_timeout.count() % 1000) * 1000);
    client.set_read_timeout(read_timeout.count() / 1000, (read_timeout.count() % 1000) * 1000);

    httplib::Headers headers = {{"Content-Type", "application/json"}};
    auto res = client.Post("/api/generate", headers, buildRequestBody(request), "application/json");

    if (!res) {
        throw BackendError("Failed to reach generation server at " + m_config.server_url +
                           " (" + httplib::to_string(res.error()) + ")", true);
    }

    if (res->status >= 500 || res->status == 429) {
        throw BackendError("Generation server returned status " + std::to_string(res->status) +
                           " - " + res->body, true);
    }
    if (res->status != 200) {
        throw BackendError("Generation server rejected request with status " +
                           std::to_string(res->status) + " - " + res->body, false);
    }

    return parseResponseBody(res->body);
}

bool HttpGenerationBackend::isHealthy() const {
    httplib::Client client(m_config.server_url.c_str());
    client.set_connection_timeout(5, 0);
    client.set_read_timeout(10, 0);

    auto res = client.Get("/api/tags");
    return res && res->status == 200;
}

} // namespace Tempo
