// =================================================================
// include/Tempo/HttpGenerationBackend.hpp
// =================================================================
// Generation backend speaking the Ollama /api/generate protocol.

#pragma once

#include "Tempo/GenerationBackend.hpp"
#include <chrono>
#include <string>

namespace Tempo {

/**
 * @brief HTTP backend configuration
 */
struct BackendConfig {
    std::string server_url = "http://localhost:11434";      ///< Base URL of the server
    std::string model = "llama3:latest";                    ///< Model name sent with each request
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)}; ///< TCP connect timeout
    std::chrono::milliseconds read_timeout{std::chrono::minutes(5)};     ///< Upper bound on a response

    /**
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

class HttpGenerationBackend : public GenerationBackend {
public:
    /**
     * @brief Constructs the HTTP client settings
     * @param config Server and timeout settings, validated eagerly
     */
    explicit HttpGenerationBackend(const BackendConfig& config);

    GenerationResult generate(const GenerationRequest& request) override;
    std::string getName() const override;

    /**
     * @brief Check that the server answers its model listing
     * @return True on HTTP 200
     */
    bool isHealthy() const;

    /**
     * @brief Build the JSON body for a request
     */
    std::string buildRequestBody(const GenerationRequest& request) const;

    /**
     * @brief Parse a non-streaming /api/generate response body
     * @throws BackendError when the body is not a valid response
     */
    static GenerationResult parseResponseBody(const std::string& body);

private:
    BackendConfig m_config;
};

} // namespace Tempo
