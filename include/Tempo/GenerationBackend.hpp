// =================================================================
// include/Tempo/GenerationBackend.hpp
// =================================================================
// Interface to the external text-generation service.

#pragma once

#include "Tempo/Cancellation.hpp"
#include "Tempo/Clock.hpp"
#include <string>

namespace Tempo {

/**
 * @brief Parameters of one generation call
 */
struct GenerationRequest {
    std::string prompt;                ///< Prompt sent to the backend
    std::string analysis_type;         ///< Analysis type, for backends that route on it
    std::string session_id;            ///< Session issuing the request
    std::string worker_id;             ///< Worker slot the request holds
    int max_tokens = 1000;             ///< Generation length limit
    double temperature = 0.7;          ///< Sampling temperature
    TimePoint deadline;                ///< Steady-clock time after which the result is unwanted
    CancellationToken cancellation;    ///< Cancelled when the caller gives up
};

/**
 * @brief Output of one generation call
 */
struct GenerationResult {
    std::string text;                  ///< Generated text
    int tokens_used = 0;               ///< Tokens consumed
    std::string finish_reason = "stop"; ///< "stop" for a complete answer, "length" when truncated
};

/**
 * @brief Abstract generation backend
 *
 * Implementations block until the backend answers and report failures
 * by throwing BackendError. They should give up once the request's
 * deadline passes or its token is cancelled.
 */
class GenerationBackend {
public:
    virtual ~GenerationBackend() = default;

    /**
     * @brief Generate text for a prompt
     * @param request Prompt and options
     * @return Generated text with token usage and finish reason
     * @throws BackendError on failure
     */
    virtual GenerationResult generate(const GenerationRequest& request) = 0;

    /**
     * @brief Identifier used in logs
     */
    virtual std::string getName() const = 0;
};

} // namespace Tempo
