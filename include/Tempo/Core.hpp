// =================================================================
// include/Tempo/Core.hpp
// =================================================================
// Defines the command-line application orchestrator.

#pragma once

#include "Tempo/CliParser.hpp"
#include "Tempo/Config.hpp"
#include "Tempo/RequestOptimizer.hpp"
#include <map>
#include <string>
#include <vector>

namespace Tempo {

// Outcome counts of a replay run.
struct ReplaySummary {
    size_t succeeded = 0;
    std::map<std::string, size_t> failures; // Keyed by error kind name
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the subcommand named in the parsed commands.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Parses one line of a replay file.
     * @param line JSON object with at least analysis_type and content
     * @param line_number Used in error messages
     * @throws std::invalid_argument when the line is not a usable request
     */
    static OptimizationRequest parseReplayLine(const std::string& line, size_t line_number);

    /**
     * @brief Runs requests through the optimizer from concurrent callers.
     *
     * Every failure is counted, never rethrown. Exceptions other than
     * OptimizationError count as "fatal".
     *
     * @param concurrency Number of caller threads, at least one
     */
    static ReplaySummary replayRequests(RequestOptimizer& optimizer,
                                        const std::vector<OptimizationRequest>& requests,
                                        size_t concurrency);

private:
    // Command Handlers
    int handleValidate();
    int handleGenerate();
    int handleReplay();

    /**
     * @brief Loads the configuration named on the command line.
     * @param required When false a missing file falls back to defaults
     */
    TempoConfig loadConfig(bool required) const;

    const Commands& m_commands;
};

} // namespace Tempo
