// =================================================================
// include/Tempo/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Tempo {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    std::string config_path = "tempo.yml";
    std::string log_level;      // Overrides logging.level when set

    // Options for 'generate'
    std::string session_id = "cli";
    std::string analysis_type;
    std::string content;
    std::string prompt;
    int max_tokens = 1000;
    double temperature = 0.7;

    // Options for 'replay'
    std::string requests_file;
    size_t concurrency = 4;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    const Commands& getCommands() const;

private:
    void setupValidateCommand(CLI::App& app);
    void setupGenerateCommand(CLI::App& app);
    void setupReplayCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Tempo
